/**
 * @file local_file.h
 * @brief Local filesystem access for transfer sources and destinations
 *
 * Destination files are written under a unique temporary name and published
 * by rename, so a reader never observes a partially written file under its
 * final name. Every failure carries the errno classification from
 * classify_local_io_error().
 */

#ifndef KCENON_STAGE_TRANSFER_CORE_LOCAL_FILE_H
#define KCENON_STAGE_TRANSFER_CORE_LOCAL_FILE_H

#include <kcenon/stage_transfer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Read a whole file into memory
 */
[[nodiscard]] auto read_local_file(const std::filesystem::path& path)
    -> result<byte_buffer>;

/**
 * @brief Read at most max_bytes from the start of a file
 */
[[nodiscard]] auto read_local_file_head(const std::filesystem::path& path,
                                        std::size_t max_bytes) -> result<byte_buffer>;

/**
 * @brief Size of a regular file in bytes
 */
[[nodiscard]] auto local_file_size(const std::filesystem::path& path)
    -> result<uint64_t>;

/**
 * @brief Write the whole buffer to an open descriptor
 *
 * Retries short writes and EINTR. ENOSPC and EDQUOT map to no_space_left.
 */
[[nodiscard]] auto write_fully(int fd, std::span<const std::byte> data)
    -> result<void>;

/**
 * @brief Writer that publishes a file atomically on commit
 */
class atomic_file_writer {
public:
    /**
     * @brief Open a unique temporary file next to the destination
     */
    [[nodiscard]] static auto open(const std::filesystem::path& destination)
        -> result<atomic_file_writer>;

    ~atomic_file_writer();

    atomic_file_writer(const atomic_file_writer&) = delete;
    auto operator=(const atomic_file_writer&) -> atomic_file_writer& = delete;
    atomic_file_writer(atomic_file_writer&& other) noexcept;
    auto operator=(atomic_file_writer&& other) noexcept -> atomic_file_writer&;

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Flush, close and rename to the destination name
     */
    [[nodiscard]] auto commit() -> result<void>;

    /**
     * @brief Close and remove the temporary file
     */
    void discard() noexcept;

    [[nodiscard]] auto temporary_path() const -> const std::filesystem::path& {
        return temp_path_;
    }

    [[nodiscard]] auto destination() const -> const std::filesystem::path& {
        return destination_;
    }

private:
    atomic_file_writer(std::filesystem::path destination,
                       std::filesystem::path temp_path, int fd);

    std::filesystem::path destination_;
    std::filesystem::path temp_path_;
    int fd_ = -1;
    bool committed_ = false;
};

/**
 * @brief Write a buffer to a file through atomic_file_writer
 */
[[nodiscard]] auto write_local_file_atomically(const std::filesystem::path& destination,
                                               std::span<const std::byte> data)
    -> result<void>;

/**
 * @brief Expand a local glob into the matching regular files, sorted by path
 *
 * A pattern without wildcards matches itself when the file exists. An
 * empty vector means nothing matched.
 */
[[nodiscard]] auto expand_local_pattern(std::string_view pattern)
    -> result<std::vector<std::filesystem::path>>;

/**
 * @brief Build an error for a failed system call from errno
 */
[[nodiscard]] auto make_local_io_error(int errnum, std::string_view operation,
                                       const std::filesystem::path& path) -> error;

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CORE_LOCAL_FILE_H

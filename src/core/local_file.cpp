/**
 * @file local_file.cpp
 * @brief Local filesystem access implementation
 */

#include <kcenon/stage_transfer/core/local_file.h>
#include <kcenon/stage_transfer/core/error_codes.h>
#include <kcenon/stage_transfer/core/logging.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <glob.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kcenon::stage_transfer {

namespace {

std::atomic<uint64_t> temp_counter{0};

auto make_temp_path(const std::filesystem::path& destination) -> std::filesystem::path {
    auto name = destination.filename().string();
    name += ".st_tmp.";
    name += std::to_string(static_cast<long long>(::getpid()));
    name += ".";
    name += std::to_string(temp_counter.fetch_add(1));
    return destination.parent_path() / name;
}

auto has_wildcard(std::string_view pattern) -> bool {
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

}  // namespace

auto make_local_io_error(int errnum, std::string_view operation,
                         const std::filesystem::path& path) -> error {
    std::string message(operation);
    message += " '";
    message += path.string();
    message += "': ";
    message += std::strerror(errnum);
    return error{classify_local_io_error(errnum), std::move(message)};
}

auto read_local_file(const std::filesystem::path& path) -> result<byte_buffer> {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return unexpected{make_local_io_error(errno, "open", path)};
    }

    byte_buffer data;
    struct stat st {};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        data.reserve(static_cast<std::size_t>(st.st_size));
    }

    std::byte block[64 * 1024];
    while (true) {
        const ssize_t n = ::read(fd, block, sizeof(block));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved = errno;
            ::close(fd);
            return unexpected{make_local_io_error(saved, "read", path)};
        }
        if (n == 0) {
            break;
        }
        data.insert(data.end(), block, block + n);
    }

    ::close(fd);
    return data;
}

auto read_local_file_head(const std::filesystem::path& path, std::size_t max_bytes)
    -> result<byte_buffer> {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return unexpected{make_local_io_error(errno, "open", path)};
    }

    byte_buffer head(max_bytes);
    std::size_t filled = 0;
    while (filled < max_bytes) {
        const ssize_t n = ::read(fd, head.data() + filled, max_bytes - filled);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved = errno;
            ::close(fd);
            return unexpected{make_local_io_error(saved, "read", path)};
        }
        if (n == 0) {
            break;
        }
        filled += static_cast<std::size_t>(n);
    }

    ::close(fd);
    head.resize(filled);
    return head;
}

auto local_file_size(const std::filesystem::path& path) -> result<uint64_t> {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return unexpected{make_local_io_error(errno, "stat", path)};
    }
    if (!S_ISREG(st.st_mode)) {
        return unexpected{error{error_code::local_io_error,
            "not a regular file: " + path.string()}};
    }
    return static_cast<uint64_t>(st.st_size);
}

auto write_fully(int fd, std::span<const std::byte> data) -> result<void> {
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved = errno;
            return unexpected{error{classify_local_io_error(saved),
                std::string("write failed: ") + std::strerror(saved)}};
        }
        offset += static_cast<std::size_t>(n);
    }
    return {};
}

// ============================================================================
// atomic_file_writer
// ============================================================================

atomic_file_writer::atomic_file_writer(std::filesystem::path destination,
                                       std::filesystem::path temp_path, int fd)
    : destination_(std::move(destination)), temp_path_(std::move(temp_path)), fd_(fd) {}

atomic_file_writer::~atomic_file_writer() {
    if (!committed_) {
        discard();
    }
}

atomic_file_writer::atomic_file_writer(atomic_file_writer&& other) noexcept
    : destination_(std::move(other.destination_)),
      temp_path_(std::move(other.temp_path_)),
      fd_(other.fd_),
      committed_(other.committed_) {
    other.fd_ = -1;
    other.committed_ = true;
}

auto atomic_file_writer::operator=(atomic_file_writer&& other) noexcept
    -> atomic_file_writer& {
    if (this != &other) {
        if (!committed_) {
            discard();
        }
        destination_ = std::move(other.destination_);
        temp_path_ = std::move(other.temp_path_);
        fd_ = other.fd_;
        committed_ = other.committed_;
        other.fd_ = -1;
        other.committed_ = true;
    }
    return *this;
}

auto atomic_file_writer::open(const std::filesystem::path& destination)
    -> result<atomic_file_writer> {
    auto temp_path = make_temp_path(destination);
    const int fd = ::open(temp_path.c_str(),
                          O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return unexpected{make_local_io_error(errno, "create", temp_path)};
    }
    return atomic_file_writer(destination, std::move(temp_path), fd);
}

auto atomic_file_writer::write(std::span<const std::byte> data) -> result<void> {
    if (fd_ < 0) {
        return unexpected{error{error_code::internal_error, "writer is closed"}};
    }
    auto written = write_fully(fd_, data);
    if (!written) {
        return unexpected{error{written.error().code,
            written.error().message + " ('" + temp_path_.string() + "')"}};
    }
    return {};
}

auto atomic_file_writer::commit() -> result<void> {
    if (fd_ < 0) {
        return unexpected{error{error_code::internal_error, "writer is closed"}};
    }

    if (::fsync(fd_) != 0) {
        const int saved = errno;
        discard();
        return unexpected{make_local_io_error(saved, "fsync", temp_path_)};
    }
    if (::close(fd_) != 0) {
        const int saved = errno;
        fd_ = -1;
        discard();
        return unexpected{make_local_io_error(saved, "close", temp_path_)};
    }
    fd_ = -1;

    if (::rename(temp_path_.c_str(), destination_.c_str()) != 0) {
        const int saved = errno;
        discard();
        return unexpected{make_local_io_error(saved, "rename", destination_)};
    }

    committed_ = true;
    return {};
}

void atomic_file_writer::discard() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!temp_path_.empty()) {
        ::unlink(temp_path_.c_str());
    }
}

auto write_local_file_atomically(const std::filesystem::path& destination,
                                 std::span<const std::byte> data) -> result<void> {
    auto writer = atomic_file_writer::open(destination);
    if (!writer) {
        return unexpected{writer.error()};
    }
    auto written = writer.value().write(data);
    if (!written) {
        ST_LOG_WARN(log_category::agent,
            "Discarding partial file for " + destination.string() + ": " +
            written.error().message);
        return written;
    }
    return writer.value().commit();
}

// ============================================================================
// Pattern expansion
// ============================================================================

auto expand_local_pattern(std::string_view pattern)
    -> result<std::vector<std::filesystem::path>> {
    std::vector<std::filesystem::path> files;
    if (pattern.empty()) {
        return unexpected{error{error_code::invalid_command, "empty local file pattern"}};
    }

    if (!has_wildcard(pattern)) {
        std::error_code ec;
        std::filesystem::path path{std::string(pattern)};
        if (std::filesystem::is_regular_file(path, ec)) {
            files.push_back(std::move(path));
        }
        return files;
    }

    const std::string pattern_text(pattern);
    glob_t matches{};
    const int rc = ::glob(pattern_text.c_str(), GLOB_ERR, nullptr, &matches);
    if (rc == GLOB_NOMATCH) {
        ::globfree(&matches);
        return files;
    }
    if (rc != 0) {
        ::globfree(&matches);
        return unexpected{error{
            rc == GLOB_ABORTED ? error_code::local_permission_denied
                               : error_code::local_io_error,
            "failed to expand local pattern '" + pattern_text + "'"}};
    }

    for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
        std::error_code ec;
        std::filesystem::path path{matches.gl_pathv[i]};
        if (std::filesystem::is_regular_file(path, ec)) {
            files.push_back(std::move(path));
        }
    }
    ::globfree(&matches);

    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace kcenon::stage_transfer

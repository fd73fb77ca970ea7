/**
 * @file cancellation_token.h
 * @brief Cooperative cancellation flag shared by one command's tasks
 */

#ifndef KCENON_STAGE_TRANSFER_CORE_CANCELLATION_TOKEN_H
#define KCENON_STAGE_TRANSFER_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

namespace kcenon::stage_transfer {

/**
 * @brief Cancellation flag checked at retry and part boundaries
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] static auto create() -> std::shared_ptr<cancellation_token> {
        return std::make_shared<cancellation_token>();
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CORE_CANCELLATION_TOKEN_H

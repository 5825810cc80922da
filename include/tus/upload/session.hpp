#pragma once

#include "tus/core/result.hpp"
#include "tus/upload/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace tus::upload {

/**
 * @brief Lifecycle state of one upload run
 *
 * Idle → Creating → Transferring → Completed, with Resuming as the
 * alternate entry into Transferring. Failed is reachable from every
 * non-terminal state. Completed and Failed are absorbing.
 */
class UploadSession {
public:
    UploadSession();

    [[nodiscard]] UploadState state() const noexcept { return state_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == UploadState::Completed || state_ == UploadState::Failed;
    }
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return last_error_; }

    Result<void> transition_to(UploadState next_state);
    Result<void> mark_failed(Error error);

    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept { return started_at_; }
    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(UploadState target) const noexcept;

    UploadState state_ = UploadState::Idle;
    std::optional<Error> last_error_;
    std::chrono::steady_clock::time_point started_at_{};
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace tus::upload

#include "tus/upload/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace tus::upload {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Idle, {UploadState::Creating, UploadState::Resuming}},
        {UploadState::Creating, {UploadState::Transferring}},
        {UploadState::Resuming, {UploadState::Transferring}},
        {UploadState::Transferring, {UploadState::Completed}},
    };

    if (target == UploadState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::Idle: return "Idle";
        case UploadState::Creating: return "Creating";
        case UploadState::Resuming: return "Resuming";
        case UploadState::Transferring: return "Transferring";
        case UploadState::Completed: return "Completed";
        case UploadState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(TransferOutcome::Kind kind) {
    switch (kind) {
        case TransferOutcome::Kind::Accepted: return "Accepted";
        case TransferOutcome::Kind::OffsetMismatch: return "OffsetMismatch";
        case TransferOutcome::Kind::Rejected: return "Rejected";
        case TransferOutcome::Kind::TransportFailure: return "TransportFailure";
    }
    return "Unknown";
}

UploadSession::UploadSession() {
    started_at_ = std::chrono::steady_clock::now();
    last_transition_ = started_at_;
}

Result<void> UploadSession::transition_to(UploadState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(Error(ErrorKind::InvalidState,
            std::string("Illegal upload state transition ") + to_string(state_) +
            " -> " + to_string(next_state)));
    }

    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    return Ok();
}

Result<void> UploadSession::mark_failed(Error error) {
    if (state_ == UploadState::Completed) {
        return Err<void>(Error(ErrorKind::InvalidState, "Completed upload cannot fail"));
    }
    if (state_ != UploadState::Failed) {
        last_error_ = std::move(error);
    }
    return transition_to(UploadState::Failed);
}

bool UploadSession::can_transition(UploadState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace tus::upload

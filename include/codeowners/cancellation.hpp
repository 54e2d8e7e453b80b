#pragma once

#include "codeowners/errors.hpp"

#include <atomic>
#include <memory>

namespace codeowners {

/**
 * CancellationToken
 *
 * Cooperative cancellation shared by the runner and every check. Copies
 * refer to the same state, so cancelling one copy cancels them all.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }

    bool is_cancelled() const { return cancelled_->load(); }

    void throw_if_cancelled() const {
        if (is_cancelled()) throw CancelledError();
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace codeowners

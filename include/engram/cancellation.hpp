#pragma once

#include "engram/error.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace engram {

/**
 * Cooperative cancellation flag shared between a caller and the operations it
 * started. Copies observe the same flag. A default-constructed token can never
 * be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    static CancellationToken create() {
        CancellationToken token;
        token.flag_ = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    void cancel() {
        if (flag_) flag_->store(true);
    }

    bool is_cancelled() const {
        return flag_ && flag_->load();
    }

    // Called before every backend round-trip.
    void check(const std::string& context = "") const {
        if (is_cancelled()) {
            throw OperationCancelledError(context);
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace engram

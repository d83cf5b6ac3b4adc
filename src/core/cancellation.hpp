#pragma once

#include <atomic>
#include <memory>

namespace sparkle {

/**
 * CancellationToken - Shared flag a caller flips to abandon a multi-step
 * operation. A default-constructed token can never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] static CancellationToken create() {
        CancellationToken token;
        token.flag_ = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    void cancel() const {
        if (flag_) flag_->store(true);
    }

    [[nodiscard]] bool is_cancelled() const {
        return flag_ && flag_->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace sparkle

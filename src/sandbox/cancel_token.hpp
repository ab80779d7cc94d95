#pragma once

#include <atomic>
#include <memory>

namespace codeloop::sandbox {

// Shared cancellation flag. Copies observe the same state.
class CancelToken {
public:
    CancelToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { flag_->store(true); }
    bool IsCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace codeloop::sandbox

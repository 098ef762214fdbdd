#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace Egress {
namespace Dispatch {

// Shared between a caller and one or more dispatch calls. Hooks run once,
// under the token's mutex, and must only post work elsewhere.
class CancellationToken {
public:
    class Registration;

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel))
            return;
        for (auto& entry : hooks_)
            entry.second();
        hooks_.clear();
    }

    bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Runs `hook` right away when the token is already cancelled.
    Registration on_cancel(std::function<void()> hook);

private:
    void remove(std::size_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks_.erase(id);
    }

    std::atomic<bool>                            cancelled_{false};
    std::mutex                                   mutex_;
    std::size_t                                  next_id_ = 0;
    std::map<std::size_t, std::function<void()>> hooks_;
};

// Unregisters its hook on destruction. Empty when no token was given.
class CancellationToken::Registration {
public:
    Registration() = default;
    Registration(CancellationToken* token, std::size_t id) : token_(token), id_(id) {
    }

    Registration(Registration&& other) noexcept : token_(other.token_), id_(other.id_) {
        other.token_ = nullptr;
    }

    Registration(const Registration&)            = delete;
    Registration& operator=(const Registration&) = delete;
    Registration& operator=(Registration&&)      = delete;

    ~Registration() {
        if (token_)
            token_->remove(id_);
    }

private:
    CancellationToken* token_ = nullptr;
    std::size_t        id_    = 0;
};

inline CancellationToken::Registration CancellationToken::on_cancel(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled()) {
        hook();
        return {};
    }
    std::size_t id = next_id_++;
    hooks_.emplace(id, std::move(hook));
    return Registration(this, id);
}

// Registers `hook` on `token` when there is one.
inline CancellationToken::Registration on_cancel(const std::shared_ptr<CancellationToken>& token,
                                                 std::function<void()>                     hook) {
    if (!token)
        return {};
    return token->on_cancel(std::move(hook));
}

}  // namespace Dispatch
}  // namespace Egress

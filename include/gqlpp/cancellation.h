#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/cancellation.h — Host-driven request cancellation
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto cancel = std::make_shared<CancellationSource>();
//    request.cancellation = cancel;
//    ...
//    cancel->cancel();   // in-flight fields finish with "Execution aborted"
//
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace gqlpp {

class CancellationSource {
public:
    using Callback = std::function<void()>;

    // Marks the source cancelled and runs every subscribed callback once
    void cancel() {
        std::vector<Callback> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) return;
            cancelled_ = true;
            for (auto& [id, cb] : callbacks_) pending.push_back(std::move(cb));
            callbacks_.clear();
        }
        for (auto& cb : pending) cb();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // Runs cb immediately when already cancelled; returns a handle for unsubscribe()
    std::size_t subscribe(Callback cb) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_) {
                auto id = ++nextId_;
                callbacks_.emplace(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void unsubscribe(std::size_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.erase(id);
    }

private:
    mutable std::mutex mutex_;
    bool cancelled_ = false;
    std::size_t nextId_ = 0;
    std::map<std::size_t, Callback> callbacks_;
};

} // namespace gqlpp

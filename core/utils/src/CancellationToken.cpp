#include "CancellationToken.h"

#include <algorithm>

namespace CodeDrop {

    CancellationToken::CancellationToken()
        : state_(std::make_shared<State>()) {}

    CancellationToken::CancellationToken(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    void CancellationToken::cancel() {
        cancelState(state_);
    }

    bool CancellationToken::isCancelled() const {
        return state_->cancelled.load();
    }

    bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() {
            return state_->cancelled.load();
        });
    }

    CancellationToken CancellationToken::child() const {
        auto childState = std::make_shared<State>();
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled.load()) {
                auto& children = state_->children;
                children.erase(std::remove_if(children.begin(), children.end(),
                                              [](const std::weak_ptr<State>& w) { return w.expired(); }),
                               children.end());
                children.push_back(childState);
                return CancellationToken(childState);
            }
        }
        childState->cancelled.store(true);
        return CancellationToken(childState);
    }

    void CancellationToken::cancelState(const std::shared_ptr<State>& state) {
        std::vector<std::weak_ptr<State>> children;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->cancelled.exchange(true)) {
                return;
            }
            children.swap(state->children);
        }
        state->cv.notify_all();

        for (auto& weak : children) {
            if (auto child = weak.lock()) {
                cancelState(child);
            }
        }
    }

} // namespace CodeDrop

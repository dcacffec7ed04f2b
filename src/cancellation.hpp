#pragma once

#include <atomic>
#include <memory>

// Shared cancel flag. A child token observes its own flag and every
// ancestor's, so cancelling a retrieval cycle reaches each provider query.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() { state_->cancelled.store(true); }

    bool is_cancelled() const {
        for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
            if (s->cancelled.load()) return true;
        }
        return false;
    }

    CancellationToken child() const {
        CancellationToken token;
        token.state_->parent = state_;
        return token;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };

    std::shared_ptr<State> state_;
};

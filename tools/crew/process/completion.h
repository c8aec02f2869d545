#pragma once

#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace crew {

// Single-assignment result slot with continuations.
//
// resolve() succeeds exactly once; later attempts are ignored and return
// false. Continuations attached with then() run in attachment order when the
// slot resolves, or immediately if it already has.
//
// Not thread-safe: owned and resolved on the event loop thread.
template <typename T>
class completion_slot {
public:
    using continuation = std::function<void(const T&)>;

    bool resolve(T value) {
        if (value_) {
            return false;
        }
        value_ = std::move(value);

        // A continuation may attach further continuations; drain until empty
        while (!continuations_.empty()) {
            auto pending = std::move(continuations_);
            continuations_.clear();
            for (auto& cb : pending) {
                cb(*value_);
            }
        }
        return true;
    }

    void then(continuation cb) {
        if (value_) {
            cb(*value_);
            return;
        }
        continuations_.push_back(std::move(cb));
    }

    bool is_ready() const { return value_.has_value(); }

    // Precondition: is_ready()
    const T& value() const { return *value_; }

private:
    std::optional<T> value_;
    std::vector<continuation> continuations_;
};

} // namespace crew

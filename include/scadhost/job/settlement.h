#pragma once

/**
 * Settlement - single-assignment slot for a job's outcome
 *
 * The first settle() wins; later calls are refused and return false. The
 * claim is an atomic exchange, so racing callbacks cannot both settle.
 */

#include <atomic>
#include <utility>

namespace scadhost {
namespace job {

template <typename T>
class Settlement {
public:
    /**
     * Store the outcome if nothing was stored yet.
     * @return true if this call settled the slot
     */
    bool settle(T value) {
        if (claimed_.exchange(true)) {
            return false;
        }
        value_ = std::move(value);
        ready_.store(true);
        return true;
    }

    bool isSettled() const { return ready_.load(); }

    const T& value() const { return value_; }

    /**
     * Move the outcome out. Only meaningful once isSettled().
     */
    T take() { return std::move(value_); }

private:
    std::atomic<bool> claimed_{false};
    std::atomic<bool> ready_{false};
    T value_{};
};

} // namespace job
} // namespace scadhost

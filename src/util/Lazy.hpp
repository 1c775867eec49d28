#pragma once

#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <utility>

namespace gitcontext {

/**
 * @brief A value computed at most once, shared by every requester
 *
 * State machine: Uncomputed -> InProgress(shared_future) -> Done.
 *
 * The first caller of get() runs the computation on its own thread. Callers
 * that arrive while it is in progress receive the same shared_future and
 * block on it; callers after completion get the settled future. The mutex
 * only guards the state switch and is never held while computing.
 *
 * The computation must not request its own Lazy (it would wait on itself).
 * Errors are expected to travel inside T (e.g. Expected<U>); an exception
 * thrown by the computation is stored in the future and rethrown to every
 * waiter.
 */
template <typename T>
class Lazy {
public:
    using Compute = std::function<T()>;

    explicit Lazy(Compute compute) : compute(std::move(compute)) {}

    Lazy(const Lazy&) = delete;
    Lazy& operator=(const Lazy&) = delete;

    std::shared_future<T> get() {
        std::promise<T> promise;
        {
            std::scoped_lock lock(mtx);
            if (state != State::Uncomputed) {
                return future;
            }
            future = promise.get_future().share();
            state = State::InProgress;
        }

        try {
            promise.set_value(compute());
        } catch (...) {
            promise.set_exception(std::current_exception());
        }

        std::scoped_lock lock(mtx);
        state = State::Done;
        return future;
    }

    bool isComputed() const {
        std::scoped_lock lock(mtx);
        return state == State::Done;
    }

private:
    enum class State { Uncomputed, InProgress, Done };

    Compute compute;
    mutable std::mutex mtx;
    State state{State::Uncomputed};
    std::shared_future<T> future;
};

}

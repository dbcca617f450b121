//
// Scheduler.hpp
//

#ifndef GRIDDUEL_SCHEDULER_HPP
#define GRIDDUEL_SCHEDULER_HPP

#include <chrono>
#include <functional>
#include <memory>

namespace gridduel::net
{
    // Cancelling is idempotent. A cancelled task never runs unless it was already running.
    class TimerHandle
    {
    public:
        virtual ~TimerHandle() = default;
        virtual auto Cancel() -> void = 0;
    };

    class Scheduler
    {
    public:
        using Clock = std::chrono::steady_clock;

        virtual ~Scheduler() = default;

        virtual auto Now() const -> Clock::time_point = 0;
        // Runs `task` once after `delay`; dropping the handle cancels it.
        virtual auto Schedule(std::chrono::milliseconds delay, std::function<void()> task)
            -> std::unique_ptr<TimerHandle> = 0;
    };
}

#endif //GRIDDUEL_SCHEDULER_HPP

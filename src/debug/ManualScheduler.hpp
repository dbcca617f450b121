//
// ManualScheduler.hpp
//

#ifndef GRIDDUEL_MANUALSCHEDULER_HPP
#define GRIDDUEL_MANUALSCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "../net/Scheduler.hpp"

namespace gridduel::net::debug
{
    // Virtual clock for tests. Nothing runs until AdvanceBy; tasks then run on the
    // calling thread in deadline order, outside the scheduler lock.
    class ManualScheduler final : public Scheduler
    {
    public:
        auto Now() const -> Clock::time_point override
        {
            std::scoped_lock lock(mx_);
            return now_;
        }

        auto Schedule(std::chrono::milliseconds delay, std::function<void()> task)
            -> std::unique_ptr<TimerHandle> override
        {
            std::scoped_lock lock(mx_);
            auto t = std::make_shared<Task>();
            t->due = now_ + delay;
            t->seq = next_seq_++;
            t->fn = std::move(task);
            tasks_.push_back(t);
            return std::make_unique<Handle>(t);
        }

        // Moves the clock forward, running every task that falls due, including ones
        // scheduled by tasks run along the way. Returns how many ran.
        auto AdvanceBy(std::chrono::milliseconds d) -> std::size_t
        {
            Clock::time_point target;
            {
                std::scoped_lock lock(mx_);
                target = now_ + d;
            }

            std::size_t ran{};
            while (true)
            {
                std::shared_ptr<Task> next;
                {
                    std::scoped_lock lock(mx_);
                    next = PopDueLocked(target);
                    if (!next)
                    {
                        now_ = target;
                        break;
                    }
                    now_ = next->due;
                }
                next->fn();
                ++ran;
            }
            return ran;
        }

        // Non-cancelled tasks still waiting.
        auto Pending() const -> std::size_t
        {
            std::scoped_lock lock(mx_);
            std::size_t n{};
            for (auto const& t : tasks_) n += t->cancelled.load() ? 0 : 1;
            return n;
        }

        auto NextDue() const -> std::optional<Clock::time_point>
        {
            std::scoped_lock lock(mx_);
            std::optional<Clock::time_point> best;
            for (auto const& t : tasks_)
            {
                if (!t->cancelled.load() && (!best || t->due < *best)) best = t->due;
            }
            return best;
        }

        // Runs callbacks whose handle was cancelled, as a real timer may when the
        // completion was already queued. Lets tests replay a lost race.
        auto FireCancelled() -> std::size_t
        {
            std::vector<std::shared_ptr<Task>> stale;
            {
                std::scoped_lock lock(mx_);
                std::erase_if(tasks_, [&](std::shared_ptr<Task> const& t)
                {
                    if (!t->cancelled.load()) return false;
                    stale.push_back(t);
                    return true;
                });
                stale.insert(stale.end(), graveyard_.begin(), graveyard_.end());
                graveyard_.clear();
            }
            for (auto const& t : stale) t->fn();
            return stale.size();
        }

    private:
        struct Task
        {
            Clock::time_point due{};
            std::uint64_t seq{};
            std::function<void()> fn;
            std::atomic<bool> cancelled{false};
        };

        class Handle final : public TimerHandle
        {
        public:
            explicit Handle(std::shared_ptr<Task> t) :
                task_(std::move(t)) {}

            ~Handle() override { Cancel(); }

            auto Cancel() -> void override { task_->cancelled.store(true); }

        private:
            std::shared_ptr<Task> task_;
        };

        // Earliest due task, skipping (and parking) cancelled ones.
        auto PopDueLocked(Clock::time_point target) -> std::shared_ptr<Task>
        {
            while (true)
            {
                auto best = tasks_.end();
                for (auto it = tasks_.begin(); it != tasks_.end(); ++it)
                {
                    if ((*it)->due > target) continue;
                    if (best == tasks_.end() || (*it)->due < (*best)->due ||
                        ((*it)->due == (*best)->due && (*it)->seq < (*best)->seq))
                    {
                        best = it;
                    }
                }
                if (best == tasks_.end()) return nullptr;

                std::shared_ptr<Task> t = *best;
                tasks_.erase(best);
                if (!t->cancelled.load()) return t;
                graveyard_.push_back(std::move(t));
            }
        }

    private:
        mutable std::mutex mx_;
        Clock::time_point now_{};
        std::uint64_t next_seq_{};
        std::vector<std::shared_ptr<Task>> tasks_;
        std::vector<std::shared_ptr<Task>> graveyard_;
    };
}

#endif //GRIDDUEL_MANUALSCHEDULER_HPP

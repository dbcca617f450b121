//
// AsioScheduler.cpp
//

#include "AsioScheduler.hpp"

#include <atomic>
#include <exception>
#include <print>

#include <boost/asio/steady_timer.hpp>

#include "../core/Exception.hpp"

namespace gridduel::net
{
    namespace
    {
        class AsioTimer final : public TimerHandle
        {
        public:
            AsioTimer(std::shared_ptr<boost::asio::steady_timer> timer,
                      std::shared_ptr<std::atomic<bool>> cancelled) :
                timer_(std::move(timer)),
                cancelled_(std::move(cancelled)) {}

            ~AsioTimer() override { Cancel(); }

            auto Cancel() -> void override
            {
                // the flag covers a completion already queued when cancel() runs
                cancelled_->store(true);
                timer_->cancel();
            }

        private:
            std::shared_ptr<boost::asio::steady_timer> timer_;
            std::shared_ptr<std::atomic<bool>> cancelled_;
        };
    }

    AsioScheduler::AsioScheduler(boost::asio::io_context& io) :
        io_(io) {}

    auto AsioScheduler::Now() const -> Clock::time_point
    {
        return Clock::now();
    }

    auto AsioScheduler::Schedule(std::chrono::milliseconds delay, std::function<void()> task)
        -> std::unique_ptr<TimerHandle>
    {
        auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
        auto cancelled = std::make_shared<std::atomic<bool>>(false);

        timer->async_wait([timer, cancelled, task = std::move(task)](boost::system::error_code const& ec)
        {
            if (ec || cancelled->load()) return;
            try
            {
                task();
            }
            catch (core::OmegaException<core::error::Code> const& e)
            {
                std::print("[Scheduler] task failed: {}\n", e);
            }
            catch (std::exception const& e)
            {
                std::print("[Scheduler] task failed: {}\n", e.what());
            }
        });
        return std::make_unique<AsioTimer>(std::move(timer), std::move(cancelled));
    }
}

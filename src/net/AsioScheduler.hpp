//
// AsioScheduler.hpp
//

#ifndef GRIDDUEL_ASIOSCHEDULER_HPP
#define GRIDDUEL_ASIOSCHEDULER_HPP

#include <boost/asio/io_context.hpp>

#include "Scheduler.hpp"

namespace gridduel::net
{
    // Timers on the io_context WebSocket++ runs on; tasks execute on its thread(s).
    class AsioScheduler final : public Scheduler
    {
    public:
        explicit AsioScheduler(boost::asio::io_context& io);

        auto Now() const -> Clock::time_point override;
        auto Schedule(std::chrono::milliseconds delay, std::function<void()> task)
            -> std::unique_ptr<TimerHandle> override;

    private:
        boost::asio::io_context& io_;
    };
}

#endif //GRIDDUEL_ASIOSCHEDULER_HPP

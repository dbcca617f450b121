//
// Connection.hpp
//

#ifndef GRIDDUEL_CONNECTION_HPP
#define GRIDDUEL_CONNECTION_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace gridduel::net
{
    using ConnectionId = std::uint64_t;

    // One live client socket. Send/Close never throw; a dead peer just reports false.
    class Connection
    {
    public:
        virtual ~Connection() = default;

        virtual auto Id() const noexcept -> ConnectionId = 0;
        virtual auto Send(std::string const& text) -> bool = 0;
        virtual auto Close(std::string const& reason) -> void = 0;
    };

    using ConnectionSP = std::shared_ptr<Connection>;
}

#endif //GRIDDUEL_CONNECTION_HPP

//
// GameStore.hpp
//

#ifndef GRIDDUEL_GAMESTORE_HPP
#define GRIDDUEL_GAMESTORE_HPP

#include <cstdint>
#include <expected>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/GameState.hpp"

namespace gridduel::net
{
    // Read/write of whole snapshots by match id.
    class GameStore
    {
    public:
        virtual ~GameStore() = default;

        virtual auto Load(core::MatchId const& id) const -> std::expected<core::GameState, core::error::ActionError> = 0;
        virtual auto Save(core::MatchId const& id, core::GameState const& state)
            -> std::expected<void, core::error::ActionError> = 0;
        // Drops a finished match. False when nothing was stored under `id`.
        virtual auto Erase(core::MatchId const& id) -> bool = 0;
    };

    // Snapshots kept as verified FlatBuffers blobs.
    class InMemoryGameStore : public GameStore
    {
    public:
        auto Load(core::MatchId const& id) const -> std::expected<core::GameState, core::error::ActionError> override;
        auto Save(core::MatchId const& id, core::GameState const& state)
            -> std::expected<void, core::error::ActionError> override;

        auto Erase(core::MatchId const& id) -> bool override;

        auto Size() const -> std::size_t;

    private:
        mutable std::mutex mx_;
        std::unordered_map<core::MatchId, std::vector<std::uint8_t>> blobs_;
    };
}

#endif //GRIDDUEL_GAMESTORE_HPP

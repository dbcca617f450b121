//
// GameStore.cpp
//

#include "GameStore.hpp"

#include <format>
#include <print>

#include "codec.hpp"

namespace gridduel::net
{
    auto InMemoryGameStore::Load(core::MatchId const& id) const
        -> std::expected<core::GameState, core::error::ActionError>
    {
        std::vector<std::uint8_t> blob;
        {
            std::scoped_lock lock(mx_);
            auto const it = blobs_.find(id);
            if (it == blobs_.end())
                return std::unexpected(core::error::ActionError::Missing(std::format("Match {} not found", id)));
            blob = it->second;
        }

        auto decoded = DecodeGameState(blob);
        if (!decoded)
        {
            std::print("[Store] match {} holds an unreadable snapshot: {}\n", id, decoded.error().message);
            return std::unexpected(core::error::ActionError::Storage(decoded.error().message));
        }
        return std::move(*decoded);
    }

    auto InMemoryGameStore::Save(core::MatchId const& id, core::GameState const& state)
        -> std::expected<void, core::error::ActionError>
    {
        flatbuffers::DetachedBuffer const buf = EncodeGameState(state);
        std::vector<std::uint8_t> blob(buf.data(), buf.data() + buf.size());

        std::scoped_lock lock(mx_);
        blobs_.insert_or_assign(id, std::move(blob));
        return {};
    }

    auto InMemoryGameStore::Size() const -> std::size_t
    {
        std::scoped_lock lock(mx_);
        return blobs_.size();
    }

    auto InMemoryGameStore::Erase(core::MatchId const& id) -> bool
    {
        std::scoped_lock lock(mx_);
        return blobs_.erase(id) > 0;
    }
}

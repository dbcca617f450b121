#ifndef GRIDDUEL_CODEC_HPP
#define GRIDDUEL_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/GameState.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/gridduel_store_generated.h"

namespace gridduel::net
{
    struct ParseError
    {
        std::string message;
    };

    auto ToFbStatus(core::GameStatus s) noexcept -> gridduel::gen::store::GameStatus;
    auto FromFbStatus(gridduel::gen::store::GameStatus s) noexcept -> core::GameStatus;

    // Whole snapshot, hydration cache included.
    auto EncodeGameState(core::GameState const& state) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer before touching it.
    auto DecodeGameState(std::span<std::uint8_t const> bytes) -> std::expected<core::GameState, ParseError>;
} // namespace gridduel::net

#endif //GRIDDUEL_CODEC_HPP

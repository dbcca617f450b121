//
// Types.hpp
//

#ifndef GRIDDUEL_TYPES_HPP
#define GRIDDUEL_TYPES_HPP

#ifndef GDL_ENABLE_TEST_HOOKS
#define GDL_ENABLE_TEST_HOOKS true
#endif

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace gridduel::core::constants
{
    inline constexpr std::size_t BoardSize = 4;
    inline constexpr std::size_t CellCount = BoardSize * BoardSize;
    inline constexpr std::uint8_t MaxHandSize = 5;
    inline constexpr std::uint8_t InitialHand = 5;
}

namespace gridduel::core
{
    using PlayerId = std::string;
    using CardInstanceId = std::string;
    using MatchId = std::string;

    // x = column (0 left), y = row (0 top)
    struct Position
    {
        int x{};
        int y{};

        [[nodiscard]]
        constexpr auto InBounds() const noexcept -> bool
        {
            return x >= 0 && y >= 0 &&
                   x < static_cast<int>(constants::BoardSize) &&
                   y < static_cast<int>(constants::BoardSize);
        }

        [[nodiscard]]
        constexpr auto Index() const noexcept -> std::size_t
        {
            return static_cast<std::size_t>(y) * constants::BoardSize + static_cast<std::size_t>(x);
        }

        static constexpr auto FromIndex(std::size_t idx) noexcept -> Position
        {
            return Position{static_cast<int>(idx % constants::BoardSize),
                            static_cast<int>(idx / constants::BoardSize)};
        }

        constexpr auto operator==(Position const&) const -> bool = default;
    };

    enum class Direction : std::uint8_t
    {
        Top = 0,
        Right,
        Bottom,
        Left
    };

    inline constexpr std::array<Direction, 4> AllDirections{
        Direction::Top, Direction::Right, Direction::Bottom, Direction::Left
    };

    constexpr auto Opposite(Direction d) noexcept -> Direction
    {
        return static_cast<Direction>((static_cast<std::uint8_t>(d) + 2) % 4);
    }

    constexpr auto Step(Position p, Direction d) noexcept -> Position
    {
        switch (d)
        {
        case Direction::Top: return {p.x, p.y - 1};
        case Direction::Right: return {p.x + 1, p.y};
        case Direction::Bottom: return {p.x, p.y + 1};
        case Direction::Left: return {p.x - 1, p.y};
        }
        return p;
    }

    // Indexed by Direction
    struct Power
    {
        std::array<int, 4> v{};

        constexpr auto operator[](Direction d) noexcept -> int& { return v[static_cast<std::size_t>(d)]; }
        constexpr auto operator[](Direction d) const noexcept -> int { return v[static_cast<std::size_t>(d)]; }

        [[nodiscard]]
        constexpr auto Sum() const noexcept -> int { return v[0] + v[1] + v[2] + v[3]; }

        static constexpr auto Uniform(int n) noexcept -> Power { return Power{{n, n, n, n}}; }
        static constexpr auto Of(int top, int right, int bottom, int left) noexcept -> Power
        {
            return Power{{top, right, bottom, left}};
        }

        constexpr auto operator+=(Power const& o) noexcept -> Power&
        {
            for (std::size_t i{}; i < v.size(); ++i) v[i] += o.v[i];
            return *this;
        }

        constexpr auto operator==(Power const&) const -> bool = default;
    };

    constexpr auto operator+(Power a, Power const& b) noexcept -> Power
    {
        a += b;
        return a;
    }

    enum class GameStatus : std::uint8_t
    {
        Active = 0,
        Player1Win,
        Player2Win,
        Draw,
        Aborted
    };

    enum class CardState : std::uint8_t
    {
        Normal = 0,
        Buffed,
        Debuffed,
        Immune
    };

    enum class TileStatus : std::uint8_t
    {
        Normal = 0,
        Cursed,
        Blessed
    };

    enum class Rarity : std::uint8_t
    {
        Common = 0,
        Uncommon,
        Rare,
        Epic,
        Legendary
    };

    enum class Difficulty : std::uint8_t
    {
        Easy = 0,
        Medium,
        Hard
    };

    struct Config
    {
        std::uint8_t max_hand_size{constants::MaxHandSize};
        std::uint8_t initial_hand{constants::InitialHand};
        // levels needed per +1 to every side
        std::uint8_t level_step{2};
        std::uint64_t seed{std::random_device{}()};
    };

    auto to_string(GameStatus s) -> std::string_view;
    auto to_string(CardState s) -> std::string_view;
    auto to_string(TileStatus s) -> std::string_view;
    auto to_string(Rarity r) -> std::string_view;
    auto to_string(Direction d) -> std::string_view;
    auto to_string(Difficulty d) -> std::string_view;

    auto ParseRarity(std::string_view s) -> std::optional<Rarity>;
    auto ParseDifficulty(std::string_view s) -> std::optional<Difficulty>;
}

#endif //GRIDDUEL_TYPES_HPP

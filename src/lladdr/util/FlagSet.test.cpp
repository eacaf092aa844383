#include <cstdint>
#include <ostream>

#include <doctest/doctest.h>
#include <util/FlagSet.hpp>

namespace
{
// NOLINTBEGIN(*)
enum class Color : uint8_t
{
    Red,
    Green,
    Blue,
    FlagsCount,
};

auto operator<<(std::ostream& o, Color c) -> std::ostream&
{
    switch (c) {
        case Color::Red:
            return o << "red";
        case Color::Green:
            return o << "green";
        case Color::Blue:
            return o << "blue";
        default:
            return o << "?";
    }
}

using Colors = lladdr::util::FlagSet<Color>;

TEST_SUITE("[util::FlagSet]")
{
    TEST_CASE("empty")
    {
        const Colors colors;
        CHECK(colors.none());
        CHECK_FALSE(colors.any());
        CHECK(colors.count() == 0);
        CHECK(colors.toString() == "None");
        CHECK(colors.flags().empty());
    }

    TEST_CASE("set and reset")
    {
        Colors colors;
        colors.set(Color::Blue);
        colors.set(Color::Red, true);
        colors.set(Color::Green, false);
        CHECK(colors.test(Color::Red));
        CHECK_FALSE(colors.test(Color::Green));
        CHECK(colors.count() == 2);
        CHECK(colors.toU32() == 0b101U);
        colors.set(Color::Red, false);
        CHECK_FALSE(colors.test(Color::Red));
        colors.reset();
        CHECK(colors.none());
    }

    TEST_CASE("toString keeps enumerator order")
    {
        Colors colors;
        colors.set(Color::Blue);
        colors.set(Color::Red);
        CHECK(colors.toString() == "red|blue");
        CHECK(colors.toString(", ") == "red, blue");
        CHECK(colors.flags() == std::vector {Color::Red, Color::Blue});
    }

    TEST_CASE("comparison")
    {
        CHECK(Colors {0b001U} == Colors {0b001U});
        CHECK(Colors {0b001U} < Colors {0b010U});
        CHECK(Colors::size() == 3);
    }
}

// NOLINTEND(*)
}  // namespace

#include <doctest/doctest.h>
#include <eui/Parser.hpp>

namespace
{
// NOLINTBEGIN(*)
using namespace lladdr::eui;

TEST_SUITE("[eui::parse]")
{
    const Eui48Bytes expected48 {0x00, 0x11, 0x22, 0xAA, 0xBB, 0xCC};
    const Eui64Bytes expected64 {0x00, 0x11, 0x22, 0xFF, 0xFE, 0xAA, 0xBB, 0xCC};

    auto bytesOf(std::string_view text) -> Bytes
    {
        const auto parsed = parse(text);
        REQUIRE(parsed.has_value());
        return parsed->bytes;
    }

    auto errorOf(std::string_view text, std::optional<uint32_t> priority = std::nullopt) -> Error
    {
        const auto parsed = parse(text, priority);
        REQUIRE_FALSE(parsed.has_value());
        return parsed.error();
    }

    TEST_CASE("equivalent notations")
    {
        CHECK(bytesOf("00:11:22:aa:bb:cc") == Bytes {expected48});
        CHECK(bytesOf("0011.22aa.bbcc") == Bytes {expected48});
        CHECK(bytesOf("001122aabbcc") == Bytes {expected48});
        CHECK(bytesOf("00-11-22-aa-bb-cc") == Bytes {expected48});
        CHECK(bytesOf("00 11 22 AA BB CC") == Bytes {expected48});
        CHECK(bytesOf("001122:aabbcc") == Bytes {expected48});
        CHECK(bytesOf("001122-AABBCC") == Bytes {expected48});
        CHECK(bytesOf("0011:22aa:bbcc") == Bytes {expected48});
    }

    TEST_CASE("mixed grouping")
    {
        CHECK(bytesOf("0011.22.aa.bb.cc") == Bytes {expected48});
        CHECK(bytesOf("00.11.22.aabbcc") == Bytes {expected48});
    }

    TEST_CASE("single digit octets")
    {
        CHECK(bytesOf("0-11-22-aa-bb-cc") == Bytes {expected48});
        CHECK(bytesOf("1:2:3:4:5:6") == Bytes {Eui48Bytes {1, 2, 3, 4, 5, 6}});
    }

    TEST_CASE("eui-64")
    {
        CHECK(bytesOf("00:11:22:ff:fe:aa:bb:cc") == Bytes {expected64});
        CHECK(bytesOf("001122fffeaabbcc") == Bytes {expected64});
        CHECK(bytesOf("0011.22ff.feaa.bbcc") == Bytes {expected64});
    }

    TEST_CASE("surrounding whitespace")
    {
        CHECK(bytesOf("  00:11:22:aa:bb:cc\t\n") == Bytes {expected48});
    }

    TEST_CASE("bpr prefix")
    {
        CHECK(bytesOf("1,6,00:11:22:aa:bb:cc") == Bytes {expected48});
        CHECK(bytesOf("1,8,00:11:22:ff:fe:aa:bb:cc") == Bytes {expected64});
        // the length is not verified
        CHECK(bytesOf("1,8,00:11:22:aa:bb:cc") == Bytes {expected48});
    }

    TEST_CASE("priority prefix")
    {
        const auto parsed = parse("45#0011.22aa.bbcc");
        REQUIRE(parsed.has_value());
        CHECK(parsed->bytes == Bytes {expected48});
        CHECK(parsed->priority == 45U);

        const auto dashed = parse("60#00-11-22-aa-bb-cc");
        REQUIRE(dashed.has_value());
        CHECK(dashed->priority == 60U);
    }

    TEST_CASE("out of band priority")
    {
        CHECK(parse("0011.22aa.bbcc", 7U)->priority == 7U);
        CHECK(parse("0011.22aa.bbcc")->priority == std::nullopt);
        CHECK(parse("45#0011.22aa.bbcc", 45U)->priority == 45U);
    }

    TEST_CASE("conflicting priority")
    {
        const auto error = errorOf("45#0011.22aa.bbcc", 60U);
        CHECK(error.code() == Errc::ConflictingPriority);
        CHECK(error.message() == "Conflicting priority in '45#0011.22aa.bbcc' and priority argument 60");
    }

    TEST_CASE("empty input")
    {
        const auto error = errorOf("");
        CHECK(error.code() == Errc::EmptyInput);
        CHECK(error.message() == "Please provide a mac address");
    }

    TEST_CASE("blank input")
    {
        const auto error = errorOf("   ");
        CHECK(error.code() == Errc::InvalidFormat);
        CHECK(error.message() == "Invalid MAC format ''");
    }

    TEST_CASE("bad characters")
    {
        const auto error = errorOf("11:22:33:44:xx:55");
        CHECK(error.code() == Errc::InvalidFormat);
        CHECK(error.message() == "Invalid MAC format '11:22:33:44:xx:55'");
        CHECK(errorOf("0011.22aa.bbcg").code() == Errc::InvalidFormat);
    }

    TEST_CASE("too few groups")
    {
        CHECK(errorOf("11:22:33").code() == Errc::InvalidFormat);
        CHECK(errorOf("11:22:33:44:55").code() == Errc::InvalidFormat);
        CHECK(errorOf("0011").code() == Errc::InvalidFormat);
    }

    TEST_CASE("too many groups")
    {
        CHECK(errorOf("11:22:33:44:55:66:77").code() == Errc::InvalidFormat);
        CHECK(errorOf("11:22:33:44:55:66:77:88:99").code() == Errc::InvalidFormat);
    }

    TEST_CASE("no leading zero elision in words")
    {
        const auto error = errorOf("1:22:33");
        CHECK(error.code() == Errc::InvalidFormat);
        CHECK(error.message() == "Invalid MAC format '1:22:33'");
        CHECK(errorOf("11.22aa.bbcc").code() == Errc::InvalidFormat);
        CHECK(errorOf("011.22aa.bbcc").code() == Errc::InvalidFormat);
    }

    TEST_CASE("odd groups longer than a byte")
    {
        CHECK(errorOf("112:33:44:55:66:77").code() == Errc::InvalidFormat);
    }

    TEST_CASE("message quotes the trimmed text")
    {
        CHECK(errorOf("  zz  ").message() == "Invalid MAC format 'zz'");
        CHECK(errorOf(" 45#zz ").message() == "Invalid MAC format '45#zz'");
    }

    TEST_CASE("priority without an address")
    {
        CHECK(errorOf("45#").code() == Errc::InvalidFormat);
    }

    TEST_CASE("priority out of range")
    {
        CHECK(errorOf("99999999999#0011.22aa.bbcc").code() == Errc::InvalidFormat);
    }
}

// NOLINTEND(*)
}  // namespace

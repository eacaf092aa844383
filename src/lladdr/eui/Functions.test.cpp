#include <tuple>

#include <doctest/doctest.h>
#include <eui/Functions.hpp>

namespace
{
// NOLINTBEGIN(*)
using namespace lladdr::eui;

TEST_SUITE("[eui::Functions]")
{
    const auto some = "00:11:22:aa:bb:cc";

    TEST_CASE("predicates")
    {
        CHECK(macIsEui48(some) == true);
        CHECK(macIsEui64(some) == false);
        CHECK(macIsEui64("0011.22ff.feaa.bbcc") == true);
        CHECK(macIsUnicast(some) == true);
        CHECK(macIsMulticast("01:00:5e:00:00:01") == true);
        CHECK(macIsBroadcast("ff:ff:ff:ff:ff:ff") == true);
        CHECK(macIsMulticast("ff:ff:ff:ff:ff:ff") == false);
        CHECK(macIsLocal("02:00:00:00:00:01") == true);
        CHECK(macIsUniversal(some) == true);
        CHECK(macIsVrrp("00-00-5e-00-01-0a") == true);
        CHECK(macIsHsrp("00-00-0c-07-ac-01") == true);
        CHECK(macIsHsrp2("00-00-0c-9f-f0-01") == true);
        CHECK_FALSE(lastError().has_value());
    }

    TEST_CASE("renderers")
    {
        CHECK(macAsBasic("0011.22AA.BBCC") == "001122aabbcc");
        CHECK(macAsBpr(some) == "1,6,00:11:22:aa:bb:cc");
        CHECK(macAsCisco(some) == "0011.22aa.bbcc");
        CHECK(macAsIeee(some) == "00-11-22-aa-bb-cc");
        CHECK(macAsIpv6Suffix(some) == "0211:22ff:feaa:bbcc");
        CHECK(macAsMicrosoft("001122aabbcc") == "00:11:22:aa:bb:cc");
        CHECK(macAsPgsql(some) == "001122:aabbcc");
        CHECK(macAsSingledash(some) == "001122-aabbcc");
        CHECK(macAsSun(some) == "0-11-22-aa-bb-cc");
        CHECK(macAsTokenring(some) == "00-88-44-55-dd-33");
    }

    TEST_CASE("failure populates lastError")
    {
        CHECK_FALSE(macIsEui48("11:22:33").has_value());
        REQUIRE(lastError().has_value());
        CHECK(lastError()->code() == Errc::InvalidFormat);
        CHECK(lastError()->message() == "Invalid MAC format '11:22:33'");

        CHECK_FALSE(macAsCisco("").has_value());
        REQUIRE(lastError().has_value());
        CHECK(lastError()->code() == Errc::EmptyInput);
    }

    TEST_CASE("success clears lastError")
    {
        CHECK_FALSE(macAsBasic("11:22:33:44:xx:55").has_value());
        CHECK(lastError().has_value());
        CHECK(macAsBasic(some).has_value());
        CHECK_FALSE(lastError().has_value());
    }

    TEST_CASE("strict errors throw")
    {
        setStrictErrors(true);
        CHECK_THROWS_WITH_AS(std::ignore = macAsBasic("11:22:33"), "Invalid MAC format '11:22:33'", Exception);
        CHECK_THROWS_AS(std::ignore = macIsEui48(""), Exception);
        CHECK(macIsEui48(some) == true);
        setStrictErrors(false);
    }

    TEST_CASE("same message as construction")
    {
        const auto constructed = Address::fromString("0011.22aa.bbc");
        REQUIRE_FALSE(constructed.has_value());
        CHECK_FALSE(macAsBasic("0011.22aa.bbc").has_value());
        REQUIRE(lastError().has_value());
        CHECK(*lastError() == constructed.error());
    }
}

// NOLINTEND(*)
}  // namespace

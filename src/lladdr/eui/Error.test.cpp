#include <system_error>

#include <doctest/doctest.h>
#include <eui/Error.hpp>
#include <fmt/format.h>

namespace
{
// NOLINTBEGIN(*)
using namespace lladdr::eui;

TEST_SUITE("[eui::Error]")
{
    TEST_CASE("error_code")
    {
        const std::error_code ec = Errc::InvalidFormat;
        CHECK(ec.category() == errorCategory());
        CHECK(std::string {ec.category().name()} == "lladdr");
        CHECK(ec.message() == "invalid format");
        CHECK(ec == make_error_code(Errc::InvalidFormat));
        CHECK(ec != make_error_code(Errc::EmptyInput));
        CHECK(static_cast<bool>(ec));
    }

    TEST_CASE("Error")
    {
        const Error error {Errc::ConflictingPriority, "some message"};
        CHECK(error.code() == Errc::ConflictingPriority);
        CHECK(error.errorCode() == make_error_code(Errc::ConflictingPriority));
        CHECK(error.message() == "some message");
        CHECK(fmt::format("{}", error) == "ConflictingPriority: some message");
    }

    TEST_CASE("Exception")
    {
        const Exception e {Error {Errc::NotDerivedFromEui48, "some message"}};
        CHECK(std::string {e.what()} == "some message");
        CHECK(e.code() == Errc::NotDerivedFromEui48);
        CHECK(e.error().message() == "some message");
    }

    TEST_CASE("Errc")
    {
        CHECK(fmt::format("{}", Errc::EmptyInput) == "EmptyInput");
        CHECK(fmt::format("{}", Errc::WrongArgumentType) == "WrongArgumentType");
        CHECK(make_error_code(Errc::WrongArgumentType).message() == "wrong argument type");
    }

    TEST_CASE("strictErrors defaults to off")
    {
        CHECK_FALSE(strictErrors());
        setStrictErrors(true);
        CHECK(strictErrors());
        setStrictErrors(false);
        CHECK_FALSE(strictErrors());
    }
}

// NOLINTEND(*)
}  // namespace

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <atomic>
#include <ostream>
#include <utility>

#include <eui/Error.hpp>

namespace lladdr::eui
{
namespace
{

std::atomic_bool g_strictErrors {false};

class Category final : public std::error_category
{
  public:
    [[nodiscard]] auto name() const noexcept -> const char* override { return "lladdr"; }

    [[nodiscard]] auto message(int ev) const -> std::string override
    {
        switch (static_cast<Errc>(ev)) {
            case Errc::EmptyInput:
                return "empty input";
            case Errc::InvalidFormat:
                return "invalid format";
            case Errc::ConflictingPriority:
                return "conflicting priority";
            case Errc::NotDerivedFromEui48:
                return "not derived from eui-48";
            case Errc::WrongArgumentType:
                return "wrong argument type";
        }
        return "unknown error";
    }
};

}  // namespace

auto errorCategory() noexcept -> const std::error_category&
{
    static const Category category;
    return category;
}

auto make_error_code(Errc e) noexcept -> std::error_code
{
    return {static_cast<int>(e), errorCategory()};
}

auto operator<<(std::ostream& o, Errc e) -> std::ostream&
{
    switch (e) {
        case Errc::EmptyInput:
            o << "EmptyInput";
            break;
        case Errc::InvalidFormat:
            o << "InvalidFormat";
            break;
        case Errc::ConflictingPriority:
            o << "ConflictingPriority";
            break;
        case Errc::NotDerivedFromEui48:
            o << "NotDerivedFromEui48";
            break;
        case Errc::WrongArgumentType:
            o << "WrongArgumentType";
            break;
        default:
            o << "Unknown";
            break;
    }
    return o;
}

Error::Error(const Errc code, std::string message)
    : m_code {code}
    , m_message {std::move(message)}
{
}

auto operator<<(std::ostream& o, const Error& e) -> std::ostream&
{
    return o << e.code() << ": " << e.message();
}

Exception::Exception(Error error)
    : std::runtime_error {error.message()}
    , m_error {std::move(error)}
{
}

void setStrictErrors(const bool strict) noexcept
{
    g_strictErrors.store(strict);
}

auto strictErrors() noexcept -> bool
{
    return g_strictErrors.load();
}

}  // namespace lladdr::eui

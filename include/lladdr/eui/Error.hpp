// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include <fmt/ostream.h>

namespace lladdr::eui
{

enum class Errc : uint8_t
{
    EmptyInput = 1,
    InvalidFormat,
    ConflictingPriority,
    NotDerivedFromEui48,
    WrongArgumentType,
};
auto operator<<(std::ostream& o, Errc e) -> std::ostream&;

auto errorCategory() noexcept -> const std::error_category&;
auto make_error_code(Errc e) noexcept -> std::error_code;

/**
 * A failure of parsing or converting an address, carrying the kind and the human readable message.
 */
class Error
{
  public:
    Error(Errc code, std::string message);

    [[nodiscard]] auto code() const -> Errc { return m_code; }

    [[nodiscard]] auto errorCode() const -> std::error_code { return make_error_code(m_code); }

    [[nodiscard]] auto message() const -> const std::string& { return m_message; }

    [[nodiscard]] auto operator==(const Error& other) const -> bool = default;

  private:
    Errc m_code;
    std::string m_message;
};

auto operator<<(std::ostream& o, const Error& e) -> std::ostream&;

/**
 * Thrown instead of returning an Error when strict errors are in effect. what() is the message of the error,
 * unchanged.
 */
class Exception : public std::runtime_error
{
  public:
    explicit Exception(Error error);

    [[nodiscard]] auto error() const -> const Error& { return m_error; }

    [[nodiscard]] auto code() const -> Errc { return m_error.code(); }

  private:
    Error m_error;
};

/**
 * Process-wide default for strict errors, used whenever no explicit choice is made per call.
 * Off unless changed.
 */
void setStrictErrors(bool strict) noexcept;
[[nodiscard]] auto strictErrors() noexcept -> bool;

}  // namespace lladdr::eui

template<>
struct std::is_error_code_enum<lladdr::eui::Errc> : std::true_type
{
};

template<>
struct fmt::formatter<lladdr::eui::Errc> : ostream_formatter
{
};

template<>
struct fmt::formatter<lladdr::eui::Error> : ostream_formatter
{
};

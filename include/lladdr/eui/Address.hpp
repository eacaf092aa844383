// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include <eui/Error.hpp>
#include <fmt/ostream.h>
#include <util/FlagSet.hpp>

namespace lladdr::eui
{

constexpr std::size_t EUI48_LEN = 6;
constexpr std::size_t EUI64_LEN = 8;

using Eui48Bytes = std::array<uint8_t, EUI48_LEN>;
using Eui64Bytes = std::array<uint8_t, EUI64_LEN>;
using Bytes = std::variant<Eui48Bytes, Eui64Bytes>;

enum class Property : uint8_t
{
    Eui48,
    Eui64,
    Unicast,
    Multicast,
    Broadcast,
    Local,
    Universal,
    Vrrp,
    Hsrp,
    Hsrp2,
    // NOTE: keep FlagsCount last
    FlagsCount,
};
using Properties = util::FlagSet<Property>;
auto operator<<(std::ostream& o, Property p) -> std::ostream&;

enum class Format : uint8_t
{
    Basic,
    Bpr,
    Cisco,
    Ieee,
    Ipv6Suffix,
    Microsoft,
    Pgsql,
    Singledash,
    Sun,
    Tokenring,
    Oui,
    BridgeId,
};
auto operator<<(std::ostream& o, Format f) -> std::ostream&;
auto formatFromString(std::string_view name) -> std::optional<Format>;

constexpr std::array ALL_FORMATS {
    Format::Basic,
    Format::Bpr,
    Format::Cisco,
    Format::Ieee,
    Format::Ipv6Suffix,
    Format::Microsoft,
    Format::Pgsql,
    Format::Singledash,
    Format::Sun,
    Format::Tokenring,
    Format::Oui,
    Format::BridgeId,
};

struct Options
{
    /// bridge priority, must agree with a "<prio>#" prefix of the text if both are given
    std::optional<uint32_t> priority;
    /// overrides the process-wide strictErrors() default when set
    std::optional<bool> strictErrors;
};

/**
 * An EUI-48 or EUI-64 hardware address in transmission order, with an optional bridge priority.
 *
 * Values are immutable apart from convertToEui48() and convertToEui64(), which must not be called concurrently
 * on the same value.
 */
class Address
{
  public:
    Address();
    explicit Address(const Eui48Bytes& bytes, uint32_t priority = 0);
    explicit Address(const Eui64Bytes& bytes, uint32_t priority = 0);

    /**
     * @brief Parses an address from any of the supported textual notations.
     *
     * Returns the error, or throws it as Exception when strict errors are in effect for this call, see
     * Options::strictErrors.
     */
    static auto fromString(std::string_view text, const Options& options = {}) noexcept(false)
        -> std::expected<Address, Error>;

    /// the text the address was parsed from, empty if built from bytes
    [[nodiscard]] auto original() const -> const std::string&;
    [[nodiscard]] auto priority() const -> uint32_t;
    [[nodiscard]] auto octets() const -> std::span<const uint8_t>;
    [[nodiscard]] auto bytes() const -> const Bytes&;
    [[nodiscard]] auto strict() const -> bool;

    [[nodiscard]] auto isEui48() const -> bool;
    [[nodiscard]] auto isEui64() const -> bool;
    [[nodiscard]] auto isUnicast() const -> bool;
    [[nodiscard]] auto isMulticast() const -> bool;
    [[nodiscard]] auto isBroadcast() const -> bool;
    [[nodiscard]] auto isLocal() const -> bool;
    [[nodiscard]] auto isUniversal() const -> bool;
    [[nodiscard]] auto isVrrp() const -> bool;
    [[nodiscard]] auto isHsrp() const -> bool;
    [[nodiscard]] auto isHsrp2() const -> bool;
    [[nodiscard]] auto properties() const -> Properties;

    [[nodiscard]] auto asBasic() const -> std::string;
    [[nodiscard]] auto asBpr() const -> std::string;
    [[nodiscard]] auto asCisco() const -> std::string;
    [[nodiscard]] auto asIeee() const -> std::string;
    [[nodiscard]] auto asIpv6Suffix() const -> std::string;
    [[nodiscard]] auto asMicrosoft() const -> std::string;
    [[nodiscard]] auto asPgsql() const -> std::string;
    [[nodiscard]] auto asSingledash() const -> std::string;
    [[nodiscard]] auto asSun() const -> std::string;
    [[nodiscard]] auto asTokenring() const -> std::string;
    [[nodiscard]] auto asBridgeId() const -> std::string;
    [[nodiscard]] auto oui() const -> std::string;
    [[nodiscard]] auto render(Format format) const -> std::string;
    [[nodiscard]] auto toString() const -> std::string;

    /**
     * @return the EUI-64 encapsulation of this EUI-48 address, std::nullopt if it already is an EUI-64
     */
    [[nodiscard]] auto toEui64() const -> std::optional<Address>;
    /**
     * @return the EUI-48 address an EUI-64 was derived from (or a copy of an EUI-48)
     */
    [[nodiscard]] auto toEui48() const -> std::expected<Address, Error>;

    /**
     * @brief Replaces this EUI-48 address with its EUI-64 encapsulation.
     * @return false if the address is already an EUI-64, which is left unchanged
     */
    [[nodiscard]] auto convertToEui64() -> bool;
    /**
     * @brief Replaces this EUI-64 address with the EUI-48 address it was derived from.
     *
     * On failure the error is kept in lastError(), or thrown if the address was created with strict errors.
     */
    [[nodiscard]] auto convertToEui48() -> bool;
    [[nodiscard]] auto lastError() const -> const std::optional<Error>&;

    [[nodiscard]] auto operator<=>(const Address& other) const -> std::strong_ordering;
    [[nodiscard]] auto operator==(const Address& other) const -> bool;

  private:
    Bytes m_bytes;
    uint32_t m_priority {};
    std::string m_original;
    bool m_strict {};
    std::optional<Error> m_lastError;
};

auto operator<<(std::ostream& o, const Address& a) -> std::ostream&;

}  // namespace lladdr::eui

template<>
struct fmt::formatter<lladdr::eui::Address> : ostream_formatter
{
};

template<>
struct fmt::formatter<lladdr::eui::Property> : ostream_formatter
{
};

template<>
struct fmt::formatter<lladdr::eui::Format> : ostream_formatter
{
};

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <iterator>
#include <ostream>
#include <utility>
#include <vector>

#include <eui/Address.hpp>
#include <eui/Parser.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <util/BitReverse.hpp>
#include <util/Overloaded.hpp>

namespace lladdr::eui
{
namespace
{

constexpr uint8_t GROUP_BIT = 0x01U;
constexpr uint8_t LOCAL_BIT = 0x02U;
constexpr uint8_t BROADCAST_BYTE = 0xFFU;

// 00-00-5E-00-01-XX
constexpr std::array<uint8_t, 5> VRRP_PREFIX {0x00, 0x00, 0x5E, 0x00, 0x01};
// 00-00-0C-07-AC-XX
constexpr std::array<uint8_t, 5> HSRP_PREFIX {0x00, 0x00, 0x0C, 0x07, 0xAC};
// 00-00-0C-9F-FX-XX
constexpr std::array<uint8_t, 4> HSRP2_PREFIX {0x00, 0x00, 0x0C, 0x9F};
constexpr uint8_t HSRP2_GROUP_HIGH_NIBBLE = 0xF0U;

// EUI-48 is encapsulated as OUI, FF-FE, NIC specific part; FF-FF is accepted when decapsulating
constexpr uint8_t EUI64_FILLER_HIGH = 0xFFU;
constexpr uint8_t EUI64_FILLER_LOW = 0xFEU;
constexpr std::size_t OUI_LEN = 3;
constexpr std::size_t CISCO_GROUP_LEN = 4;

auto expand(const Eui48Bytes& b) -> Eui64Bytes
{
    return {b[0], b[1], b[2], EUI64_FILLER_HIGH, EUI64_FILLER_LOW, b[3], b[4], b[5]};
}

auto isDerivedFromEui48(const Eui64Bytes& b) -> bool
{
    return b[3] == EUI64_FILLER_HIGH && (b[4] == EUI64_FILLER_HIGH || b[4] == EUI64_FILLER_LOW);
}

auto startsWith(std::span<const uint8_t> octets, std::span<const uint8_t> prefix) -> bool
{
    return octets.size() >= prefix.size() && std::ranges::equal(octets.first(prefix.size()), prefix);
}

auto notDerivedFromEui48() -> Error
{
    return Error {Errc::NotDerivedFromEui48, "eui-64 address is not derived from an eui-48 address"};
}

}  // namespace

auto operator<<(std::ostream& o, const Property p) -> std::ostream&
{
    switch (p) {
        case Property::Eui48:
            o << "eui48";
            break;
        case Property::Eui64:
            o << "eui64";
            break;
        case Property::Unicast:
            o << "unicast";
            break;
        case Property::Multicast:
            o << "multicast";
            break;
        case Property::Broadcast:
            o << "broadcast";
            break;
        case Property::Local:
            o << "local";
            break;
        case Property::Universal:
            o << "universal";
            break;
        case Property::Vrrp:
            o << "vrrp";
            break;
        case Property::Hsrp:
            o << "hsrp";
            break;
        case Property::Hsrp2:
            o << "hsrp2";
            break;
        default:
            o << "unknown";
            break;
    }
    return o;
}

auto operator<<(std::ostream& o, const Format f) -> std::ostream&
{
    switch (f) {
        case Format::Basic:
            o << "basic";
            break;
        case Format::Bpr:
            o << "bpr";
            break;
        case Format::Cisco:
            o << "cisco";
            break;
        case Format::Ieee:
            o << "ieee";
            break;
        case Format::Ipv6Suffix:
            o << "ipv6_suffix";
            break;
        case Format::Microsoft:
            o << "microsoft";
            break;
        case Format::Pgsql:
            o << "pgsql";
            break;
        case Format::Singledash:
            o << "singledash";
            break;
        case Format::Sun:
            o << "sun";
            break;
        case Format::Tokenring:
            o << "tokenring";
            break;
        case Format::Oui:
            o << "oui";
            break;
        case Format::BridgeId:
            o << "bridge_id";
            break;
    }
    return o;
}

auto formatFromString(std::string_view name) -> std::optional<Format>
{
    const auto it =
        std::ranges::find_if(ALL_FORMATS, [name](const Format f) { return fmt::format("{}", f) == name; });
    if (it == ALL_FORMATS.end()) {
        return std::nullopt;
    }
    return *it;
}

Address::Address()
    : m_bytes {Eui48Bytes {}}
{
}

Address::Address(const Eui48Bytes& bytes, const uint32_t priority)
    : m_bytes {bytes}
    , m_priority {priority}
{
}

Address::Address(const Eui64Bytes& bytes, const uint32_t priority)
    : m_bytes {bytes}
    , m_priority {priority}
{
}

auto Address::fromString(std::string_view text, const Options& options) -> std::expected<Address, Error>
{
    const auto strict = options.strictErrors.value_or(strictErrors());
    auto parsed = parse(text, options.priority);
    if (!parsed) {
        if (strict) {
            throw Exception {std::move(parsed.error())};
        }
        return std::unexpected(std::move(parsed.error()));
    }

    Address address;
    address.m_bytes = parsed->bytes;
    address.m_priority = parsed->priority.value_or(0);
    address.m_original = std::string {text};
    address.m_strict = strict;
    return address;
}

auto Address::original() const -> const std::string&
{
    return m_original;
}

auto Address::priority() const -> uint32_t
{
    return m_priority;
}

auto Address::octets() const -> std::span<const uint8_t>
{
    return std::visit([](const auto& b) { return std::span<const uint8_t> {b}; }, m_bytes);
}

auto Address::bytes() const -> const Bytes&
{
    return m_bytes;
}

auto Address::strict() const -> bool
{
    return m_strict;
}

auto Address::isEui48() const -> bool
{
    return std::holds_alternative<Eui48Bytes>(m_bytes);
}

auto Address::isEui64() const -> bool
{
    return std::holds_alternative<Eui64Bytes>(m_bytes);
}

auto Address::isUnicast() const -> bool
{
    return (octets()[0] & GROUP_BIT) == 0;
}

auto Address::isMulticast() const -> bool
{
    return (octets()[0] & GROUP_BIT) != 0 && !isBroadcast();
}

auto Address::isBroadcast() const -> bool
{
    return std::ranges::all_of(octets(), [](const uint8_t octet) { return octet == BROADCAST_BYTE; });
}

auto Address::isLocal() const -> bool
{
    return (octets()[0] & LOCAL_BIT) != 0;
}

auto Address::isUniversal() const -> bool
{
    return !isLocal();
}

auto Address::isVrrp() const -> bool
{
    return isEui48() && startsWith(octets(), VRRP_PREFIX);
}

auto Address::isHsrp() const -> bool
{
    return isEui48() && startsWith(octets(), HSRP_PREFIX);
}

auto Address::isHsrp2() const -> bool
{
    return isEui48() && startsWith(octets(), HSRP2_PREFIX)
        && (octets()[4] & HSRP2_GROUP_HIGH_NIBBLE) == HSRP2_GROUP_HIGH_NIBBLE;
}

auto Address::properties() const -> Properties
{
    Properties props;
    props.set(Property::Eui48, isEui48());
    props.set(Property::Eui64, isEui64());
    props.set(Property::Unicast, isUnicast());
    props.set(Property::Multicast, isMulticast());
    props.set(Property::Broadcast, isBroadcast());
    props.set(Property::Local, isLocal());
    props.set(Property::Universal, isUniversal());
    props.set(Property::Vrrp, isVrrp());
    props.set(Property::Hsrp, isHsrp());
    props.set(Property::Hsrp2, isHsrp2());
    return props;
}

auto Address::asBasic() const -> std::string
{
    return fmt::format("{:02x}", fmt::join(octets(), ""));
}

auto Address::asBpr() const -> std::string
{
    return fmt::format("1,{},{:02x}", octets().size(), fmt::join(octets(), ":"));
}

auto Address::asCisco() const -> std::string
{
    const auto basic = asBasic();
    std::string out;
    out.reserve(basic.size() + basic.size() / CISCO_GROUP_LEN);
    for (std::size_t i = 0; i < basic.size(); i += CISCO_GROUP_LEN) {
        if (i != 0) {
            out += '.';
        }
        out += basic.substr(i, CISCO_GROUP_LEN);
    }
    return out;
}

auto Address::asIeee() const -> std::string
{
    return fmt::format("{:02x}", fmt::join(octets(), "-"));
}

auto Address::asIpv6Suffix() const -> std::string
{
    auto suffix = std::visit(util::Overloaded {[](const Eui48Bytes& b) { return expand(b); },
                                               [](const Eui64Bytes& b) { return b; }},
                             m_bytes);
    suffix[0] ^= LOCAL_BIT;
    return fmt::format("{:02x}{:02x}:{:02x}{:02x}:{:02x}{:02x}:{:02x}{:02x}",
                       suffix[0],
                       suffix[1],
                       suffix[2],
                       suffix[3],
                       suffix[4],
                       suffix[5],
                       suffix[6],
                       suffix[7]);
}

auto Address::asMicrosoft() const -> std::string
{
    return fmt::format("{:02x}", fmt::join(octets(), ":"));
}

auto Address::asPgsql() const -> std::string
{
    const auto half = octets().size() / 2;
    return fmt::format(
        "{:02x}:{:02x}", fmt::join(octets().first(half), ""), fmt::join(octets().subspan(half), ""));
}

auto Address::asSingledash() const -> std::string
{
    const auto half = octets().size() / 2;
    return fmt::format(
        "{:02x}-{:02x}", fmt::join(octets().first(half), ""), fmt::join(octets().subspan(half), ""));
}

auto Address::asSun() const -> std::string
{
    return fmt::format("{:x}", fmt::join(octets(), "-"));
}

auto Address::asTokenring() const -> std::string
{
    std::vector<uint8_t> reversed;
    reversed.reserve(octets().size());
    std::ranges::transform(
        octets(), std::back_inserter(reversed), [](const uint8_t octet) { return util::BIT_REVERSE[octet]; });
    return fmt::format("{:02x}", fmt::join(reversed, "-"));
}

auto Address::asBridgeId() const -> std::string
{
    return fmt::format("{}#{}", m_priority, asCisco());
}

auto Address::oui() const -> std::string
{
    return fmt::format("{:02X}", fmt::join(octets().first(OUI_LEN), "-"));
}

auto Address::render(const Format format) const -> std::string
{
    switch (format) {
        case Format::Basic:
            return asBasic();
        case Format::Bpr:
            return asBpr();
        case Format::Cisco:
            return asCisco();
        case Format::Ieee:
            return asIeee();
        case Format::Ipv6Suffix:
            return asIpv6Suffix();
        case Format::Microsoft:
            return asMicrosoft();
        case Format::Pgsql:
            return asPgsql();
        case Format::Singledash:
            return asSingledash();
        case Format::Sun:
            return asSun();
        case Format::Tokenring:
            return asTokenring();
        case Format::Oui:
            return oui();
        case Format::BridgeId:
            return asBridgeId();
    }
    return asMicrosoft();
}

auto Address::toString() const -> std::string
{
    return asMicrosoft();
}

auto Address::toEui64() const -> std::optional<Address>
{
    if (!isEui48()) {
        return std::nullopt;
    }
    auto converted = *this;
    converted.m_bytes = expand(std::get<Eui48Bytes>(m_bytes));
    converted.m_lastError.reset();
    return converted;
}

auto Address::toEui48() const -> std::expected<Address, Error>
{
    auto converted = *this;
    converted.m_lastError.reset();
    if (isEui48()) {
        return converted;
    }
    const auto& b = std::get<Eui64Bytes>(m_bytes);
    if (!isDerivedFromEui48(b)) {
        spdlog::debug("{} is not derived from an eui-48 address", *this);
        return std::unexpected(notDerivedFromEui48());
    }
    converted.m_bytes = Eui48Bytes {b[0], b[1], b[2], b[5], b[6], b[7]};
    return converted;
}

auto Address::convertToEui64() -> bool
{
    auto converted = toEui64();
    if (!converted) {
        return false;
    }
    m_bytes = converted->m_bytes;
    m_lastError.reset();
    return true;
}

auto Address::convertToEui48() -> bool
{
    auto converted = toEui48();
    if (!converted) {
        if (m_strict) {
            throw Exception {std::move(converted.error())};
        }
        m_lastError = std::move(converted.error());
        return false;
    }
    m_bytes = converted->m_bytes;
    m_lastError.reset();
    return true;
}

auto Address::lastError() const -> const std::optional<Error>&
{
    return m_lastError;
}

auto Address::operator<=>(const Address& other) const -> std::strong_ordering
{
    if (auto cmp = m_bytes <=> other.m_bytes; cmp != 0) {
        return cmp;
    }
    return m_priority <=> other.m_priority;
}

auto Address::operator==(const Address& other) const -> bool
{
    return m_bytes == other.m_bytes && m_priority == other.m_priority;
}

auto operator<<(std::ostream& o, const Address& a) -> std::ostream&
{
    return o << a.toString();
}

}  // namespace lladdr::eui

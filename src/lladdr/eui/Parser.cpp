// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <utility>
#include <vector>

#include <eui/Parser.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace lladdr::eui
{
namespace
{

constexpr std::size_t HEX_BYTE_LEN = 2;
constexpr std::size_t WORD_LEN = 4;
constexpr int HEX_BASE = 16;

using Groups = std::vector<std::string_view>;

[[nodiscard]] auto isSpace(const char c) -> bool
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto isDigit(const char c) -> bool
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto isAlnum(const char c) -> bool
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto isHexDigit(const char c) -> bool
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto trim(std::string_view text) -> std::string_view
{
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] auto leadingDigits(std::string_view text) -> std::size_t
{
    return static_cast<std::size_t>(std::distance(text.begin(), std::ranges::find_if_not(text, isDigit)));
}

[[nodiscard]] auto invalidFormat(std::string_view text, std::string_view reason) -> std::unexpected<Error>
{
    spdlog::debug("rejecting '{}': {}", text, reason);
    return std::unexpected(Error {Errc::InvalidFormat, fmt::format("Invalid MAC format '{}'", text)});
}

// bpr notation "1,6,00:11:22:aa:bb:cc", the length is not checked against the octets
[[nodiscard]] auto stripBprPrefix(std::string_view text) -> std::string_view
{
    constexpr std::string_view BPR_LEAD = "1,";
    if (!text.starts_with(BPR_LEAD)) {
        return text;
    }
    const auto rest = text.substr(BPR_LEAD.size());
    const auto digits = leadingDigits(rest);
    if (digits == 0 || digits >= rest.size() || rest[digits] != ',') {
        return text;
    }
    return rest.substr(digits + 1);
}

[[nodiscard]] auto splitGroups(std::string_view text) -> Groups
{
    Groups groups;
    std::size_t start = 0;
    while (start < text.size()) {
        while (start < text.size() && !isAlnum(text[start])) {
            ++start;
        }
        auto end = start;
        while (end < text.size() && isAlnum(text[end])) {
            ++end;
        }
        if (end > start) {
            groups.push_back(text.substr(start, end - start));
        }
        start = end;
    }
    return groups;
}

// aabb.cc.00.11.22 and 11.22.33.aabbcc both become six single byte groups
[[nodiscard]] auto splitEvenGroups(const Groups& groups) -> Groups
{
    Groups out;
    for (const auto group : groups) {
        if (group.size() % HEX_BYTE_LEN != 0) {
            out.push_back(group);
            continue;
        }
        for (std::size_t i = 0; i < group.size(); i += HEX_BYTE_LEN) {
            out.push_back(group.substr(i, HEX_BYTE_LEN));
        }
    }
    return out;
}

[[nodiscard]] auto hexByte(std::string_view digits) -> std::optional<uint8_t>
{
    if (digits.empty() || digits.size() > HEX_BYTE_LEN) {
        return std::nullopt;
    }
    uint8_t value {};
    const auto* const last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), last, value, HEX_BASE);
    if (ec != std::errc {} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

template<std::size_t N>
[[nodiscard]] auto toArray(const std::vector<uint8_t>& octets) -> std::array<uint8_t, N>
{
    std::array<uint8_t, N> arr {};
    std::copy_n(octets.begin(), N, arr.begin());
    return arr;
}

[[nodiscard]] auto resolve(const Groups& groups, std::string_view text) -> std::expected<Bytes, Error>
{
    std::vector<uint8_t> octets;
    octets.reserve(EUI64_LEN);

    // a single 12 or 16 digit blob was already split into 6 or 8 byte groups by splitEvenGroups()
    if (groups.size() == EUI48_LEN || groups.size() == EUI64_LEN) {
        spdlog::trace("'{}' has {} byte groups", text, groups.size());
        for (const auto group : groups) {
            const auto byte = hexByte(group);
            if (!byte) {
                return invalidFormat(text, fmt::format("group '{}' is not a single byte", group));
            }
            octets.push_back(*byte);
        }
    } else if (groups.size() == EUI48_LEN / 2 || groups.size() == EUI64_LEN / 2) {
        spdlog::trace("'{}' has {} word groups", text, groups.size());
        // leading zeroes must not be dropped, otherwise truncated addresses would go unnoticed
        for (const auto group : groups) {
            if (group.size() != WORD_LEN) {
                return invalidFormat(text, fmt::format("group '{}' is not a 4 digit word", group));
            }
            const auto high = hexByte(group.substr(0, HEX_BYTE_LEN));
            const auto low = hexByte(group.substr(HEX_BYTE_LEN));
            if (!high || !low) {
                return invalidFormat(text, fmt::format("group '{}' is not a 4 digit word", group));
            }
            octets.push_back(*high);
            octets.push_back(*low);
        }
    } else {
        return invalidFormat(text, fmt::format("unexpected number of groups {}", groups.size()));
    }

    if (octets.size() == EUI48_LEN) {
        return Bytes {toArray<EUI48_LEN>(octets)};
    }
    if (octets.size() == EUI64_LEN) {
        return Bytes {toArray<EUI64_LEN>(octets)};
    }
    return invalidFormat(text, fmt::format("unexpected number of octets {}", octets.size()));
}

}  // namespace

auto parse(std::string_view text, std::optional<uint32_t> priority) -> std::expected<Parsed, Error>
{
    if (text.empty()) {
        spdlog::debug("rejecting empty address");
        return std::unexpected(Error {Errc::EmptyInput, "Please provide a mac address"});
    }

    const auto trimmed = trim(text);
    auto rest = trimmed;

    std::optional<uint32_t> prefixPriority;
    if (const auto digits = leadingDigits(rest); digits > 0 && digits + 1 < rest.size() && rest[digits] == '#') {
        uint32_t value {};
        const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + digits, value);
        if (ec != std::errc {}) {
            return invalidFormat(trimmed, "priority is out of range");
        }
        if (priority && *priority != value) {
            spdlog::debug("rejecting '{}': priority {} conflicts with {}", text, value, *priority);
            return std::unexpected(
                Error {Errc::ConflictingPriority,
                       fmt::format("Conflicting priority in '{}' and priority argument {}", text, *priority)});
        }
        prefixPriority = value;
        rest.remove_prefix(digits + 1);
    }

    const auto groups = splitGroups(stripBprPrefix(rest));
    const auto notHex = std::ranges::find_if_not(groups,
                                                 [](const std::string_view group)
                                                 { return std::ranges::all_of(group, isHexDigit); });
    if (notHex != groups.end()) {
        return invalidFormat(trimmed, fmt::format("'{}' is not hexadecimal", *notHex));
    }

    auto bytes = resolve(splitEvenGroups(groups), trimmed);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }
    return Parsed {.bytes = *bytes, .priority = prefixPriority ? prefixPriority : priority};
}

}  // namespace lladdr::eui

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

#include <eui/Address.hpp>
#include <eui/Error.hpp>

namespace lladdr::eui
{

struct Parsed
{
    Bytes bytes;
    /// the priority of a "<prio>#" prefix, or the out-of-band one if there was no prefix
    std::optional<uint32_t> priority;
};

/**
 * @brief Turns a loosely formatted address into its octets.
 *
 * Accepted are, with any non-alphanumeric delimiters and in any case:
 *  - one hex blob of 12 or 16 digits: 001122aabbcc
 *  - 6 or 8 bytes: 00:11:22:aa:bb:cc, 0-11-22-aa-bb-cc
 *  - 3 or 4 words of exactly 4 digits: 0011.22aa.bbcc
 *  - mixtures of even length groups: aabb.cc.00.11.22
 * optionally prefixed by a bridge priority "45#" and/or the bpr length prefix "1,6,".
 *
 * @param priority out-of-band priority, conflicts with a differing "<prio>#" prefix
 */
[[nodiscard]] auto parse(std::string_view text, std::optional<uint32_t> priority = std::nullopt)
    -> std::expected<Parsed, Error>;

}  // namespace lladdr::eui

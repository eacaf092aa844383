// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace lladdr::util
{
namespace detail
{
constexpr auto reverseBits(uint8_t byte) -> uint8_t
{
    uint8_t out = 0;
    for (auto bit = 0; bit < 8; ++bit) {
        out = static_cast<uint8_t>((out << 1U) | ((byte >> bit) & 1U));
    }
    return out;
}

constexpr auto makeBitReverseTable() -> std::array<uint8_t, 256>
{
    std::array<uint8_t, 256> table {};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = reverseBits(static_cast<uint8_t>(i));
    }
    return table;
}
}  // namespace detail

/**
 * Maps every byte to the byte with its bit order reversed (0x01 -> 0x80, 0x4d -> 0xb2), built at compile time.
 */
inline constexpr std::array<uint8_t, 256> BIT_REVERSE = detail::makeBitReverseTable();

static_assert(BIT_REVERSE[0x00] == 0x00);
static_assert(BIT_REVERSE[0x01] == 0x80);
static_assert(BIT_REVERSE[0x10] == 0x08);
static_assert(BIT_REVERSE[0x4d] == 0xb2);
static_assert(BIT_REVERSE[0xff] == 0xff);

}  // namespace lladdr::util

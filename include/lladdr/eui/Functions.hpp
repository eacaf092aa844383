// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <eui/Address.hpp>
#include <eui/Error.hpp>

/**
 * Stateless variants of the Address predicates and renderers, taking the address as text.
 *
 * Each call parses its argument. A parse failure is thrown as Exception if strictErrors() is set, otherwise it is
 * kept in the calling thread's lastError() and std::nullopt is returned. Every call clears lastError() first.
 * Overloads taking an Address are deleted, use the member functions instead.
 */
namespace lladdr::eui
{

[[nodiscard]] auto lastError() -> const std::optional<Error>&;

auto macIsEui48(std::string_view mac) -> std::optional<bool>;
auto macIsEui64(std::string_view mac) -> std::optional<bool>;
auto macIsUnicast(std::string_view mac) -> std::optional<bool>;
auto macIsMulticast(std::string_view mac) -> std::optional<bool>;
auto macIsBroadcast(std::string_view mac) -> std::optional<bool>;
auto macIsLocal(std::string_view mac) -> std::optional<bool>;
auto macIsUniversal(std::string_view mac) -> std::optional<bool>;
auto macIsVrrp(std::string_view mac) -> std::optional<bool>;
auto macIsHsrp(std::string_view mac) -> std::optional<bool>;
auto macIsHsrp2(std::string_view mac) -> std::optional<bool>;

auto macAsBasic(std::string_view mac) -> std::optional<std::string>;
auto macAsBpr(std::string_view mac) -> std::optional<std::string>;
auto macAsCisco(std::string_view mac) -> std::optional<std::string>;
auto macAsIeee(std::string_view mac) -> std::optional<std::string>;
auto macAsIpv6Suffix(std::string_view mac) -> std::optional<std::string>;
auto macAsMicrosoft(std::string_view mac) -> std::optional<std::string>;
auto macAsPgsql(std::string_view mac) -> std::optional<std::string>;
auto macAsSingledash(std::string_view mac) -> std::optional<std::string>;
auto macAsSun(std::string_view mac) -> std::optional<std::string>;
auto macAsTokenring(std::string_view mac) -> std::optional<std::string>;

auto macIsEui48(const Address&) -> std::optional<bool> = delete;
auto macIsEui64(const Address&) -> std::optional<bool> = delete;
auto macIsUnicast(const Address&) -> std::optional<bool> = delete;
auto macIsMulticast(const Address&) -> std::optional<bool> = delete;
auto macIsBroadcast(const Address&) -> std::optional<bool> = delete;
auto macIsLocal(const Address&) -> std::optional<bool> = delete;
auto macIsUniversal(const Address&) -> std::optional<bool> = delete;
auto macIsVrrp(const Address&) -> std::optional<bool> = delete;
auto macIsHsrp(const Address&) -> std::optional<bool> = delete;
auto macIsHsrp2(const Address&) -> std::optional<bool> = delete;

auto macAsBasic(const Address&) -> std::optional<std::string> = delete;
auto macAsBpr(const Address&) -> std::optional<std::string> = delete;
auto macAsCisco(const Address&) -> std::optional<std::string> = delete;
auto macAsIeee(const Address&) -> std::optional<std::string> = delete;
auto macAsIpv6Suffix(const Address&) -> std::optional<std::string> = delete;
auto macAsMicrosoft(const Address&) -> std::optional<std::string> = delete;
auto macAsPgsql(const Address&) -> std::optional<std::string> = delete;
auto macAsSingledash(const Address&) -> std::optional<std::string> = delete;
auto macAsSun(const Address&) -> std::optional<std::string> = delete;
auto macAsTokenring(const Address&) -> std::optional<std::string> = delete;

}  // namespace lladdr::eui

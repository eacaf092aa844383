// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <functional>
#include <type_traits>
#include <utility>

#include <eui/Functions.hpp>

namespace lladdr::eui
{
namespace
{

thread_local std::optional<Error> t_lastError;

template<typename Op>
auto withAddress(std::string_view mac, Op op) -> std::optional<std::invoke_result_t<Op, const Address&>>
{
    t_lastError.reset();
    auto address = Address::fromString(mac);
    if (!address) {
        t_lastError = std::move(address.error());
        return std::nullopt;
    }
    return std::invoke(op, *address);
}

}  // namespace

auto lastError() -> const std::optional<Error>&
{
    return t_lastError;
}

auto macIsEui48(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isEui48);
}

auto macIsEui64(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isEui64);
}

auto macIsUnicast(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isUnicast);
}

auto macIsMulticast(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isMulticast);
}

auto macIsBroadcast(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isBroadcast);
}

auto macIsLocal(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isLocal);
}

auto macIsUniversal(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isUniversal);
}

auto macIsVrrp(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isVrrp);
}

auto macIsHsrp(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isHsrp);
}

auto macIsHsrp2(std::string_view mac) -> std::optional<bool>
{
    return withAddress(mac, &Address::isHsrp2);
}

auto macAsBasic(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asBasic);
}

auto macAsBpr(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asBpr);
}

auto macAsCisco(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asCisco);
}

auto macAsIeee(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asIeee);
}

auto macAsIpv6Suffix(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asIpv6Suffix);
}

auto macAsMicrosoft(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asMicrosoft);
}

auto macAsPgsql(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asPgsql);
}

auto macAsSingledash(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asSingledash);
}

auto macAsSun(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asSun);
}

auto macAsTokenring(std::string_view mac) -> std::optional<std::string>
{
    return withAddress(mac, &Address::asTokenring);
}

}  // namespace lladdr::eui

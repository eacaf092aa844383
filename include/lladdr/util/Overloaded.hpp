// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

namespace lladdr::util
{
// helper type for std::visit over the eui-48 and eui-64 alternatives
template<typename... T>
struct Overloaded : T...
{
    using T::operator()...;
};

template<class... T>
Overloaded(T...) -> Overloaded<T...>;
}  // namespace lladdr::util

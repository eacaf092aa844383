// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <spdlog/spdlog.h>

auto main(const int argc, char** argv) -> int
{
    doctest::Context context;

    context.applyCommandLine(argc, argv);

    // exercise the rejection and resolution logging of the parser
    spdlog::set_level(spdlog::level::trace);

    return context.run();
}

// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include <eui/Address.hpp>
#include <eui/Error.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

DEFINE_string(format, "all", "Output format: all, basic, bpr, cisco, ieee, ipv6_suffix, microsoft, pgsql, "
                             "singledash, sun, tokenring, oui, bridge_id");
DEFINE_validator(format,
                 [](const char* /*flagname*/, const std::string& value) -> bool
                 { return value == "all" || lladdr::eui::formatFromString(value).has_value(); });

DEFINE_uint32(priority, 0, "Bridge priority, must match a <priority># prefix of the address if both are given");

DEFINE_bool(strict_errors, false, "Abort on the first address that cannot be parsed");

DEFINE_bool(properties, false, "Print the properties of each address");

DEFINE_string(log_level, "warn", "Set log level: trace, debug, info, warn, err, critical, off");

// NOLINTNEXTLINE(google-build-*)
using namespace lladdr::eui;

namespace
{
void print(const Address& address)
{
    if (FLAGS_format == "all") {
        fmt::print("{}:\n", address.original());
        for (const auto format : ALL_FORMATS) {
            fmt::print("  {:<12} {}\n", fmt::format("{}", format), address.render(format));
        }
    } else {
        // validated by DEFINE_validator
        fmt::print("{}\n", address.render(formatFromString(FLAGS_format).value_or(Format::Microsoft)));
    }
    if (FLAGS_properties) {
        fmt::print("  {:<12} {}\n", "properties", address.properties().toString(", "));
    }
}
}  // namespace

/**
 * @brief Normalizes the addresses given as arguments into the requested format.
 *
 * @return EXIT_FAILURE if any of the addresses could not be parsed.
 */
auto main(int argc, char* argv[]) -> int
{
    gflags::SetUsageMessage("<flags> <address>...\n");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    std::ranges::transform(FLAGS_log_level, FLAGS_log_level.begin(), ::tolower);
    if (const auto level = spdlog::level::from_str(FLAGS_log_level);
        level == spdlog::level::off && FLAGS_log_level != "off")
    {
        SPDLOG_ERROR("invalid log level '{}', using 'info' instead", FLAGS_log_level);
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(level);
    }

    if (argc < 2) {
        gflags::ShowUsageWithFlagsRestrict(argv[0], "main");
        return EXIT_FAILURE;
    }

    Options options;
    options.strictErrors = FLAGS_strict_errors;
    if (!gflags::GetCommandLineFlagInfoOrDie("priority").is_default) {
        options.priority = FLAGS_priority;
    }

    auto result = EXIT_SUCCESS;
    try {
        for (int i = 1; i < argc; ++i) {
            const auto address = Address::fromString(argv[i], options);
            if (!address) {
                spdlog::error("{}", address.error().message());
                result = EXIT_FAILURE;
                continue;
            }
            spdlog::debug("{} parsed as {}", argv[i], *address);
            print(*address);
        }
    } catch (const Exception& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
    gflags::ShutDownCommandLineFlags();
    return result;
}

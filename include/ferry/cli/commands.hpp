// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ferry::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_file;
    std::uint32_t segments{0};               // 0: keep the configured value
    std::optional<std::uint64_t> max_size;
    bool skip_existing{false};
    bool info_only{false};
    bool worker{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors;         // unusable options, reported by main
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Defaults, then the config file, then command line overrides
[[nodiscard]] std::expected<core::Settings, std::error_code>
resolve_settings(const CliArgs& args) noexcept;

// Download every URL through one queue and downloader; 0 when all succeed
[[nodiscard]] CliResult download(const CliArgs& args, const core::Settings& settings) noexcept;

// Probe a URL without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::Settings& settings) noexcept;

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace ferry::cli

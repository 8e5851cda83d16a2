// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string command;                  // get, list, retry, cancel, delete, ...
    std::vector<std::string> operands;
    std::string config_file;
    std::string directory;
    std::string output_file;
    std::string title;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Execute the parsed command; the value is the process exit code
[[nodiscard]] CliResult run(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli

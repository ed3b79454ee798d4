#pragma once
#include "shellpipe/configuration/channel_config.hpp"
#include "shellpipe/core/failures.hpp"
#include "shellpipe/core/result.hpp"
#include <string>
#include <string_view>
#include <vector>
namespace shellpipe::app {

struct ParsedOptions {
    channel::configuration::ChannelConfig config;
    bool show_help = false;
};

/**
 * Parses the command line into a validated configuration.
 *
 * Values are given as `--name value` or `--name=value`. An unknown option,
 * a missing value or a configuration that fails Validate() is reported as
 * InvalidInput.
 */
[[nodiscard]] channel::Result<ParsedOptions, channel::ChannelFailure> ParseOptions(
    const std::vector<std::string>& args);

[[nodiscard]] std::string Usage(std::string_view program);
}

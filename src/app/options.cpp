#include "options.hpp"
#include "shellpipe/core/format.hpp"
#include <charconv>
#include <optional>
namespace shellpipe::app {
using channel::ChannelFailure;
using channel::Result;

namespace {
    struct OptionToken {
        std::string name;
        std::optional<std::string> inline_value;
    };

    OptionToken SplitToken(const std::string& token) {
        if (token.rfind("--", 0) == 0) {
            const size_t equals = token.find('=');
            if (equals != std::string::npos) {
                return {token.substr(0, equals), token.substr(equals + 1)};
            }
        }
        return {token, std::nullopt};
    }

    std::optional<uint16_t> ParsePort(std::string_view text) {
        unsigned value = 0;
        const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (error != std::errc{} || end != text.data() + text.size() || value > UINT16_MAX) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(value);
    }
}

Result<ParsedOptions, ChannelFailure> ParseOptions(const std::vector<std::string>& args) {
    using ParseResult = Result<ParsedOptions, ChannelFailure>;
    ParsedOptions parsed;
    bool client = false;
    std::optional<std::string> remote_host;
    auto& config = parsed.config;

    for (size_t i = 0; i < args.size(); ++i) {
        OptionToken token = SplitToken(args[i]);
        const std::string& name = token.name;
        std::optional<std::string>& inline_value = token.inline_value;
        auto take_value = [&](std::string& out) -> bool {
            if (inline_value.has_value()) {
                out = std::move(*inline_value);
                return true;
            }
            if (i + 1 >= args.size()) {
                return false;
            }
            out = args[++i];
            return true;
        };
        const auto missing_value = [&name]() {
            return ParseResult::Err(ChannelFailure::InvalidInput(
                compat::format("Option {} requires a value", name)));
        };

        std::string value;
        if (name == "-h" || name == "--help") {
            parsed.show_help = true;
        } else if (name == "-c" || name == "--client") {
            client = true;
        } else if (name == "--once") {
            config.max_sessions = 1;
        } else if (name == "-p" || name == "--passphrase") {
            if (!take_value(value)) {
                return missing_value();
            }
            config.passphrase = std::move(value);
        } else if (name == "-n" || name == "--name") {
            if (!take_value(value)) {
                return missing_value();
            }
            remote_host = std::move(value);
        } else if (name == "--port") {
            if (!take_value(value)) {
                return missing_value();
            }
            const auto port = ParsePort(value);
            if (!port.has_value()) {
                return ParseResult::Err(ChannelFailure::InvalidInput(
                    compat::format("Invalid port '{}'", value)));
            }
            config.port = *port;
        } else if (name == "--bind") {
            if (!take_value(value)) {
                return missing_value();
            }
            config.bind_address = std::move(value);
        } else if (name == "--shell") {
            if (!take_value(value)) {
                return missing_value();
            }
            config.shell_path = std::move(value);
        } else if (name == "--shell-arg") {
            if (!take_value(value)) {
                return missing_value();
            }
            config.shell_args.push_back(std::move(value));
        } else if (name == "--username") {
            if (!take_value(value)) {
                return missing_value();
            }
            config.identity.username = std::move(value);
        } else if (name == "--password") {
            if (!take_value(value)) {
                return missing_value();
            }
            config.identity.password = std::move(value);
        } else if (name == "--domain") {
            if (!take_value(value)) {
                return missing_value();
            }
            config.identity.domain = std::move(value);
        } else {
            return ParseResult::Err(ChannelFailure::InvalidInput(
                compat::format("Unknown option '{}'", args[i])));
        }
    }

    if (parsed.show_help) {
        return ParseResult::Ok(std::move(parsed));
    }
    if (client) {
        config.role = channel::configuration::ChannelRole::Client;
        if (remote_host.has_value()) {
            config.remote_host = std::move(*remote_host);
        }
    } else if (remote_host.has_value()) {
        return ParseResult::Err(ChannelFailure::InvalidInput(
            "Option --name applies to client mode only"));
    }
    auto valid = config.Validate();
    SPP_TRY(valid);
    return ParseResult::Ok(std::move(parsed));
}

std::string Usage(std::string_view program) {
    return compat::format(
        "Usage: {} [options]\n"
        "\n"
        "Runs as a server by default: spawns a shell and serves one peer at a time.\n"
        "\n"
        "Options:\n"
        "  -p, --passphrase <text>  Encrypt the channel with a key derived from <text>\n"
        "  -c, --client             Connect to a server and drive its shell\n"
        "  -n, --name <host>        Server to connect to (client only, default 127.0.0.1)\n"
        "      --port <port>        Output channel port, input uses port+1 (default {})\n"
        "      --bind <address>     Address the server listens on (default 0.0.0.0)\n"
        "      --shell <path>       Command host to spawn (server only, default {})\n"
        "      --shell-arg <arg>    Argument for the command host, repeatable\n"
        "      --username <name>    Run the command host as this account (server only)\n"
        "      --password <text>    Password of that account (ignored on POSIX)\n"
        "      --domain <name>      Domain of that account (unsupported on POSIX)\n"
        "      --once               Serve a single session, then exit (server only)\n"
        "  -h, --help               Show this help message\n",
        program,
        channel::TransportConstants::DEFAULT_PORT,
        channel::HostConstants::DEFAULT_SHELL);
}
}

#pragma once

#include "json.hpp"
#include "utils.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hostmux {

    using server_id = std::string;

    enum class server_status : uint8_t {
        disconnected,
        connecting,
        connected,
        error,
    };

    inline constexpr std::string_view to_string(server_status status) {
        switch (status) {
            case server_status::disconnected:
                return "disconnected"sv;
            case server_status::connecting:
                return "connecting"sv;
            case server_status::connected:
                return "connected"sv;
            case server_status::error:
                return "error"sv;
        }
        return "disconnected"sv;
    }

    inline constexpr bool try_parse_server_status(std::string_view text, server_status& out) {
        if (utils::str_case_eq(text, "disconnected"sv)) {
            out = server_status::disconnected;
            return true;
        }
        if (utils::str_case_eq(text, "connecting"sv)) {
            out = server_status::connecting;
            return true;
        }
        if (utils::str_case_eq(text, "connected"sv)) {
            out = server_status::connected;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = server_status::error;
            return true;
        }
        return false;
    }

    /*
     * One external MCP server.
     *
     * - id: stable identity, assigned at registration when left empty.
     * - name: display name, also used as provenance in captured artifacts.
     * - kind: free-form server kind tag ("github", "config", "custom", ...).
     * - command/args: process launch line, resolved through PATH.
     * - env: overrides for the child environment; values may be secret references
     *   (env://VAR, keyring://service/username) resolved only at connect time.
     * - enabled: whether connect_all() considers the server.
     * - status/last_error: owned by the protocol client, changed only by connect/disconnect.
     */
    struct server_descriptor {
        server_id id{};
        std::string name{};
        std::string kind{"custom"};
        std::string command{};
        std::vector<std::string> args{};
        std::map<std::string, std::string> env{};
        bool enabled{true};
        server_status status{server_status::disconnected};
        std::optional<std::string> last_error{};
    };

    struct tool_descriptor {
        std::string name{};
        std::optional<std::string> description{};
        server_id server{};
        json::value input_schema{};
    };

    // random (version 4) UUID in canonical 8-4-4-4-12 form
    std::string make_uuid();

}  // namespace hostmux

namespace hostmux::mcp {

    struct mcp_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct not_connected_error : mcp_error {
        using mcp_error::mcp_error;
    };

    struct protocol_error : mcp_error {
        protocol_error(const std::string& message, std::optional<int> code = std::nullopt)
                : mcp_error{message}, code{code} {}

        std::optional<int> code{};
    };

    struct timeout_error : mcp_error {
        using mcp_error::mcp_error;
    };

    struct request_cancelled_error : mcp_error {
        using mcp_error::mcp_error;
    };

    struct tool_not_found_error : mcp_error {
        explicit tool_not_found_error(std::string tool)
                : mcp_error{"Tool not found: " + tool}, tool_name{std::move(tool)} {}

        std::string tool_name{};
    };

}  // namespace hostmux::mcp

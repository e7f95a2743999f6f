#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hostmux {

    /*
     * Hostmux Startup Config Options
     *
     * Servers and capture
     * - config_path: Declarative server file ({"mcpServers": {...}}) loaded at startup.
     * - store_path: Append-only chunk store receiving captured tool output.
     * - project_id: Project association applied to captured chunks, if any.
     * - connect_on_start: Handshake every enabled server before the REPL starts.
     *
     * Session and UX
     * - history_file: Path to persisted interactive command history.
     * - history_enabled: Enable/disable persistent history writes.
     * - color_mode: ANSI color behavior for terminal output.
     * - quiet/verbose: Log threshold knobs (error-only / debug).
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv) || utils::str_case_eq(text, "automatic"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    struct startup_config {
        std::filesystem::path config_path{"config/mcp_servers.json"};
        std::filesystem::path store_path{".hostmux/chunks.jsonl"};
        std::optional<std::string> project_id{};
        bool connect_on_start{true};

        std::filesystem::path history_file{".hostmux/history"};
        bool history_enabled{true};
        color_mode color{color_mode::automatic};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

    inline log_level effective_log_level(const startup_config& cfg) {
        if (cfg.quiet) {
            return log_level::error;
        }
        if (cfg.verbose) {
            return log_level::debug;
        }
        return log_level::warning;
    }

}  // namespace hostmux

#pragma once

#include "capture.hpp"
#include "config.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace hostmux::cli {

    // empty when startup should continue; otherwise the process exit code
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // loads the server file, connects (unless disabled) and runs the interactive loop
    void run_repl(startup_config& cfg);

    struct repl_session {
        startup_config& cfg;
        mcp::aggregator& registry;
        capture::capture_pipeline& pipeline;
    };

    // returns true when the line was a command (handled or rejected); sets should_quit on :quit
    bool process_command(
            std::string_view line, repl_session& session, bool& should_quit, std::ostream& out, std::ostream& err);

}  // namespace hostmux::cli

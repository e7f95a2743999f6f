#include "hostmux/cli.hpp"

#include "editor.hpp"

#include "hostmux/format.hpp"
#include "hostmux/server_config.hpp"
#include "hostmux/version.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace hostmux::literals;

namespace hostmux::cli {

    namespace detail {

        static std::string_view optional_or_default(const std::optional<std::string>& value) {
            if (value) {
                return *value;
            }
            return "<none>"sv;
        }

        static std::vector<std::string_view> split_words(std::string_view text) {
            std::vector<std::string_view> words{};
            while (true) {
                text = utils::trim_view(text);
                if (text.empty()) {
                    break;
                }
                auto end = text.find_first_of(" \t");
                words.push_back(text.substr(0, end));
                if (end == std::string_view::npos) {
                    break;
                }
                text.remove_prefix(end);
            }
            return words;
        }

        static bool matches_command(std::string_view cmd, std::string_view name) {
            if (!cmd.starts_with(name)) {
                return false;
            }
            if (cmd.size() == name.size()) {
                return true;
            }
            auto next = cmd[name.size()];
            return next == ' ' || next == '\t';
        }

        static std::optional<std::string_view> command_argument(std::string_view cmd, std::string_view name) {
            if (!matches_command(cmd, name)) {
                return std::nullopt;
            }
            return std::optional<std::string_view>{utils::trim_view(cmd.substr(name.size()))};
        }

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "config=" << cfg.config_path.string() << '\n';
            os << "store=" << cfg.store_path.string() << '\n';
            os << "project=" << optional_or_default(cfg.project_id) << '\n';
            os << "connect_on_start=" << (cfg.connect_on_start ? "true" : "false") << '\n';
            os << "history_file=" << (cfg.history_enabled ? cfg.history_file.string() : "<disabled>") << '\n';
            os << "color=" << to_string(cfg.color) << '\n';
            os << "log_level=" << to_string(effective_log_level(cfg)) << '\n';
        }

        static void print_help(std::ostream& os) {
            static constexpr auto help_text = R"(commands:
  :help
  :servers
  :tools
  :connect <id|name|all>
  :disconnect <id|name|all>
  :register <name> <command> [args...]
  :unregister <id|name>
  :call <tool> [json arguments]
  :capture <tool> [json arguments]
  :project [id|none]
  :show config
  :quit
examples:
  :connect all
  :call echo {"message": "hi"}
  :capture search {"query": "event loop"}
  :project 5a0d2c4e
)";
            os << help_text;
        }

        static void print_servers(const mcp::aggregator& registry, std::ostream& os) {
            auto servers = registry.list_servers();
            if (servers.empty()) {
                os << "no servers registered\n";
                return;
            }
            for (const auto& s : servers) {
                os << "{:<20} {:<12} {:<8} {}"_format(s.name, to_string(s.status), s.kind, s.id) << '\n';
                if (s.status == server_status::error && s.last_error) {
                    os << "    " << *s.last_error << '\n';
                }
            }
        }

        static void print_tools(const mcp::aggregator& registry, std::ostream& os) {
            auto tools = registry.list_tools();
            if (tools.empty()) {
                os << "no tools available (is any server connected?)\n";
                return;
            }
            for (const auto& tool : tools) {
                const auto* owner = registry.get_server(tool.server);
                os << "{:<28} {:<16} {}"_format(
                              tool.name, owner != nullptr ? owner->name : tool.server, tool.description.value_or(""))
                   << '\n';
            }
        }

        static void report_connect(const server_descriptor& s, bool ok, std::ostream& out, std::ostream& err) {
            if (ok) {
                out << "connected " << s.name << '\n';
                return;
            }
            err << "failed to connect " << s.name << ": " << s.last_error.value_or("unknown error") << '\n';
        }

        static void connect_command(repl_session& session, std::string_view target, std::ostream& out, std::ostream& err) {
            if (target.empty()) {
                err << "usage: :connect <id|name|all>\n";
                return;
            }
            if (target == "all"sv) {
                auto results = session.registry.connect_all();
                for (const auto& [id, ok] : results) {
                    if (const auto* s = session.registry.get_server(id)) {
                        report_connect(*s, ok, out, err);
                    }
                }
                if (results.empty()) {
                    out << "no enabled servers\n";
                }
                return;
            }

            const auto* s = session.registry.find_server(target);
            if (s == nullptr) {
                err << "not found: server " << target << '\n';
                return;
            }
            auto id = s->id;
            auto ok = session.registry.connect(id);
            report_connect(*session.registry.get_server(id), ok, out, err);
        }

        static void disconnect_command(
                repl_session& session, std::string_view target, std::ostream& out, std::ostream& err) {
            if (target.empty()) {
                err << "usage: :disconnect <id|name|all>\n";
                return;
            }
            if (target == "all"sv) {
                session.registry.disconnect_all();
                out << "disconnected all servers\n";
                return;
            }
            const auto* s = session.registry.find_server(target);
            if (s == nullptr) {
                err << "not found: server " << target << '\n';
                return;
            }
            auto name = s->name;
            session.registry.disconnect(s->id);
            out << "disconnected " << name << '\n';
        }

        static void register_command(repl_session& session, std::string_view arg_text, std::ostream& out, std::ostream& err) {
            auto words = split_words(arg_text);
            if (words.size() < 2) {
                err << "usage: :register <name> <command> [args...]\n";
                return;
            }

            server_descriptor descriptor{.name = std::string{words[0]}, .command = std::string{words[1]}};
            for (size_t i = 2; i < words.size(); ++i) {
                descriptor.args.emplace_back(words[i]);
            }

            const auto& registered = session.registry.register_server(std::move(descriptor));
            out << "registered " << registered.name << " as " << registered.id << '\n';
        }

        static void unregister_command(
                repl_session& session, std::string_view target, std::ostream& out, std::ostream& err) {
            const auto* s = target.empty() ? nullptr : session.registry.find_server(target);
            if (s == nullptr) {
                err << "not found: server " << target << '\n';
                return;
            }
            auto name = s->name;
            session.registry.unregister_server(s->id);
            out << "unregistered " << name << '\n';
        }

        static void call_command(
                repl_session& session, std::string_view arg_text, bool capture, std::ostream& out, std::ostream& err) {
            arg_text = utils::trim_view(arg_text);
            auto end = arg_text.find_first_of(" \t");
            auto tool = arg_text.substr(0, end);
            auto payload = end == std::string_view::npos ? std::string_view{} : utils::trim_view(arg_text.substr(end));

            if (tool.empty()) {
                err << "usage: " << (capture ? ":capture" : ":call") << " <tool> [json arguments]\n";
                return;
            }

            auto arguments = json::make_object();
            if (!payload.empty()) {
                auto parsed = json::try_parse_json(payload);
                if (!parsed || json::as_object(*parsed) == nullptr) {
                    err << "error: arguments must be a json object\n";
                    return;
                }
                arguments = std::move(*parsed);
            }

            try {
                auto outcome =
                        session.pipeline.call_tool(std::nullopt, tool, arguments, session.cfg.project_id, capture);
                out << capture::extract_text(outcome.result) << '\n';
                if (outcome.chunk_id) {
                    out << "captured chunk " << *outcome.chunk_id << '\n';
                }
                else if (capture) {
                    out << "nothing captured\n";
                }
            } catch (const capture::capture_error& e) {
                out << capture::extract_text(e.result) << '\n';
                err << "error: " << e.what() << '\n';
            }
        }

        static void project_command(repl_session& session, std::string_view arg, std::ostream& out) {
            if (arg.empty()) {
                out << "project=" << optional_or_default(session.cfg.project_id) << '\n';
                return;
            }
            if (arg == "none"sv) {
                session.cfg.project_id.reset();
            }
            else {
                session.cfg.project_id = std::string{arg};
            }
            out << "project=" << optional_or_default(session.cfg.project_id) << '\n';
        }

        static std::vector<std::string> completion_candidates(const mcp::aggregator& registry, std::string_view command) {
            std::vector<std::string> out{};
            if (command == ":call"sv || command == ":capture"sv) {
                for (const auto& tool : registry.list_tools()) {
                    out.push_back(tool.name);
                }
                return out;
            }
            if (command == ":connect"sv || command == ":disconnect"sv) {
                out.emplace_back("all");
            }
            for (const auto& s : registry.list_servers()) {
                out.push_back(s.name);
            }
            return out;
        }

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

    }  // namespace detail

    bool process_command(
            std::string_view line, repl_session& session, bool& should_quit, std::ostream& out, std::ostream& err) {
        auto cmd = utils::trim_view(line);
        if (!cmd.starts_with(':')) {
            return false;
        }

        try {
            if (cmd == ":quit"sv || cmd == ":q"sv) {
                should_quit = true;
                return true;
            }
            if (cmd == ":help"sv) {
                detail::print_help(out);
                return true;
            }
            if (cmd == ":show config"sv) {
                detail::print_config(session.cfg, out);
                return true;
            }
            if (cmd == ":servers"sv) {
                detail::print_servers(session.registry, out);
                return true;
            }
            if (cmd == ":tools"sv) {
                detail::print_tools(session.registry, out);
                return true;
            }
            if (auto arg = detail::command_argument(cmd, ":connect"sv)) {
                detail::connect_command(session, *arg, out, err);
                return true;
            }
            if (auto arg = detail::command_argument(cmd, ":disconnect"sv)) {
                detail::disconnect_command(session, *arg, out, err);
                return true;
            }
            if (auto arg = detail::command_argument(cmd, ":register"sv)) {
                detail::register_command(session, *arg, out, err);
                return true;
            }
            if (auto arg = detail::command_argument(cmd, ":unregister"sv)) {
                detail::unregister_command(session, *arg, out, err);
                return true;
            }
            if (auto arg = detail::command_argument(cmd, ":call"sv)) {
                detail::call_command(session, *arg, false, out, err);
                return true;
            }
            if (auto arg = detail::command_argument(cmd, ":capture"sv)) {
                detail::call_command(session, *arg, true, out, err);
                return true;
            }
            if (auto arg = detail::command_argument(cmd, ":project"sv)) {
                detail::project_command(session, *arg, out);
                return true;
            }
        } catch (const mcp::tool_not_found_error& e) {
            err << "not found: " << e.what() << '\n';
            return true;
        } catch (const std::exception& e) {
            err << "error: " << e.what() << '\n';
            return true;
        }

        err << "unknown command: " << cmd << " (try :help)\n";
        return true;
    }

    void run_repl(startup_config& cfg) {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        mcp::aggregator registry{loop, resolver};
        capture::jsonl_chunk_store store{cfg.store_path};
        capture::capture_pipeline pipeline{registry, &store};
        repl_session session{.cfg = cfg, .registry = registry, .pipeline = pipeline};

        registry.on_status_change([](const server_descriptor& s) {
            if (s.status == server_status::error) {
                std::cerr << "server " << s.name << " failed: " << s.last_error.value_or("unknown error") << '\n';
            }
        });

        auto server_config = config::load_server_config(cfg.config_path);
        auto ids = config::register_servers(registry, server_config);
        if (cfg.connect_on_start && !ids.empty()) {
            auto results = registry.connect_all();
            auto connected = std::ranges::count_if(results, [](const auto& entry) { return entry.second; });
            std::cout << "connected " << connected << "/" << results.size() << " servers\n";
        }
        else {
            std::cout << "registered " << ids.size() << " servers\n";
        }

        line_editor editor{cfg, [&registry](std::string_view command) {
                               return detail::completion_candidates(registry, command);
                           }};
        std::cout << "hostmux " << version << "\n";
        std::cout << "type :help for commands\n";

        bool should_quit = false;
        while (!should_quit) {
            auto next_line = editor.read_line("hostmux> "sv);
            if (!next_line) {
                std::cout << '\n';
                break;
            }

            auto line = utils::trim_view(*next_line);
            if (line.empty()) {
                continue;
            }

            if (!process_command(line, session, should_quit, std::cout, std::cerr)) {
                std::cerr << "commands start with ':' (try :help)\n";
            }
        }

        registry.disconnect_all();
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"hostmux: aggregate MCP tool servers behind one session"};

        bool show_version = false;
        std::string config_arg{cfg.config_path.string()};
        std::string store_arg{cfg.store_path.string()};
        std::string project_arg{cfg.project_id.value_or("")};
        std::string history_file_arg{cfg.history_file.string()};
        std::string color_arg{std::string{to_string(cfg.color)}};
        bool no_history = false;
        bool no_connect = false;

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-c,--config", config_arg, "Server config file (mcpServers json)");
        app.add_option("--store", store_arg, "Chunk store receiving captured output (jsonl)");
        app.add_option("-p,--project", project_arg, "Project id attached to captured chunks");
        app.add_option("--history-file", history_file_arg, "Persistent REPL history path");
        app.add_flag("--no-history", no_history, "Disable persistent REPL history");
        app.add_flag("--no-connect", no_connect, "Register servers without connecting them");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("-q,--quiet", cfg.quiet, "Only log errors");
        app.add_flag("-v,--verbose", cfg.verbose, "Enable debug logging");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }

        cfg.config_path = config_arg;
        cfg.store_path = store_arg;
        cfg.project_id = detail::normalize_optional(project_arg);
        cfg.history_file = history_file_arg;
        if (no_history) {
            cfg.history_enabled = false;
        }
        if (no_connect) {
            cfg.connect_on_start = false;
        }

        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        logging::set_threshold(effective_log_level(cfg));

        if (show_version) {
            std::cout << "hostmux " << version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace hostmux::cli

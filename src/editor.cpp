#include "editor.hpp"

extern "C" {
#include <isocline.h>
}

#include <array>
#include <filesystem>
#include <string_view>

namespace hostmux::cli { namespace detail {

    using namespace std::string_view_literals;

    static std::array<const char*, 14> command_completions{
            ":help",
            ":servers",
            ":tools",
            ":connect",
            ":disconnect",
            ":register",
            ":unregister",
            ":call",
            ":capture",
            ":project",
            ":show",
            ":quit",
            ":q",
            nullptr};

    static std::array<const char*, 2> show_completions{"config", nullptr};
    static std::array<const char*, 2> project_completions{"none", nullptr};

    static constexpr std::string_view trim_left(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        return value.substr(start);
    }

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && s[0] == ':') {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static bool is_argument_char(const char* s, long len) {
        if (len == 1 && (s[0] == '-' || s[0] == '_' || s[0] == '.' || s[0] == '/')) {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_from(ic_completion_env_t* cenv, const char* prefix, const char** completions) {
        (void)ic_add_completions(cenv, prefix, completions);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        complete_from(cenv, prefix, command_completions.data());
    }

    static void complete_show_args(ic_completion_env_t* cenv, const char* prefix) {
        complete_from(cenv, prefix, show_completions.data());
    }

    static void complete_project_args(ic_completion_env_t* cenv, const char* prefix) {
        complete_from(cenv, prefix, project_completions.data());
    }

    // set by complete_repl right before ic_complete_word hands the current word to a callback
    static thread_local std::string_view active_command{};

    static void complete_dynamic_args(ic_completion_env_t* cenv, const char* prefix) {
        const auto* editor = static_cast<const line_editor*>(ic_completion_arg(cenv));
        if (editor == nullptr || prefix == nullptr) {
            return;
        }

        std::vector<std::string> candidates{};
        editor->collect_candidates(active_command, candidates);

        std::string_view word{prefix};
        for (const auto& candidate : candidates) {
            if (candidate.starts_with(word)) {
                (void)ic_add_completion(cenv, candidate.c_str());
            }
        }
    }

    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = trim_left(std::string_view{prefix});
        if (trimmed.empty()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        if (!trimmed.starts_with(':')) {
            return;
        }

        auto command = first_token(trimmed);
        auto has_args = command.size() < trimmed.size();
        if (!has_args) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        if (command == ":show"sv) {
            ic_complete_word(cenv, prefix, complete_show_args, nullptr);
            return;
        }
        if (command == ":project"sv) {
            ic_complete_word(cenv, prefix, complete_project_args, nullptr);
            return;
        }
        if (command == ":connect"sv || command == ":disconnect"sv || command == ":unregister"sv ||
            command == ":call"sv || command == ":capture"sv) {
            // only the first argument is completed; json payloads are left alone
            auto rest = trim_left(trimmed.substr(command.size()));
            if (rest.find_first_of(" \t") != std::string_view::npos) {
                return;
            }
            active_command = command;
            ic_complete_word(cenv, prefix, complete_dynamic_args, is_argument_char);
            active_command = {};
            return;
        }
    }

}}  // namespace hostmux::cli::detail

namespace hostmux::cli {

    namespace fs = std::filesystem;

    line_editor::line_editor(const startup_config& cfg, candidate_source source) : source_{std::move(source)} {
        ic_enable_multiline(false);
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_default_completer(detail::complete_repl, this);

        switch (cfg.color) {
            case color_mode::automatic:
                break;
            case color_mode::always:
                ic_enable_color(true);
                break;
            case color_mode::never:
                ic_enable_color(false);
                break;
        }

        if (!cfg.history_enabled) {
            ic_set_history(nullptr, 1000);
            return;
        }

        std::error_code ec{};
        auto history_parent = cfg.history_file.parent_path();
        if (!history_parent.empty()) {
            fs::create_directories(history_parent, ec);
        }

        auto history_file = cfg.history_file.string();
        ic_set_history(history_file.c_str(), 1000);
    }

    line_editor::~line_editor() {
        ic_set_default_completer(nullptr, nullptr);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    void line_editor::collect_candidates(std::string_view command, std::vector<std::string>& out) const {
        if (source_) {
            out = source_(command);
        }
    }

}  // namespace hostmux::cli

#pragma once

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace hostmux {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { debug, info, warning, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warning:
                return "warning"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "warning"sv;
    }

    namespace logging {
        struct sink_state {
            log_level threshold{log_level::warning};
            std::ostream* stream{&std::cerr};
        };

        inline sink_state& state() {
            static sink_state s{};
            return s;
        }

        inline void set_threshold(log_level level) {
            state().threshold = level;
        }

        inline log_level threshold() {
            return state().threshold;
        }

        // nullptr restores std::cerr
        inline void set_stream(std::ostream* os) {
            state().stream = os == nullptr ? &std::cerr : os;
        }

        inline bool enabled(log_level level) {
            return level != log_level::off && level >= state().threshold;
        }

        constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos)
                sv.remove_prefix(p + 1);
            return sv;
        }

        inline void prepend_location(std::ostream& os, const std::source_location& loc) {
            os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
        }

        template <log_level Level, typename... Args>
        void emit(const std::source_location& loc, Args&&... args) {
            if (!enabled(Level)) {
                return;
            }
            auto& os = *state().stream;
            os << to_string(Level) << ": ";
            if constexpr (Level == log_level::debug) {
                prepend_location(os, loc);
            }
            (os << ... << std::forward<Args>(args)) << std::endl;
        }
    }  // namespace logging

// Debug logger; no-op on release builds
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit<log_level::debug>(loc, std::forward<Args>(args)...);
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    template <typename... Args>
    struct info_log {
        explicit info_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit<log_level::info>(loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct warn_log {
        explicit warn_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit<log_level::warning>(loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct error_log {
        explicit error_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit<log_level::error>(loc, std::forward<Args>(args)...);
        }
    };

    // deduction guides
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;
    template <typename... Args>
    info_log(Args&&...) -> info_log<Args...>;
    template <typename... Args>
    warn_log(Args&&...) -> warn_log<Args...>;
    template <typename... Args>
    error_log(Args&&...) -> error_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        inline std::vector<std::string> split_lines(std::string_view text) {
            std::vector<std::string> lines{};
            while (!text.empty()) {
                auto pos = text.find('\n');
                auto line = text.substr(0, pos);
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1);
                }
                lines.emplace_back(line);
                if (pos == std::string_view::npos) {
                    break;
                }
                text.remove_prefix(pos + 1);
            }
            return lines;
        }

    }  // namespace utils

}  // namespace hostmux

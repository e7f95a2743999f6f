#pragma once

#include "hostmux/config.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostmux::cli {

    class line_editor {
      public:
        // candidates for the argument of `command` (":connect", ":call", ...)
        using candidate_source = std::function<std::vector<std::string>(std::string_view command)>;

        explicit line_editor(const startup_config& cfg, candidate_source source = {});
        ~line_editor();

        line_editor(const line_editor&) = delete;
        line_editor& operator=(const line_editor&) = delete;

        std::optional<std::string> read_line(std::string_view prompt);

        // fills `out` with the candidates for `command`; used by the completer
        void collect_candidates(std::string_view command, std::vector<std::string>& out) const;

      private:
        candidate_source source_{};
    };

}  // namespace hostmux::cli

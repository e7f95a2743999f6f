#pragma once

#include "hostmux/hostmux.hpp"

#include "hostmux/format.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace hostmux::test::detail {
    namespace fs = std::filesystem;

    using namespace std::string_view_literals;
    using namespace hostmux::literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline void write_script(const fs::path& p, std::string_view content) {
        write_file(p, content);
        REQUIRE(::chmod(p.c_str(), 0755) == 0);
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline server_descriptor echo_server(std::string name, std::vector<std::string> extra_args = {}) {
        server_descriptor descriptor{.name = name, .command = HOSTMUX_ECHO_SERVER_PATH};
        descriptor.args = {"--name", std::move(name)};
        descriptor.args.insert(descriptor.args.end(), extra_args.begin(), extra_args.end());
        return descriptor;
    }

    inline json::value object_of(std::string_view json_text) {
        return json::parse_json(json_text);
    }

    // text of the first block of a tools/call `content` array
    inline std::string first_text(const json::value& content) {
        const auto* blocks = json::as_array(content);
        REQUIRE(blocks != nullptr);
        REQUIRE_FALSE(blocks->empty());
        return json::string_member(blocks->front(), "text"sv).value_or("");
    }

    inline bool pid_gone(pid_t pid) {
        return ::kill(pid, 0) != 0 && errno == ESRCH;
    }

    // routes log output into a buffer for the lifetime of the object
    struct captured_log {
        std::ostringstream buffer{};
        log_level previous{logging::threshold()};

        explicit captured_log(log_level level = log_level::debug) {
            logging::set_stream(&buffer);
            logging::set_threshold(level);
        }

        ~captured_log() {
            logging::set_stream(nullptr);
            logging::set_threshold(previous);
        }

        captured_log(const captured_log&) = delete;
        captured_log& operator=(const captured_log&) = delete;

        std::string str() const { return buffer.str(); }
    };

}  // namespace hostmux::test::detail

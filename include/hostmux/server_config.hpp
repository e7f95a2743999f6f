#pragma once

#include "aggregator.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hostmux::config {

    namespace fs = std::filesystem;

    /*
     * One entry of the declarative server file:
     *
     *   {"mcpServers": {"github": {"command": "npx", "args": [...], "env": {"TOKEN": "env://GH_TOKEN"}}}}
     *
     * env values stay unresolved here; references are resolved when the server connects.
     */
    struct server_entry {
        std::string command{};
        std::vector<std::string> args{};
        std::map<std::string, std::string> env{};
        bool disabled{false};
    };

    // entries keep file order, which becomes registration (and so routing) order
    struct server_config_file {
        std::vector<std::pair<std::string, server_entry>> servers{};
    };

    // a missing file is an empty config; malformed JSON throws std::runtime_error naming the file
    server_config_file load_server_config(const fs::path& path);

    // registers every entry not marked disabled with kind "config"; returns the registered ids
    std::vector<server_id> register_servers(mcp::aggregator& registry, const server_config_file& config);

    // load + register + connect_all; returns the number of servers that connected
    std::size_t load_and_register_servers(mcp::aggregator& registry, const fs::path& path);

}  // namespace hostmux::config

namespace glz {
    template <>
    struct meta<hostmux::config::server_entry> {
        using T = hostmux::config::server_entry;
        static constexpr auto value =
                object("command", &T::command, "args", &T::args, "env", &T::env, "disabled", &T::disabled);
    };

    template <>
    struct meta<hostmux::config::server_config_file> {
        using T = hostmux::config::server_config_file;
        static constexpr auto value = object("mcpServers", &T::servers);
    };
}  // namespace glz

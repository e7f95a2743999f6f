#include "hostmux/server_config.hpp"

#include "hostmux/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace hostmux::literals;

namespace hostmux::config {

    namespace detail {
        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }
    }  // namespace detail

    server_config_file load_server_config(const fs::path& path) {
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            info_log("no server config at ", path.string(), "; starting with no servers");
            return {};
        }

        server_config_file config{};
        auto json = detail::read_text_file(path);
        if (auto err = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, json)) {
            throw std::runtime_error(
                    "failed to parse server config {}: {}"_format(path.string(), glz::format_error(err, json)));
        }

        for (const auto& [name, entry] : config.servers) {
            if (!entry.disabled && entry.command.empty()) {
                throw std::runtime_error("server '{}' in {} has no command"_format(name, path.string()));
            }
        }
        return config;
    }

    std::vector<server_id> register_servers(mcp::aggregator& registry, const server_config_file& config) {
        std::vector<server_id> ids{};
        for (const auto& [name, entry] : config.servers) {
            if (entry.disabled) {
                debug_log("skipping disabled server '", name, "'");
                continue;
            }
            const auto& registered = registry.register_server(
                    server_descriptor{
                            .name = name,
                            .kind = "config",
                            .command = entry.command,
                            .args = entry.args,
                            .env = entry.env});
            ids.push_back(registered.id);
        }
        return ids;
    }

    std::size_t load_and_register_servers(mcp::aggregator& registry, const fs::path& path) {
        auto config = load_server_config(path);
        auto ids = register_servers(registry, config);
        if (ids.empty()) {
            return 0;
        }

        auto results = registry.connect_all();
        std::size_t connected = 0;
        for (const auto& id : ids) {
            if (auto it = results.find(id); it != results.end() && it->second) {
                ++connected;
            }
        }
        info_log("connected ", connected, "/", ids.size(), " servers from ", path.string());
        return connected;
    }

}  // namespace hostmux::config

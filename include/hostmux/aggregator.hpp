#pragma once

#include "client.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostmux::mcp {

    struct tool_route {
        protocol_client* client{};
        const tool_descriptor* tool{};
    };

    /*
     * Registry of protocol clients and the unified tool surface over them.
     *
     * Registration order is routing order: when two connected servers advertise the same tool
     * name, the one registered first answers. The aggregator performs no retries.
     */
    class aggregator {
      public:
        using status_listener = std::function<void(const server_descriptor&)>;

        aggregator(event_loop& loop, const secrets::secret_resolver& resolver);
        ~aggregator();

        aggregator(const aggregator&) = delete;
        aggregator& operator=(const aggregator&) = delete;

        // assigns an id when `descriptor.id` is empty; throws std::invalid_argument on a duplicate id
        const server_descriptor& register_server(server_descriptor descriptor);

        // disconnects first; false when `id` is unknown
        bool unregister_server(std::string_view id);

        // false for an unknown id or a failed handshake
        bool connect(std::string_view id);
        void disconnect(std::string_view id);

        // handshakes every enabled server concurrently; keyed by server id
        std::map<server_id, bool> connect_all();
        void disconnect_all();

        const server_descriptor* get_server(std::string_view id) const;
        std::vector<server_descriptor> list_servers() const;

        // exact id first, then display name (case-insensitive)
        const server_descriptor* find_server(std::string_view id_or_name) const;

        protocol_client* client(std::string_view id);

        // tools of connected servers only, in routing order
        std::vector<tool_descriptor> list_tools() const;
        std::optional<tool_route> find_tool(std::string_view name) const;

        // throws tool_not_found_error when no connected server advertises `name`
        json::value call_tool(std::string_view name, const json::value& arguments);
        call_ptr start_call_tool(std::string_view name, const json::value& arguments);

        void on_status_change(status_listener listener);

        event_loop& loop() { return loop_; }
        std::size_t size() const { return clients_.size(); }

      private:
        void publish(const server_descriptor& descriptor);

        event_loop& loop_;
        const secrets::secret_resolver& resolver_;
        std::vector<std::unique_ptr<protocol_client>> clients_{};
        std::vector<status_listener> listeners_{};
    };

}  // namespace hostmux::mcp

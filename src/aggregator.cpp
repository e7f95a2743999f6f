#include "hostmux/aggregator.hpp"

#include "hostmux/format.hpp"

#include <algorithm>
#include <stdexcept>

using namespace hostmux::literals;

namespace hostmux::mcp {

    aggregator::aggregator(event_loop& loop, const secrets::secret_resolver& resolver)
            : loop_{loop}, resolver_{resolver} {}

    aggregator::~aggregator() {
        try {
            disconnect_all();
        } catch (const std::exception& e) {
            error_log("failed to disconnect servers on shutdown: ", e.what());
        }
    }

    const server_descriptor& aggregator::register_server(server_descriptor descriptor) {
        if (descriptor.id.empty()) {
            descriptor.id = make_uuid();
        }
        if (get_server(descriptor.id) != nullptr) {
            throw std::invalid_argument("server '{}' is already registered"_format(descriptor.id));
        }
        if (descriptor.name.empty()) {
            descriptor.name = descriptor.id;
        }

        auto& added = clients_.emplace_back(std::make_unique<protocol_client>(loop_, resolver_, std::move(descriptor)));
        added->set_status_listener([this](const server_descriptor& d) { publish(d); });

        debug_log("registered server '", added->descriptor().name, "' as ", added->id());
        return added->descriptor();
    }

    bool aggregator::unregister_server(std::string_view id) {
        auto it = std::ranges::find_if(clients_, [&](const auto& c) { return c->id() == id; });
        if (it == clients_.end()) {
            return false;
        }

        (*it)->disconnect();
        clients_.erase(it);
        return true;
    }

    protocol_client* aggregator::client(std::string_view id) {
        for (auto& c : clients_) {
            if (c->id() == id) {
                return c.get();
            }
        }
        return nullptr;
    }

    bool aggregator::connect(std::string_view id) {
        auto* c = client(id);
        if (c == nullptr) {
            return false;
        }
        return c->connect();
    }

    void aggregator::disconnect(std::string_view id) {
        if (auto* c = client(id)) {
            c->disconnect();
        }
    }

    std::map<server_id, bool> aggregator::connect_all() {
        std::vector<protocol_client*> started{};
        for (auto& c : clients_) {
            if (!c->descriptor().enabled) {
                continue;
            }
            c->begin_connect();
            started.push_back(c.get());
        }

        loop_.run_until([&] {
            return std::ranges::none_of(
                    started, [](const protocol_client* c) { return c->status() == server_status::connecting; });
        });

        std::map<server_id, bool> results{};
        for (const auto* c : started) {
            results.emplace(c->id(), c->status() == server_status::connected);
        }
        return results;
    }

    void aggregator::disconnect_all() {
        for (auto& c : clients_) {
            c->disconnect();
        }
    }

    const server_descriptor* aggregator::get_server(std::string_view id) const {
        for (const auto& c : clients_) {
            if (c->id() == id) {
                return &c->descriptor();
            }
        }
        return nullptr;
    }

    std::vector<server_descriptor> aggregator::list_servers() const {
        std::vector<server_descriptor> out{};
        out.reserve(clients_.size());
        for (const auto& c : clients_) {
            out.push_back(c->descriptor());
        }
        return out;
    }

    const server_descriptor* aggregator::find_server(std::string_view id_or_name) const {
        if (const auto* by_id = get_server(id_or_name)) {
            return by_id;
        }
        for (const auto& c : clients_) {
            if (utils::str_case_eq(c->descriptor().name, id_or_name)) {
                return &c->descriptor();
            }
        }
        return nullptr;
    }

    std::vector<tool_descriptor> aggregator::list_tools() const {
        std::vector<tool_descriptor> out{};
        for (const auto& c : clients_) {
            if (c->status() != server_status::connected) {
                continue;
            }
            out.insert(out.end(), c->tools().begin(), c->tools().end());
        }
        return out;
    }

    std::optional<tool_route> aggregator::find_tool(std::string_view name) const {
        for (const auto& c : clients_) {
            if (c->status() != server_status::connected) {
                continue;
            }
            if (const auto* tool = c->find_tool(name)) {
                return tool_route{.client = c.get(), .tool = tool};
            }
        }
        return std::nullopt;
    }

    json::value aggregator::call_tool(std::string_view name, const json::value& arguments) {
        auto route = find_tool(name);
        if (!route) {
            throw tool_not_found_error(std::string{name});
        }
        debug_log("routing tool '", name, "' to '", route->client->descriptor().name, "'");
        return route->client->call_tool(name, arguments);
    }

    call_ptr aggregator::start_call_tool(std::string_view name, const json::value& arguments) {
        auto route = find_tool(name);
        if (!route) {
            throw tool_not_found_error(std::string{name});
        }
        return route->client->start_call_tool(name, arguments);
    }

    void aggregator::on_status_change(status_listener listener) {
        listeners_.push_back(std::move(listener));
    }

    void aggregator::publish(const server_descriptor& descriptor) {
        debug_log("server '", descriptor.name, "' is now ", to_string(descriptor.status));
        for (const auto& listener : listeners_) {
            listener(descriptor);
        }
    }

}  // namespace hostmux::mcp

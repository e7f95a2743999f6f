#pragma once

#include "event_loop.hpp"
#include "secrets.hpp"
#include "types.hpp"
#include "version.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace hostmux::mcp {

    inline constexpr auto request_timeout = std::chrono::seconds{30};
    inline constexpr auto shutdown_grace = std::chrono::seconds{5};

    inline constexpr auto client_name = "hostmux"sv;
    inline constexpr auto client_version = hostmux::version;

    /*
     * Single-resolution completion handle for one JSON-RPC request.
     * The first settle wins; later attempts are ignored. A continuation registered with
     * then() runs exactly once, immediately if the handle has already settled.
     */
    class call_handle {
      public:
        explicit call_handle(std::int64_t id) : id_{id} {}

        std::int64_t id() const { return id_; }
        bool ready() const { return settled_; }
        bool failed() const { return settled_ && error_ != nullptr; }

        // rethrows the failure; throws std::logic_error when not yet settled
        const json::value& value() const;
        std::exception_ptr error() const { return error_; }

        void then(std::function<void(call_handle&)> continuation);

        bool settle(json::value result);
        bool settle(std::exception_ptr error);

      private:
        void run_continuation();

        std::int64_t id_{};
        bool settled_{false};
        json::value result_{};
        std::exception_ptr error_{};
        std::function<void(call_handle&)> continuation_{};
    };

    using call_ptr = std::shared_ptr<call_handle>;

    /*
     * Owns one MCP server child process and the JSON-RPC session with it.
     *
     * Status transitions: disconnected -> connecting -> connected | error; connected or error
     * -> disconnected through disconnect(). All I/O runs on the shared event_loop; the blocking
     * wrappers pump that loop, so other clients progress while one waits.
     */
    class protocol_client {
      public:
        using status_listener = std::function<void(const server_descriptor&)>;

        protocol_client(event_loop& loop, const secrets::secret_resolver& resolver, server_descriptor descriptor);
        ~protocol_client();

        protocol_client(const protocol_client&) = delete;
        protocol_client& operator=(const protocol_client&) = delete;

        // spawns the child and starts the handshake; returns without waiting for it
        void begin_connect();

        // begin_connect() and wait; false means status is error (see last_error())
        bool connect();

        // idempotent; cancels outstanding requests and reaps the child
        void disconnect();

        call_ptr start_request(std::string_view method, const json::value& params);
        json::value request(std::string_view method, const json::value& params);
        void notify(std::string_view method, const json::value& params);

        call_ptr start_call_tool(std::string_view name, const json::value& arguments);

        // returns the `content` member of the tools/call result
        json::value call_tool(std::string_view name, const json::value& arguments);

        const server_descriptor& descriptor() const { return descriptor_; }
        const server_id& id() const { return descriptor_.id; }
        server_status status() const { return descriptor_.status; }
        const std::optional<std::string>& last_error() const { return descriptor_.last_error; }
        const std::vector<tool_descriptor>& tools() const { return tools_; }
        const tool_descriptor* find_tool(std::string_view name) const;

        bool running() const;
        pid_t pid() const { return pid_; }
        std::size_t pending_count() const { return pending_.size(); }

        // deadline for each request; request_timeout unless changed
        void set_request_timeout(std::chrono::milliseconds timeout) { request_timeout_ = timeout; }
        std::chrono::milliseconds timeout() const { return request_timeout_; }

        void set_enabled(bool enabled) { descriptor_.enabled = enabled; }
        void set_status_listener(status_listener listener) { status_listener_ = std::move(listener); }

      private:
        struct pending_request {
            call_ptr handle{};
            event_loop::handle timer{};
        };

        call_ptr send_request(std::string_view method, std::string params_json);

        void set_status(server_status status, std::optional<std::string> error = std::nullopt);
        void fail_connect(const std::string& message);
        void on_initialized(call_handle& init);
        void on_tools_listed(call_handle& listing);
        void refresh_tools();

        void write_line(const std::string& line);
        void on_stdout_ready(short revents);
        void on_stderr_ready(short revents);
        void on_stdout_closed();
        void handle_line(std::string_view line);
        void complete(std::int64_t id, json::value result);
        void fail(std::int64_t id, std::exception_ptr error);
        void reply_to_server(const json::value& id, std::string frame);
        void fail_all_pending(const std::exception_ptr& error);
        void stop_watching();
        void terminate_child();

        event_loop& loop_;
        const secrets::secret_resolver& resolver_;
        server_descriptor descriptor_{};
        std::vector<tool_descriptor> tools_{};
        status_listener status_listener_{};

        pid_t pid_{-1};
        int stdin_fd_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};
        bool stdout_closed_{false};
        event_loop::handle stdout_watch_{};
        event_loop::handle stderr_watch_{};
        std::string stdout_buffer_{};
        std::string stderr_buffer_{};

        std::chrono::milliseconds request_timeout_{request_timeout};
        std::int64_t next_id_{1};
        std::map<std::int64_t, pending_request> pending_{};
    };

}  // namespace hostmux::mcp

#include "hostmux/client.hpp"

#include "hostmux/format.hpp"

#include "internal/jsonrpc.hpp"
#include "internal/process.hpp"

#include <glaze/glaze.hpp>

#include <cerrno>
#include <stdexcept>

using namespace hostmux::literals;

namespace hostmux::mcp {

    namespace process = internal::process;

    namespace detail {
        template <typename... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };

        struct client_info {
            std::string name{client_name};
            std::string version{client_version};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{jsonrpc::protocol_version};
            glz::raw_json capabilities{"{}"};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value = glz::object(
                        "protocolVersion", &T::protocolVersion, "capabilities", &T::capabilities, "clientInfo",
                        &T::clientInfo);
            };
        };

        static std::string describe(const std::exception_ptr& error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                return e.what();
            }
            return "unknown error";
        }

        static json::value tool_call_params(std::string_view name, const json::value& arguments) {
            auto params = json::make_object();
            json::set_member(params, "name", json::string_value(std::string{name}));
            json::set_member(params, "arguments", json::is_null(arguments) ? json::make_object() : arguments);
            return params;
        }

        // name is required; description optional; a missing inputSchema becomes {}
        static std::vector<tool_descriptor> parse_tool_catalog(const json::value& result, const server_id& owner) {
            const auto* tools = json::find_member(result, "tools"sv);
            if (tools == nullptr) {
                return {};
            }
            const auto* list = json::as_array(*tools);
            if (list == nullptr) {
                throw protocol_error("tools/list result: `tools` is not an array");
            }

            std::vector<tool_descriptor> catalog{};
            catalog.reserve(list->size());
            for (const auto& entry : *list) {
                auto name = json::string_member(entry, "name"sv);
                if (!name || name->empty()) {
                    throw protocol_error("tools/list result: tool entry without a name");
                }
                const auto* schema = json::find_member(entry, "inputSchema"sv);
                catalog.push_back(
                        tool_descriptor{
                                .name = std::move(*name),
                                .description = json::string_member(entry, "description"sv),
                                .server = owner,
                                .input_schema = schema != nullptr ? *schema : json::make_object()});
            }
            return catalog;
        }
    }  // namespace detail

    // ── call_handle ─────────────────────────────────────────────────────

    const json::value& call_handle::value() const {
        if (!settled_) {
            throw std::logic_error("request {} has not completed"_format(id_));
        }
        if (error_) {
            std::rethrow_exception(error_);
        }
        return result_;
    }

    void call_handle::then(std::function<void(call_handle&)> continuation) {
        if (settled_) {
            continuation(*this);
            return;
        }
        continuation_ = std::move(continuation);
    }

    bool call_handle::settle(json::value result) {
        if (settled_) {
            return false;
        }
        settled_ = true;
        result_ = std::move(result);
        run_continuation();
        return true;
    }

    bool call_handle::settle(std::exception_ptr error) {
        if (settled_) {
            return false;
        }
        settled_ = true;
        error_ = std::move(error);
        run_continuation();
        return true;
    }

    void call_handle::run_continuation() {
        if (!continuation_) {
            return;
        }
        auto continuation = std::move(continuation_);
        continuation_ = nullptr;
        continuation(*this);
    }

    // ── protocol_client ─────────────────────────────────────────────────

    protocol_client::protocol_client(
            event_loop& loop, const secrets::secret_resolver& resolver, server_descriptor descriptor)
            : loop_{loop}, resolver_{resolver}, descriptor_{std::move(descriptor)} {
        descriptor_.status = server_status::disconnected;
    }

    protocol_client::~protocol_client() {
        try {
            disconnect();
        } catch (const std::exception& e) {
            error_log("failed to shut down server '", descriptor_.name, "': ", e.what());
        }
    }

    bool protocol_client::running() const {
        return pid_ > 0 && stdin_fd_ >= 0 && !stdout_closed_;
    }

    const tool_descriptor* protocol_client::find_tool(std::string_view name) const {
        for (const auto& tool : tools_) {
            if (tool.name == name) {
                return &tool;
            }
        }
        return nullptr;
    }

    void protocol_client::set_status(server_status status, std::optional<std::string> error) {
        auto changed = descriptor_.status != status || error.has_value();
        descriptor_.status = status;
        if (error) {
            descriptor_.last_error = std::move(error);
        }
        if (changed && status_listener_) {
            status_listener_(descriptor_);
        }
    }

    void protocol_client::begin_connect() {
        if (descriptor_.status == server_status::connecting) {
            return;
        }
        if (descriptor_.status == server_status::connected && running()) {
            return;
        }
        if (pid_ > 0 || descriptor_.status == server_status::connected) {
            // leftover child from a failed attempt or one that exited on its own
            disconnect();
        }

        descriptor_.last_error.reset();
        set_status(server_status::connecting);

        std::vector<std::string> argv{descriptor_.command};
        argv.insert(argv.end(), descriptor_.args.begin(), descriptor_.args.end());

        auto env = secrets::merge_environment(process::current_environment(), resolver_.resolve(descriptor_.env));

        auto spawned = process::spawn_piped(argv, env);
        if (!spawned.child) {
            fail_connect(spawned.error);
            return;
        }

        auto& child = *spawned.child;
        pid_ = child.pid;
        stdin_fd_ = child.stdin_fd;
        stdout_fd_ = child.stdout_fd;
        stderr_fd_ = child.stderr_fd;
        stdout_closed_ = false;
        stdout_buffer_.clear();
        stderr_buffer_.clear();
        next_id_ = 1;

        stdout_watch_ = loop_.watch(stdout_fd_, POLLIN, [this](short revents) { on_stdout_ready(revents); });
        stderr_watch_ = loop_.watch(stderr_fd_, POLLIN, [this](short revents) { on_stderr_ready(revents); });

        debug_log("spawned server '", descriptor_.name, "' (pid ", pid_, "): ", utils::join_with_separator(argv, " "));

        std::string params{};
        if (auto ec = glz::write_json(detail::initialize_params{}, params)) {
            fail_connect("failed to encode initialize request");
            return;
        }

        call_ptr init{};
        try {
            init = send_request("initialize"sv, std::move(params));
        } catch (const std::exception& e) {
            fail_connect("initialize failed: {}"_format(e.what()));
            return;
        }
        init->then([this](call_handle& h) { on_initialized(h); });
    }

    bool protocol_client::connect() {
        begin_connect();
        loop_.run_until([this] { return descriptor_.status != server_status::connecting; });
        return descriptor_.status == server_status::connected;
    }

    void protocol_client::on_initialized(call_handle& init) {
        if (descriptor_.status != server_status::connecting) {
            return;
        }
        if (init.failed()) {
            fail_connect("initialize failed: {}"_format(detail::describe(init.error())));
            return;
        }

        const auto& result = init.value();
        if (json::as_object(result) == nullptr) {
            fail_connect("initialize failed: result is not an object");
            return;
        }
        if (auto version = json::string_member(result, "protocolVersion"sv)) {
            debug_log("server '", descriptor_.name, "' speaks protocol ", *version);
        }

        try {
            write_line(jsonrpc::encode_notification("notifications/initialized"sv, "{}"sv));
            auto listing = send_request("tools/list"sv, "{}");
            listing->then([this](call_handle& h) { on_tools_listed(h); });
        } catch (const std::exception& e) {
            fail_connect("handshake failed: {}"_format(e.what()));
        }
    }

    void protocol_client::on_tools_listed(call_handle& listing) {
        if (descriptor_.status != server_status::connecting) {
            return;
        }
        if (listing.failed()) {
            fail_connect("tools/list failed: {}"_format(detail::describe(listing.error())));
            return;
        }

        try {
            tools_ = detail::parse_tool_catalog(listing.value(), descriptor_.id);
        } catch (const std::exception& e) {
            fail_connect(e.what());
            return;
        }

        descriptor_.last_error.reset();
        set_status(server_status::connected);
        info_log("connected to '", descriptor_.name, "' (", tools_.size(), " tools)");
    }

    void protocol_client::refresh_tools() {
        auto listing = send_request("tools/list"sv, "{}");
        listing->then([this](call_handle& h) {
            if (descriptor_.status != server_status::connected) {
                return;
            }
            if (h.failed()) {
                warn_log("failed to refresh tools of '", descriptor_.name, "': ", detail::describe(h.error()));
                return;
            }
            try {
                tools_ = detail::parse_tool_catalog(h.value(), descriptor_.id);
                debug_log("refreshed tools of '", descriptor_.name, "': ", tools_.size());
            } catch (const std::exception& e) {
                warn_log("ignoring malformed tool list from '", descriptor_.name, "': ", e.what());
            }
        });
    }

    void protocol_client::fail_connect(const std::string& message) {
        if (descriptor_.status != server_status::connecting) {
            return;
        }
        warn_log("failed to connect to '", descriptor_.name, "': ", message);

        // the status moves first so continuations of cancelled handshake requests see it
        descriptor_.status = server_status::error;
        descriptor_.last_error = message;

        stop_watching();
        fail_all_pending(std::make_exception_ptr(protocol_error(message)));
        terminate_child();
        tools_.clear();

        if (status_listener_) {
            status_listener_(descriptor_);
        }
    }

    void protocol_client::disconnect() {
        auto previous = descriptor_.status;

        if (pid_ <= 0 && pending_.empty()) {
            tools_.clear();
            if (previous == server_status::disconnected) {
                return;
            }
            set_status(server_status::disconnected);
            return;
        }

        stop_watching();
        descriptor_.status = server_status::disconnected;

        fail_all_pending(std::make_exception_ptr(
                request_cancelled_error("request cancelled: server '{}' disconnected"_format(descriptor_.name))));
        terminate_child();
        tools_.clear();
        stdout_buffer_.clear();
        stderr_buffer_.clear();

        info_log("disconnected from '", descriptor_.name, "'");
        if (previous != server_status::disconnected && status_listener_) {
            status_listener_(descriptor_);
        }
    }

    void protocol_client::stop_watching() {
        if (stdout_watch_ != 0) {
            loop_.unwatch(stdout_watch_);
            stdout_watch_ = 0;
        }
        if (stderr_watch_ != 0) {
            loop_.unwatch(stderr_watch_);
            stderr_watch_ = 0;
        }
    }

    void protocol_client::terminate_child() {
        process::close_fd(stdin_fd_);

        if (pid_ > 0) {
            auto pid = pid_;
            ::kill(pid, SIGTERM);

            auto reaped = loop_.run_until(
                    [pid] { return process::try_reap(pid); }, event_loop::clock::now() + shutdown_grace);
            if (!reaped) {
                warn_log("server '", descriptor_.name, "' ignored SIGTERM; sending SIGKILL");
                process::kill_and_reap(pid);
            }
            pid_ = -1;
        }

        if (stderr_fd_ >= 0) {
            auto tail = process::drain_fd_nonblocking(stderr_fd_);
            for (const auto& line : utils::split_lines(stderr_buffer_ + tail)) {
                if (!line.empty()) {
                    info_log("[", descriptor_.name, "] ", line);
                }
            }
        }

        process::close_fd(stdout_fd_);
        process::close_fd(stderr_fd_);
        stdout_closed_ = false;
    }

    // ── requests ────────────────────────────────────────────────────────

    call_ptr protocol_client::send_request(std::string_view method, std::string params_json) {
        if (!running()) {
            throw not_connected_error("server '{}' is not connected"_format(descriptor_.name));
        }

        auto id = next_id_++;
        auto handle = std::make_shared<call_handle>(id);
        auto timer = loop_.add_timer(
                event_loop::clock::now() + request_timeout_, [this, id, name = std::string{method}] {
                    fail(id,
                         std::make_exception_ptr(timeout_error(
                                 "request '{}' to '{}' timed out after {}"_format(
                                         name, descriptor_.name, request_timeout_))));
                });

        // registered before the first byte goes out so an immediate reply always finds its entry
        pending_.emplace(id, pending_request{.handle = handle, .timer = timer});

        try {
            write_line(jsonrpc::encode_request(id, method, params_json));
        } catch (const std::exception&) {
            if (auto it = pending_.find(id); it != pending_.end()) {
                loop_.cancel_timer(it->second.timer);
                pending_.erase(it);
            }
            throw;
        }

        return handle;
    }

    call_ptr protocol_client::start_request(std::string_view method, const json::value& params) {
        if (descriptor_.status != server_status::connected || !running()) {
            throw not_connected_error("server '{}' is not connected"_format(descriptor_.name));
        }
        return send_request(method, json::is_null(params) ? std::string{"{}"} : json::to_json(params));
    }

    json::value protocol_client::request(std::string_view method, const json::value& params) {
        auto call = start_request(method, params);

        try {
            loop_.run_until([&call] { return call->ready(); });
        } catch (const std::exception&) {
            fail(call->id(), std::current_exception());
            throw;
        }

        if (!call->ready()) {
            fail(call->id(), std::make_exception_ptr(protocol_error("event loop stopped before a response arrived")));
        }
        return call->value();
    }

    void protocol_client::notify(std::string_view method, const json::value& params) {
        if (!running()) {
            throw not_connected_error("server '{}' is not connected"_format(descriptor_.name));
        }
        write_line(jsonrpc::encode_notification(method, json::is_null(params) ? "{}" : json::to_json(params)));
    }

    call_ptr protocol_client::start_call_tool(std::string_view name, const json::value& arguments) {
        return start_request("tools/call"sv, detail::tool_call_params(name, arguments));
    }

    json::value protocol_client::call_tool(std::string_view name, const json::value& arguments) {
        auto result = request("tools/call"sv, detail::tool_call_params(name, arguments));
        if (const auto* content = json::find_member(result, "content"sv)) {
            return *content;
        }
        json::value empty{};
        empty.data = json::array_t{};
        return empty;
    }

    void protocol_client::complete(std::int64_t id, json::value result) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            debug_log("dropping response for unknown request id ", id, " from '", descriptor_.name, "'");
            return;
        }
        auto entry = std::move(it->second);
        pending_.erase(it);
        loop_.cancel_timer(entry.timer);
        entry.handle->settle(std::move(result));
    }

    void protocol_client::fail(std::int64_t id, std::exception_ptr error) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        auto entry = std::move(it->second);
        pending_.erase(it);
        loop_.cancel_timer(entry.timer);
        entry.handle->settle(std::move(error));
    }

    void protocol_client::fail_all_pending(const std::exception_ptr& error) {
        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& [id, entry] : pending) {
            loop_.cancel_timer(entry.timer);
            entry.handle->settle(error);
        }
    }

    // ── I/O ─────────────────────────────────────────────────────────────

    void protocol_client::write_line(const std::string& line) {
        std::string_view remaining{line};

        while (!remaining.empty()) {
            if (stdin_fd_ < 0) {
                throw not_connected_error("server '{}' is not connected"_format(descriptor_.name));
            }

            auto n = ::write(stdin_fd_, remaining.data(), remaining.size());
            if (n > 0) {
                remaining.remove_prefix(static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                // pipe is full: keep servicing everyone else until the child drains it
                bool writable = false;
                auto fd = stdin_fd_;
                auto watch = loop_.watch(fd, POLLOUT, [&writable](short) { writable = true; });
                auto drained = loop_.run_until(
                        [&] { return writable || stdin_fd_ < 0; }, event_loop::clock::now() + request_timeout_);
                loop_.unwatch(watch);
                if (!drained) {
                    throw timeout_error("timed out writing to server '{}'"_format(descriptor_.name));
                }
                continue;
            }
            throw protocol_error("write to server '{}' failed: {}"_format(descriptor_.name, std::strerror(errno)));
        }
    }

    void protocol_client::on_stdout_ready(short) {
        bool eof = false;
        char chunk[8192]{};

        for (;;) {
            if (stdout_fd_ < 0) {
                return;
            }
            auto n = ::read(stdout_fd_, chunk, sizeof(chunk));
            if (n > 0) {
                stdout_buffer_.append(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            }
            eof = true;
            break;
        }

        // a handler may disconnect (and close stdout_fd_) while lines remain
        size_t pos = 0;
        while (stdout_fd_ >= 0 && (pos = stdout_buffer_.find('\n')) != std::string::npos) {
            auto line = stdout_buffer_.substr(0, pos);
            stdout_buffer_.erase(0, pos + 1);
            handle_line(line);
        }

        if (eof && stdout_fd_ >= 0 && !stdout_closed_) {
            on_stdout_closed();
        }
    }

    void protocol_client::on_stdout_closed() {
        stdout_closed_ = true;
        if (stdout_watch_ != 0) {
            loop_.unwatch(stdout_watch_);
            stdout_watch_ = 0;
        }

        if (descriptor_.status == server_status::connecting) {
            fail_connect("server exited during handshake");
            return;
        }

        warn_log("server '", descriptor_.name, "' closed its output stream");
        fail_all_pending(std::make_exception_ptr(
                protocol_error("server '{}' closed the connection"_format(descriptor_.name))));
    }

    void protocol_client::on_stderr_ready(short) {
        char chunk[4096]{};
        bool eof = false;

        for (;;) {
            if (stderr_fd_ < 0) {
                return;
            }
            auto n = ::read(stderr_fd_, chunk, sizeof(chunk));
            if (n > 0) {
                stderr_buffer_.append(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            }
            eof = true;
            break;
        }

        size_t pos = 0;
        while ((pos = stderr_buffer_.find('\n')) != std::string::npos) {
            auto line = utils::trim_view(std::string_view{stderr_buffer_}.substr(0, pos));
            if (!line.empty()) {
                info_log("[", descriptor_.name, "] ", line);
            }
            stderr_buffer_.erase(0, pos + 1);
        }

        if (eof && stderr_watch_ != 0) {
            loop_.unwatch(stderr_watch_);
            stderr_watch_ = 0;
        }
    }

    void protocol_client::handle_line(std::string_view line) {
        auto message = jsonrpc::parse_line(line);
        if (!message) {
            if (!utils::trim_view(line).empty()) {
                debug_log("ignoring non json-rpc output from '", descriptor_.name, "': ", line);
            }
            return;
        }

        try {
            std::visit(
                    detail::overloaded{
                            [this](jsonrpc::success_response& r) { complete(r.id, std::move(r.result)); },
                            [this](jsonrpc::error_response& r) {
                                fail(r.id, std::make_exception_ptr(protocol_error(r.message, r.code)));
                            },
                            [this](jsonrpc::server_request& r) {
                                if (r.kind == jsonrpc::server_method::ping) {
                                    reply_to_server(r.id, jsonrpc::encode_result(r.id));
                                    return;
                                }
                                reply_to_server(
                                        r.id,
                                        jsonrpc::encode_error(
                                                r.id, glz::rpc::error_e::method_not_found, "Method not found: " + r.method));
                            },
                            [this](jsonrpc::server_notification& n) {
                                switch (n.kind) {
                                    case jsonrpc::notification_kind::tools_list_changed:
                                        if (descriptor_.status == server_status::connected) {
                                            refresh_tools();
                                        }
                                        break;
                                    case jsonrpc::notification_kind::message:
                                        info_log("[", descriptor_.name, "] ", json::to_json(n.params));
                                        break;
                                    default:
                                        debug_log("notification '", n.method, "' from '", descriptor_.name, "'");
                                        break;
                                }
                            }},
                    *message);
        } catch (const std::exception& e) {
            error_log("error handling message from '", descriptor_.name, "': ", e.what());
        }
    }

    void protocol_client::reply_to_server(const json::value& id, std::string frame) {
        try {
            write_line(frame);
        } catch (const std::exception& e) {
            warn_log("failed to answer request ", json::to_json(id), " from '", descriptor_.name, "': ", e.what());
        }
    }

}  // namespace hostmux::mcp

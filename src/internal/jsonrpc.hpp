#pragma once

#include "hostmux/json.hpp"
#include "hostmux/utils.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace hostmux::mcp::jsonrpc {

    using namespace std::string_view_literals;

    inline constexpr auto version = "2.0"sv;
    inline constexpr auto protocol_version = "2024-11-05"sv;

    // ── outbound frames ─────────────────────────────────────────────────

    // glz::rpc has no notification type: a request_t always carries an id member
    struct notification_frame {
        std::string_view jsonrpc{version};
        std::string_view method{};
        glz::raw_json params{"{}"};
    };

    template <typename Frame>
    std::string encode_line(const Frame& frame) {
        std::string line{};
        if (auto ec = glz::write_json(frame, line)) {
            throw std::runtime_error("failed to encode json-rpc frame");
        }
        line.push_back('\n');
        return line;
    }

    // echoes a server-chosen id; anything but a string or an integer becomes null
    inline glz::rpc::id_t to_rpc_id(const json::value& id) {
        glz::rpc::id_t out{};
        if (const auto* text = json::as_string(id)) {
            out = *text;
        }
        else if (auto number = json::integer_value(id)) {
            out = *number;
        }
        return out;
    }

    inline std::string encode_request(std::int64_t id, std::string_view method, std::string_view params_json) {
        glz::rpc::request_t<glz::raw_json> request{};
        request.id = id;
        request.method = method;
        request.params = glz::raw_json{params_json.empty() ? "{}"sv : params_json};
        return encode_line(request);
    }

    inline std::string encode_notification(std::string_view method, std::string_view params_json) {
        return encode_line(
                notification_frame{.method = method, .params = glz::raw_json{params_json.empty() ? "{}"sv : params_json}});
    }

    inline std::string encode_result(const json::value& id, std::string_view result_json = "{}"sv) {
        glz::rpc::response_t<glz::raw_json> response{};
        response.id = to_rpc_id(id);
        response.result = glz::raw_json{result_json};
        return encode_line(response);
    }

    inline std::string encode_error(const json::value& id, glz::rpc::error_e code, const std::string& message) {
        glz::rpc::response_t<glz::raw_json> response{};
        response.id = to_rpc_id(id);
        response.error = glz::rpc::error{code, std::nullopt, message};
        return encode_line(response);
    }

    // ── inbound classification ──────────────────────────────────────────

    enum class server_method : uint8_t {
        ping,
        unknown,
    };

    enum class notification_kind : uint8_t {
        tools_list_changed,
        message,
        progress,
        cancelled,
        unknown,
    };

    inline constexpr server_method classify_server_method(std::string_view method) {
        if (method == "ping"sv) {
            return server_method::ping;
        }
        return server_method::unknown;
    }

    inline constexpr notification_kind classify_notification(std::string_view method) {
        if (method == "notifications/tools/list_changed"sv) {
            return notification_kind::tools_list_changed;
        }
        if (method == "notifications/message"sv) {
            return notification_kind::message;
        }
        if (method == "notifications/progress"sv) {
            return notification_kind::progress;
        }
        if (method == "notifications/cancelled"sv) {
            return notification_kind::cancelled;
        }
        return notification_kind::unknown;
    }

    struct success_response {
        std::int64_t id{};
        json::value result{};
    };

    struct error_response {
        std::int64_t id{};
        int code{};
        std::string message{};
    };

    struct server_request {
        json::value id{};
        server_method kind{server_method::unknown};
        std::string method{};
        json::value params{};
    };

    struct server_notification {
        notification_kind kind{notification_kind::unknown};
        std::string method{};
        json::value params{};
    };

    using inbound_message = std::variant<success_response, error_response, server_request, server_notification>;

    /*
     * Classifies one newline-delimited frame.
     * Returns nullopt for anything that is not a usable JSON-RPC 2.0 message: malformed JSON,
     * a non-object, a response whose id is not an integer, or a frame with neither a method
     * nor a result/error member.
     */
    inline std::optional<inbound_message> parse_line(std::string_view line) {
        line = utils::trim_view(line);
        if (line.empty()) {
            return std::nullopt;
        }

        auto parsed = json::try_parse_json(line);
        if (!parsed || json::as_object(*parsed) == nullptr) {
            return std::nullopt;
        }
        const auto& msg = *parsed;

        const auto* id = json::find_member(msg, "id"sv);
        auto method = json::string_member(msg, "method"sv);

        if (method) {
            const auto* params = json::find_member(msg, "params"sv);
            auto params_value = params != nullptr ? *params : json::make_object();
            if (id != nullptr && !json::is_null(*id)) {
                return server_request{
                        .id = *id,
                        .kind = classify_server_method(*method),
                        .method = std::move(*method),
                        .params = std::move(params_value)};
            }
            return server_notification{
                    .kind = classify_notification(*method), .method = std::move(*method), .params = std::move(params_value)};
        }

        if (id == nullptr) {
            return std::nullopt;
        }
        auto numeric_id = json::integer_value(*id);
        if (!numeric_id) {
            return std::nullopt;
        }

        if (const auto* error = json::find_member(msg, "error"sv); error != nullptr && !json::is_null(*error)) {
            error_response out{.id = *numeric_id};
            if (const auto* code = json::find_member(*error, "code"sv)) {
                out.code = static_cast<int>(json::integer_value(*code).value_or(0));
            }
            out.message = json::string_member(*error, "message"sv).value_or("Unknown error");
            return out;
        }

        if (const auto* result = json::find_member(msg, "result"sv)) {
            return success_response{.id = *numeric_id, .result = *result};
        }

        // a response without result is treated as an empty result
        return success_response{.id = *numeric_id, .result = json::make_object()};
    }

}  // namespace hostmux::mcp::jsonrpc

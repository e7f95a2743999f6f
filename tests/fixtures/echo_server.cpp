// Minimal MCP server used by the test-suite: JSON-RPC 2.0 over stdio, one message per line.

#include "hostmux/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace hostmux::literals;
using namespace std::string_view_literals;

namespace echo_server {

    struct options {
        std::string name{"echo"};
        bool exit_on_initialize{false};
        bool ignore_term{false};
        bool stderr_noise{false};
        bool ping_client{false};
        bool garbage{false};
    };

    struct server_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = server_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_result {
        std::string protocolVersion{"2024-11-05"};
        glz::raw_json capabilities{R"({"tools":{}})"};
        server_info serverInfo{};
        struct glaze {
            using T = initialize_result;
            static constexpr auto value = glz::object(
                    "protocolVersion", &T::protocolVersion, "capabilities", &T::capabilities, "serverInfo",
                    &T::serverInfo);
        };
    };

    struct tool_definition {
        std::string name{};
        std::string description{};
        glz::raw_json inputSchema{};
        struct glaze {
            using T = tool_definition;
            static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
        };
    };

    struct tools_list_result {
        std::vector<tool_definition> tools{};
        struct glaze {
            using T = tools_list_result;
            static constexpr auto value = glz::object(&T::tools);
        };
    };

    struct tool_call_params {
        std::string name{};
        glz::raw_json arguments{"{}"};
        struct glaze {
            using T = tool_call_params;
            static constexpr auto value = glz::object(&T::name, &T::arguments);
        };
    };

    struct echo_args {
        std::string message{};
        bool defer{false};
        struct glaze {
            using T = echo_args;
            static constexpr auto value = glz::object(&T::message, &T::defer);
        };
    };

    struct env_args {
        std::string name{};
        struct glaze {
            using T = env_args;
            static constexpr auto value = glz::object(&T::name);
        };
    };

    struct content_block {
        std::string type{"text"};
        std::optional<std::string> text{};
        std::optional<std::string> data{};
        std::optional<std::string> mimeType{};
        struct glaze {
            using T = content_block;
            static constexpr auto value =
                    glz::object(&T::type, &T::text, &T::data, "mimeType", &T::mimeType);
        };
    };

    struct tool_call_result {
        std::vector<content_block> content{};
        bool isError{false};
        struct glaze {
            using T = tool_call_result;
            static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
        };
    };

    static content_block text_block(std::string text) {
        return content_block{.text = std::move(text)};
    }

    template <typename T>
    static std::string make_response(const glz::rpc::id_t& id, T&& result) {
        glz::rpc::response_t<std::decay_t<T>> resp{};
        resp.id = id;
        resp.result = std::forward<T>(result);
        std::string json{};
        (void)glz::write_json(resp, json);
        return json;
    }

    static std::string make_error_response(const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
        glz::rpc::response_t<glz::raw_json> resp{};
        resp.id = id;
        resp.error = glz::rpc::error{code, std::nullopt, message};
        std::string json{};
        (void)glz::write_json(resp, json);
        return json;
    }

    class server {
      public:
        explicit server(options opts) : opts_{std::move(opts)} {}

        int run() {
            std::string line{};
            while (std::getline(std::cin, line)) {
                if (line.empty()) {
                    continue;
                }
                if (!handle(line) || stop_) {
                    return 0;
                }
            }
            return 0;
        }

      private:
        void send(const std::string& json) {
            if (opts_.garbage) {
                std::cout << "this line is not json-rpc\n";
            }
            std::cout << json << '\n';
            std::cout.flush();
        }

        // answers go out before anything that was deferred, so deferred replies arrive out of order
        void reply(const std::string& json) {
            send(json);
            for (const auto& held : deferred_) {
                send(held);
            }
            deferred_.clear();
        }

        bool is_client_response(std::string_view line) {
            glz::generic msg{};
            if (glz::read_json(msg, line)) {
                return false;
            }
            const auto* obj = std::get_if<glz::generic::object_t>(&msg.data);
            return obj != nullptr && !obj->contains("method") && (obj->contains("result") || obj->contains("error"));
        }

        bool handle(std::string_view line) {
            if (is_client_response(line)) {
                ++pongs_;
                return true;
            }

            glz::rpc::generic_request_t request{};
            auto ec = glz::read_json(request, line);
            if (ec) {
                send(make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error"));
                return true;
            }

            bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);
            if (opts_.stderr_noise) {
                std::cerr << opts_.name << ": " << request.method << '\n';
            }

            if (request.method == "initialize"sv) {
                if (opts_.exit_on_initialize) {
                    return false;
                }
                initialize_result result{};
                result.serverInfo = server_info{.name = opts_.name, .version = "0.1.0"};
                reply(make_response(request.id, std::move(result)));
            }
            else if (request.method == "notifications/initialized"sv) {
                // notification, no response
            }
            else if (request.method == "tools/list"sv) {
                if (opts_.ping_client) {
                    send(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
                    send(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info","data":"hello"}})");
                    send(R"({"jsonrpc":"2.0","id":"srv-2","method":"sampling/createMessage","params":{}})");
                }
                reply(make_response(request.id, tools()));
            }
            else if (request.method == "tools/call"sv) {
                handle_tools_call(request.id, request.params);
            }
            else if (!is_notification) {
                reply(make_error_response(
                        request.id,
                        glz::rpc::error_e::method_not_found,
                        "Unknown method: {}"_format(std::string{request.method})));
            }
            return true;
        }

        tools_list_result tools() const {
            static constexpr auto object_schema = R"({"type":"object"})"sv;
            tools_list_result result{};
            result.tools.push_back({.name = "echo",
                                    .description = "Echo the message back",
                                    .inputSchema = glz::raw_json{
                                            R"({"type":"object","properties":{"message":{"type":"string"}},"required":["message"]})"}});
            result.tools.push_back(
                    {.name = "x", .description = "Answer with the server name", .inputSchema = glz::raw_json{object_schema}});
            result.tools.push_back(
                    {.name = "fail", .description = "Always fails", .inputSchema = glz::raw_json{object_schema}});
            result.tools.push_back(
                    {.name = "blocks", .description = "Mixed content blocks", .inputSchema = glz::raw_json{object_schema}});
            result.tools.push_back(
                    {.name = "env", .description = "Read an environment variable", .inputSchema = glz::raw_json{object_schema}});
            result.tools.push_back(
                    {.name = "pongs", .description = "Count client responses", .inputSchema = glz::raw_json{object_schema}});
            result.tools.push_back(
                    {.name = "empty", .description = "Return no content", .inputSchema = glz::raw_json{object_schema}});
            result.tools.push_back(
                    {.name = "crash", .description = "Exit without answering", .inputSchema = glz::raw_json{object_schema}});
            result.tools.push_back(
                    {.name = "grow", .description = "Advertise the `extra` tool", .inputSchema = glz::raw_json{object_schema}});
            if (grown_) {
                result.tools.push_back(
                        {.name = "extra", .description = "Added by grow", .inputSchema = glz::raw_json{object_schema}});
            }
            return result;
        }

        void handle_tools_call(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            tool_call_params params{};
            if (glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str)) {
                reply(make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params"));
                return;
            }

            tool_call_result result{};
            if (params.name == "echo") {
                echo_args args{};
                if (glz::read<glz::opts{.error_on_unknown_keys = false}>(args, params.arguments.str)) {
                    reply(make_error_response(id, glz::rpc::error_e::invalid_params, "echo requires a message"));
                    return;
                }
                result.content.push_back(text_block(args.message));
                if (args.defer) {
                    deferred_.push_back(make_response(id, std::move(result)));
                    return;
                }
            }
            else if (params.name == "x") {
                result.content.push_back(text_block(opts_.name));
            }
            else if (params.name == "fail") {
                reply(make_error_response(id, glz::rpc::error_e::internal, "tool failed on purpose"));
                return;
            }
            else if (params.name == "blocks") {
                result.content.push_back(text_block("first"));
                result.content.push_back(
                        content_block{.type = "image", .data = "iVBORw0KGgo=", .mimeType = "image/png"});
                result.content.push_back(text_block("second"));
            }
            else if (params.name == "env") {
                env_args args{};
                (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(args, params.arguments.str);
                const char* value = args.name.empty() ? nullptr : std::getenv(args.name.c_str());
                result.content.push_back(text_block(value != nullptr ? value : ""));
            }
            else if (params.name == "pongs") {
                result.content.push_back(text_block(std::to_string(pongs_)));
            }
            else if (params.name == "empty") {
                // no blocks
            }
            else if (params.name == "crash") {
                stop_ = true;
                return;
            }
            else if (params.name == "grow") {
                grown_ = true;
                send(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
                result.content.push_back(text_block("grown"));
            }
            else if (params.name == "extra" && grown_) {
                result.content.push_back(text_block("extra"));
            }
            else {
                reply(make_error_response(id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name)));
                return;
            }

            reply(make_response(id, std::move(result)));
        }

        options opts_{};
        std::vector<std::string> deferred_{};
        int pongs_{0};
        bool grown_{false};
        bool stop_{false};
    };

}  // namespace echo_server

int main(int argc, char** argv) {
    echo_server::options opts{};

    CLI::App app{"hostmux test MCP server"};
    app.add_option("--name", opts.name, "Name reported by the `x` tool");
    app.add_flag("--exit-on-initialize", opts.exit_on_initialize, "Exit instead of answering initialize");
    app.add_flag("--ignore-term", opts.ignore_term, "Ignore SIGTERM and keep running after stdin closes");
    app.add_flag("--stderr-noise", opts.stderr_noise, "Log every method to stderr");
    app.add_flag("--ping-client", opts.ping_client, "Send server-initiated requests during tools/list");
    app.add_flag("--garbage", opts.garbage, "Interleave non json-rpc lines with responses");
    CLI11_PARSE(app, argc, argv);

    ::signal(SIGPIPE, SIG_IGN);
    if (opts.ignore_term) {
        ::signal(SIGTERM, SIG_IGN);
    }

    echo_server::server srv{opts};
    auto rc = srv.run();

    if (opts.ignore_term) {
        for (;;) {
            ::pause();
        }
    }
    return rc;
}

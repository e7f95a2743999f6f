#include "utils.hpp"

#include <set>

namespace hostmux::test {
    using namespace std::string_view_literals;
    using namespace hostmux::literals;

    TEST_CASE("008: registration assigns ids and rejects duplicates", "[008][aggregator]") {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        mcp::aggregator registry{loop, resolver};

        const auto& first = registry.register_server(detail::echo_server("a"));
        CHECK(first.id.size() == 36U);
        CHECK(first.name == "a");
        CHECK(first.status == server_status::disconnected);

        auto pinned = detail::echo_server("b");
        pinned.id = "fixed-id";
        const auto& second = registry.register_server(pinned);
        CHECK(second.id == "fixed-id");
        CHECK(registry.size() == 2U);

        CHECK_THROWS_AS(registry.register_server(pinned), std::invalid_argument);
        CHECK(registry.size() == 2U);

        auto nameless = detail::echo_server("");
        nameless.name.clear();
        const auto& third = registry.register_server(nameless);
        CHECK(third.name == third.id);

        auto listed = registry.list_servers();
        REQUIRE(listed.size() == 3U);
        CHECK(listed[0].name == "a");
        CHECK(listed[1].id == "fixed-id");
    }

    TEST_CASE("008: servers are found by id or display name", "[008][aggregator]") {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        mcp::aggregator registry{loop, resolver};

        auto id = registry.register_server(detail::echo_server("GitHub")).id;

        REQUIRE(registry.find_server(id) != nullptr);
        REQUIRE(registry.find_server("github"sv) != nullptr);
        CHECK(registry.find_server("github"sv)->id == id);
        CHECK(registry.get_server("github"sv) == nullptr);
        CHECK(registry.find_server("gitlab"sv) == nullptr);
    }

    TEST_CASE("008: the first registered server answers a shared tool name", "[008][aggregator]") {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        mcp::aggregator registry{loop, resolver};

        auto a = registry.register_server(detail::echo_server("a")).id;
        auto b = registry.register_server(detail::echo_server("b")).id;

        auto results = registry.connect_all();
        REQUIRE(results.size() == 2U);
        CHECK(results.at(a));
        CHECK(results.at(b));

        CHECK(detail::first_text(registry.call_tool("x"sv, json::make_object())) == "a");

        auto route = registry.find_tool("x"sv);
        REQUIRE(route);
        CHECK(route->client->id() == a);
        CHECK(route->tool->server == a);

        // both catalogs are listed, in registration order
        auto tools = registry.list_tools();
        REQUIRE(tools.size() == 18U);
        CHECK(tools.front().server == a);
        CHECK(tools.back().server == b);

        // once the first server goes away the second one takes over
        registry.disconnect(a);
        CHECK(detail::first_text(registry.call_tool("x"sv, json::make_object())) == "b");
        CHECK(registry.list_tools().size() == 9U);

        REQUIRE(registry.connect(a));
        CHECK(detail::first_text(registry.call_tool("x"sv, json::make_object())) == "a");
    }

    TEST_CASE("008: unknown tools raise tool_not_found_error", "[008][aggregator]") {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        mcp::aggregator registry{loop, resolver};

        CHECK_THROWS_AS(registry.call_tool("echo"sv, json::make_object()), mcp::tool_not_found_error);

        registry.register_server(detail::echo_server("a"));
        // registered but not connected: its tools are not routable
        CHECK_THROWS_AS(registry.call_tool("echo"sv, json::make_object()), mcp::tool_not_found_error);

        registry.connect_all();
        try {
            registry.call_tool("nonexistent"sv, json::make_object());
            FAIL("expected tool_not_found_error");
        } catch (const mcp::tool_not_found_error& e) {
            CHECK(std::string_view{e.what()} == "Tool not found: nonexistent");
            CHECK(e.tool_name == "nonexistent");
        }
        CHECK_THROWS_AS(registry.start_call_tool("nonexistent"sv, json::make_object()), mcp::tool_not_found_error);
    }

    TEST_CASE("008: connect_all reports each server and skips disabled ones", "[008][aggregator]") {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        detail::captured_log log{log_level::error};
        mcp::aggregator registry{loop, resolver};

        auto good = registry.register_server(detail::echo_server("good")).id;
        auto bad = registry.register_server(server_descriptor{.name = "bad", .command = "/nonexistent/server"}).id;
        auto quitter = registry.register_server(detail::echo_server("quitter", {"--exit-on-initialize"})).id;

        auto disabled = detail::echo_server("off");
        disabled.enabled = false;
        auto off = registry.register_server(disabled).id;

        auto results = registry.connect_all();
        REQUIRE(results.size() == 3U);
        CHECK(results.at(good));
        CHECK_FALSE(results.at(bad));
        CHECK_FALSE(results.at(quitter));
        CHECK_FALSE(results.contains(off));

        CHECK(registry.get_server(good)->status == server_status::connected);
        CHECK(registry.get_server(bad)->status == server_status::error);
        CHECK(registry.get_server(bad)->last_error.has_value());
        CHECK(registry.get_server(off)->status == server_status::disconnected);

        // one failure does not affect the others
        CHECK(detail::first_text(registry.call_tool("x"sv, json::make_object())) == "good");
    }

    TEST_CASE("008: unregistering disconnects and forgets the server", "[008][aggregator]") {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        mcp::aggregator registry{loop, resolver};

        auto id = registry.register_server(detail::echo_server("a")).id;
        REQUIRE(registry.connect(id));
        auto pid = registry.client(id)->pid();

        CHECK(registry.unregister_server(id));
        CHECK(detail::pid_gone(pid));
        CHECK(registry.size() == 0U);
        CHECK(registry.get_server(id) == nullptr);
        CHECK_FALSE(registry.unregister_server(id));
        CHECK_FALSE(registry.connect("no-such-id"sv));
        CHECK_THROWS_AS(registry.call_tool("x"sv, json::make_object()), mcp::tool_not_found_error);
    }

    TEST_CASE("008: status changes are published to every listener", "[008][aggregator]") {
        event_loop loop{};
        secrets::secret_resolver resolver{};
        mcp::aggregator registry{loop, resolver};

        std::vector<std::string> events{};
        std::set<server_id> seen_ids{};
        registry.on_status_change([&](const server_descriptor& d) {
            events.push_back("{}:{}"_format(d.name, d.status));
        });
        registry.on_status_change([&](const server_descriptor& d) { seen_ids.insert(d.id); });

        auto id = registry.register_server(detail::echo_server("a")).id;
        REQUIRE(registry.connect(id));
        registry.disconnect_all();

        CHECK(events == std::vector<std::string>{"a:connecting", "a:connected", "a:disconnected"});
        CHECK(seen_ids == std::set<server_id>{id});
    }

}  // namespace hostmux::test

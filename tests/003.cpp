#include "utils.hpp"

#include <cctype>

namespace hostmux::test {
    using namespace std::string_view_literals;

    namespace detail {
        // stands in for secret-tool: only github/octocat exists
        static constexpr auto fake_secret_tool = R"(#!/bin/sh
if [ "$1" = "lookup" ] && [ "$3" = "github" ] && [ "$5" = "octocat" ]; then
    printf 'ghp_from_keyring\n'
    exit 0
fi
echo "No matching secret" >&2
exit 1
)"sv;

        struct upper_provider final : secrets::secret_provider {
            std::string_view scheme() const override { return "upper"sv; }
            std::string get_secret(std::string_view reference) const override {
                std::string out{secrets::split_reference(reference).second};
                std::ranges::transform(out, out.begin(), [](char c) { return static_cast<char>(std::toupper(c)); });
                return out;
            }
        };

        struct throwing_provider final : secrets::secret_provider {
            std::string_view scheme() const override { return "boom"sv; }
            std::string get_secret(std::string_view) const override { throw std::runtime_error("store offline"); }
        };
    }  // namespace detail

    TEST_CASE("003: split_reference separates scheme and path", "[003][secrets]") {
        auto [scheme, rest] = secrets::split_reference("keyring://github/octocat"sv);
        CHECK(scheme == "keyring"sv);
        CHECK(rest == "github/octocat"sv);

        auto [plain_scheme, plain] = secrets::split_reference("just-a-value"sv);
        CHECK(plain_scheme.empty());
        CHECK(plain == "just-a-value"sv);

        auto [leading_scheme, leading] = secrets::split_reference("://nothing"sv);
        CHECK(leading_scheme.empty());
        CHECK(leading == "://nothing"sv);
    }

    TEST_CASE("003: env references resolve from the host environment", "[003][secrets]") {
        REQUIRE(::setenv("HOSTMUX_TEST_SECRET", "s3cr3t", 1) == 0);
        ::unsetenv("HOSTMUX_TEST_MISSING");

        secrets::secret_resolver resolver{};
        detail::captured_log log{log_level::warning};

        auto resolved = resolver.resolve({
                {"TOKEN", "env://HOSTMUX_TEST_SECRET"},
                {"MISSING", "env://HOSTMUX_TEST_MISSING"},
                {"PLAIN", "literal value"},
                {"URL", "https://example.com"},
        });

        CHECK(resolved.at("TOKEN") == "s3cr3t");
        CHECK(resolved.at("MISSING").empty());
        CHECK(resolved.at("PLAIN") == "literal value");
        CHECK(resolved.at("URL") == "https://example.com");
        CHECK(log.str().find("HOSTMUX_TEST_MISSING") != std::string::npos);

        ::unsetenv("HOSTMUX_TEST_SECRET");
    }

    TEST_CASE("003: keyring references go through the lookup command", "[003][secrets]") {
        detail::temp_dir temp{"hostmux_test_003"};
        auto tool = temp.path / "fake-secret-tool";
        detail::write_script(tool, detail::fake_secret_tool);

        secrets::secret_resolver resolver{};
        resolver.add_provider(std::make_unique<secrets::keyring_provider>(tool.string()));
        detail::captured_log log{log_level::warning};

        auto resolved = resolver.resolve({
                {"GITHUB_TOKEN", "keyring://github/octocat"},
                {"OTHER", "keyring://github/nobody"},
                {"BROKEN", "keyring://no-username"},
        });

        CHECK(resolved.at("GITHUB_TOKEN") == "ghp_from_keyring");
        CHECK(resolved.at("OTHER").empty());
        CHECK(resolved.at("BROKEN").empty());

        auto text = log.str();
        CHECK(text.find("'OTHER'") != std::string::npos);
        CHECK(text.find("'BROKEN'") != std::string::npos);
        CHECK(text.find("ghp_from_keyring") == std::string::npos);
    }

    TEST_CASE("003: keyring provider reports failures by throwing", "[003][secrets]") {
        secrets::keyring_provider provider{"/nonexistent/secret-tool"};
        CHECK(provider.scheme() == "keyring"sv);
        CHECK_THROWS_AS(provider.get_secret("keyring://svc"sv), std::invalid_argument);
        CHECK_THROWS_AS(provider.get_secret("keyring://svc/user"sv), std::runtime_error);
    }

    TEST_CASE("003: a stalled keyring lookup is abandoned", "[003][secrets]") {
        using namespace std::chrono_literals;

        detail::temp_dir temp{"hostmux_test_003_slow"};
        auto tool = temp.path / "stalled-secret-tool";
        detail::write_script(tool, "#!/bin/sh\nexec sleep 30\n"sv);

        secrets::secret_resolver resolver{};
        resolver.add_provider(std::make_unique<secrets::keyring_provider>(tool.string(), 200));
        detail::captured_log log{log_level::warning};

        auto start = std::chrono::steady_clock::now();
        auto resolved = resolver.resolve({{"TOKEN", "keyring://github/octocat"}});
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(resolved.at("TOKEN").empty());
        CHECK(elapsed < 5s);
        CHECK(log.str().find("timed out") != std::string::npos);
    }

    TEST_CASE("003: providers are pluggable per scheme", "[003][secrets]") {
        std::vector<std::unique_ptr<secrets::secret_provider>> providers{};
        providers.push_back(std::make_unique<detail::upper_provider>());
        providers.push_back(std::make_unique<detail::throwing_provider>());
        secrets::secret_resolver resolver{std::move(providers)};

        CHECK(resolver.has_scheme("upper"sv));
        CHECK_FALSE(resolver.has_scheme("env"sv));

        detail::captured_log log{log_level::error};
        auto resolved = resolver.resolve({
                {"A", "upper://abc"},
                {"B", "boom://anything"},
                {"C", "env://HOME"},
        });

        CHECK(resolved.at("A") == "ABC");
        CHECK(resolved.at("B").empty());
        // env:// is not registered on this resolver, so the reference passes through
        CHECK(resolved.at("C") == "env://HOME");
    }

    TEST_CASE("003: resolved values take precedence over the inherited environment", "[003][secrets]") {
        secrets::env_map inherited{{"PATH", "/usr/bin"}, {"TOKEN", "inherited"}};
        auto merged = secrets::merge_environment(inherited, {{"TOKEN", "resolved"}, {"EXTRA", "1"}});

        CHECK(merged.at("PATH") == "/usr/bin");
        CHECK(merged.at("TOKEN") == "resolved");
        CHECK(merged.at("EXTRA") == "1");
    }

}  // namespace hostmux::test

#include "hostmux/secrets.hpp"

#include "hostmux/format.hpp"

#include "internal/process.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace hostmux::literals;

namespace hostmux::secrets {

    namespace detail {
        static constexpr auto scheme_separator = "://"sv;
    }  // namespace detail

    std::pair<std::string_view, std::string_view> split_reference(std::string_view value) {
        auto pos = value.find(detail::scheme_separator);
        if (pos == std::string_view::npos || pos == 0) {
            return {{}, value};
        }
        return {value.substr(0, pos), value.substr(pos + detail::scheme_separator.size())};
    }

    env_map merge_environment(env_map inherited, const env_map& resolved) {
        for (const auto& [key, value] : resolved) {
            inherited.insert_or_assign(key, value);
        }
        return inherited;
    }

    // ── env:// ──────────────────────────────────────────────────────────

    std::string_view env_provider::scheme() const {
        return "env"sv;
    }

    std::string env_provider::get_secret(std::string_view reference) const {
        auto [scheme, var_name] = split_reference(reference);
        if (scheme != "env"sv) {
            return {};
        }
        if (var_name.empty()) {
            throw std::invalid_argument("empty variable name in env reference");
        }

        const char* value = std::getenv(std::string{var_name}.c_str());
        if (value == nullptr || *value == '\0') {
            warn_log("environment variable '", var_name, "' is empty or not set");
            return {};
        }
        return value;
    }

    // ── keyring:// ──────────────────────────────────────────────────────

    keyring_provider::keyring_provider(std::string lookup_command, int timeout_ms)
            : lookup_command_{std::move(lookup_command)}, timeout_ms_{timeout_ms} {}

    std::string_view keyring_provider::scheme() const {
        return "keyring"sv;
    }

    std::string keyring_provider::get_secret(std::string_view reference) const {
        auto [scheme, path] = split_reference(reference);
        if (scheme != "keyring"sv) {
            return {};
        }

        auto slash = path.find('/');
        if (slash == std::string_view::npos || slash == 0 || slash + 1 == path.size()) {
            throw std::invalid_argument(
                    "invalid keyring reference: {} (expected keyring://service/username)"_format(reference));
        }
        auto service = std::string{path.substr(0, slash)};
        auto username = std::string{path.substr(slash + 1)};

        auto proc = internal::process::run_subprocess(
                {lookup_command_, "lookup", "service", service, "username", username}, timeout_ms_);
        if (proc.timed_out) {
            throw std::runtime_error("keyring lookup timed out for {}/{}"_format(service, username));
        }
        if (proc.exit_code != 0) {
            auto detail = std::string{utils::trim_view(proc.stderr_output)};
            throw std::runtime_error(
                    "secret not found in keyring: {}/{}{}"_format(
                            service, username, detail.empty() ? std::string{} : " (" + detail + ")"));
        }

        // secret-tool prints the secret verbatim, without a trailing newline when stdout is a pipe
        auto secret = std::move(proc.stdout_output);
        while (!secret.empty() && (secret.back() == '\n' || secret.back() == '\r')) {
            secret.pop_back();
        }
        if (secret.empty()) {
            throw std::runtime_error("secret not found in keyring: {}/{}"_format(service, username));
        }
        return secret;
    }

    // ── resolver ────────────────────────────────────────────────────────

    secret_resolver::secret_resolver() {
        add_provider(std::make_unique<env_provider>());
        add_provider(std::make_unique<keyring_provider>());
    }

    secret_resolver::secret_resolver(std::vector<std::unique_ptr<secret_provider>> providers) {
        for (auto& provider : providers) {
            add_provider(std::move(provider));
        }
    }

    void secret_resolver::add_provider(std::unique_ptr<secret_provider> provider) {
        if (!provider) {
            return;
        }
        std::erase_if(providers_, [&](const auto& existing) { return existing->scheme() == provider->scheme(); });
        providers_.push_back(std::move(provider));
    }

    bool secret_resolver::has_scheme(std::string_view scheme) const {
        return find_provider(scheme) != nullptr;
    }

    const secret_provider* secret_resolver::find_provider(std::string_view scheme) const {
        for (const auto& provider : providers_) {
            if (provider->scheme() == scheme) {
                return provider.get();
            }
        }
        return nullptr;
    }

    env_map secret_resolver::resolve(const env_map& env) const {
        env_map resolved{};

        for (const auto& [key, value] : env) {
            auto [scheme, rest] = split_reference(value);
            const auto* provider = scheme.empty() ? nullptr : find_provider(scheme);
            if (provider == nullptr) {
                resolved.emplace(key, value);
                continue;
            }

            try {
                resolved.emplace(key, provider->get_secret(value));
            } catch (const std::exception& e) {
                // the child sees an empty value and reports its own auth failure
                warn_log("failed to resolve secret '", key, "' (", scheme, "://): ", e.what());
                resolved.emplace(key, std::string{});
            }
        }

        return resolved;
    }

}  // namespace hostmux::secrets

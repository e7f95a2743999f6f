#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hostmux::secrets {

    using env_map = std::map<std::string, std::string>;

    /*
     * Resolves one secret reference of the form `<scheme>://<path>`.
     * get_secret() throws on any failure; the resolver decides how failures degrade.
     */
    class secret_provider {
      public:
        virtual ~secret_provider() = default;

        virtual std::string_view scheme() const = 0;
        virtual std::string get_secret(std::string_view reference) const = 0;
    };

    // env://VAR_NAME
    class env_provider final : public secret_provider {
      public:
        std::string_view scheme() const override;
        std::string get_secret(std::string_view reference) const override;
    };

    /*
     * keyring://service/username, looked up through the Secret Service `secret-tool` CLI.
     * The lookup runs to completion before the server is spawned and blocks the event loop
     * meanwhile, so a stalled keyring delays every handshake started after it by `timeout_ms`.
     */
    class keyring_provider final : public secret_provider {
      public:
        explicit keyring_provider(std::string lookup_command = "secret-tool", int timeout_ms = 3'000);

        std::string_view scheme() const override;
        std::string get_secret(std::string_view reference) const override;

      private:
        std::string lookup_command_{};
        int timeout_ms_{};
    };

    class secret_resolver {
      public:
        // registers env:// and keyring://
        secret_resolver();
        explicit secret_resolver(std::vector<std::unique_ptr<secret_provider>> providers);

        // replaces any provider already registered for the same scheme
        void add_provider(std::unique_ptr<secret_provider> provider);

        // never throws for a single bad reference: the key resolves to "" and a warning is logged
        env_map resolve(const env_map& env) const;

        bool has_scheme(std::string_view scheme) const;

      private:
        const secret_provider* find_provider(std::string_view scheme) const;

        std::vector<std::unique_ptr<secret_provider>> providers_{};
    };

    // splits "scheme://rest"; empty scheme when `value` carries none
    std::pair<std::string_view, std::string_view> split_reference(std::string_view value);

    // child environment: `inherited` overlaid with `resolved`, resolved values win
    env_map merge_environment(env_map inherited, const env_map& resolved);

}  // namespace hostmux::secrets

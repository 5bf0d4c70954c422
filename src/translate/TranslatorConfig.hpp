#pragma once

#include "KeyPairStore.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <toml++/toml.h>

namespace translate
{

inline constexpr const char* kDefaultUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36";

// Hosts known to serve the front-end page and /translate_a/single
std::vector<std::string> defaultServiceUrls();

struct TranslatorConfig
{
    std::vector<std::string> service_urls;  // one is picked per client; empty -> translate.google.com
    std::vector<std::string> user_agents;   // one is picked per client; empty -> kDefaultUserAgent
    std::string proxy;
    bool verify_tls = true;
    int connect_timeout_ms = 5000;
    int timeout_ms = 30000;
    std::optional<std::uint64_t> seed;      // host/user-agent selection; random when unset
    bool invalidate_key_on_reject = true;   // drop the cached key pair after a 4xx from the endpoint
    KeyPairSettings key_pair;

    // Reads the [translator] section; keys that are absent or of the wrong type keep their defaults
    static TranslatorConfig fromToml(const toml::table& section);
};

} // namespace translate

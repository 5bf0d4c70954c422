#include "TranslatorConfig.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <limits>

namespace
{

std::vector<std::string> read_string_list(const toml::table& t, const char* key)
{
    std::vector<std::string> out;
    if (auto* arr = t[key].as_array())
    {
        for (const auto& node : *arr)
        {
            if (auto v = node.value<std::string>())
            {
                if (!v->empty())
                    out.push_back(*v);
            }
            else
            {
                PLOG_WARNING << "Ignoring non-string entry in translator." << key;
            }
        }
    }
    return out;
}

int clamp_timeout_ms(std::int64_t v)
{
    return static_cast<int>(std::clamp<std::int64_t>(v, 1, std::numeric_limits<int>::max()));
}

} // namespace

namespace translate
{

std::vector<std::string> defaultServiceUrls()
{
    return {
        "translate.google.com",
        "translate.google.co.kr",
        "translate.google.co.jp",
        "translate.google.com.hk",
        "translate.google.com.tw",
        "translate.google.de",
        "translate.google.fr",
        "translate.google.co.uk",
    };
}

TranslatorConfig TranslatorConfig::fromToml(const toml::table& t)
{
    TranslatorConfig cfg;
    cfg.service_urls = read_string_list(t, "service_urls");
    cfg.user_agents = read_string_list(t, "user_agents");

    if (auto v = t["proxy"].value<std::string>())
        cfg.proxy = *v;
    if (auto v = t["verify_tls"].value<bool>())
        cfg.verify_tls = *v;
    if (auto v = t["connect_timeout_ms"].value<int64_t>())
        cfg.connect_timeout_ms = clamp_timeout_ms(*v);
    if (auto v = t["timeout_ms"].value<int64_t>())
        cfg.timeout_ms = clamp_timeout_ms(*v);
    if (auto v = t["seed"].value<int64_t>())
        cfg.seed = static_cast<std::uint64_t>(*v);
    if (auto v = t["invalidate_key_on_reject"].value<bool>())
        cfg.invalidate_key_on_reject = *v;

    if (auto* kp = t["key_pair"].as_table())
    {
        if (auto v = (*kp)["key_name"].value<std::string>())
            cfg.key_pair.key_name = *v;
        if (auto v = (*kp)["max_age_seconds"].value<int64_t>())
            cfg.key_pair.max_age = std::chrono::seconds(*v < 0 ? 0 : *v);
        if (auto v = (*kp)["fallback_retry_seconds"].value<int64_t>())
            cfg.key_pair.fallback_retry = std::chrono::seconds(*v < 0 ? 0 : *v);
    }
    return cfg;
}

} // namespace translate

#include "HttpCommon.hpp"

#include <cpr/cpr.h>

namespace
{

inline void apply_common(cpr::Session& s, const utils::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{cfg.connect_timeout_ms});
    s.SetTimeout(cpr::Timeout{cfg.timeout_ms});
    s.SetVerifySsl(cpr::VerifySsl{cfg.verify_tls});
    if (cfg.proxy.rfind("http", 0) == 0)
    {
        s.SetProxies(cpr::Proxies{
            { "http",  cfg.proxy },
            { "https", cfg.proxy }
        });
    }
    if (!cfg.user_agent.empty())
    {
        s.SetUserAgent(cpr::UserAgent{cfg.user_agent});
    }
    if (cfg.cancel_flag)
    {
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool {
                auto flag = reinterpret_cast<const std::atomic<bool>*>(userdata);
                return flag && flag->load();
            },
            reinterpret_cast<intptr_t>(cfg.cancel_flag)));
    }
}

inline cpr::Header make_header(const std::vector<utils::Header>& headers)
{
    cpr::Header h;
    for (const auto& kv : headers)
        h.emplace(kv.name, kv.value);
    return h;
}

} // namespace

namespace utils
{

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{url});
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

std::string url_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace utils

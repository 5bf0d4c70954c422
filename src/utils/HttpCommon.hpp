#pragma once

#include <atomic>
#include <string>
#include <vector>

namespace utils
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 30000;
    std::string user_agent;
    std::string proxy; // applied to http and https when it starts with "http"
    bool verify_tls = true;

    // Transfer keeps going while *cancel_flag is true; clearing it aborts the request.
    const std::atomic<bool>* cancel_flag = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

class IHttpClient
{
public:
    virtual ~IHttpClient() = default;
    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers,
                             const SessionConfig& cfg) = 0;
};

// cpr-backed client used outside of tests
class CprHttpClient : public IHttpClient
{
public:
    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) override;
};

// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_escape(const std::string& s);

} // namespace utils

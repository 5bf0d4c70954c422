#pragma once
#include <string>

namespace translate
{
namespace helpers
{

enum class HttpErrorType
{
    Success,
    Timeout,
    Cancelled,
    UriTooLong,
    RateLimited,
    Rejected, // 400/403: the endpoint refused the request, typically a bad tk
    NetworkError,
    ServerError,
    ClientError,
    Other
};

inline HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        // Network/transport errors
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos ||
            error_msg.find("timed out") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        if (error_msg.find("callback aborted") != std::string::npos ||
            error_msg.find("aborted by callback") != std::string::npos)
        {
            return HttpErrorType::Cancelled;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
    {
        return HttpErrorType::Success;
    }

    switch (status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 414: // URI Too Long
        return HttpErrorType::UriTooLong;
    case 429:
        return HttpErrorType::RateLimited;
    case 400:
    case 403:
        return HttpErrorType::Rejected;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        if (status_code >= 400)
            return HttpErrorType::ClientError;
        return HttpErrorType::Other;
    }
}

inline std::string get_error_description(HttpErrorType type, int status_code, const std::string& details)
{
    switch (type)
    {
    case HttpErrorType::Timeout:
        return "Request timeout: " + details;
    case HttpErrorType::Cancelled:
        return "Request cancelled";
    case HttpErrorType::UriTooLong:
        return "HTTP 414 URI Too Long - text too long for a GET request. Split it into smaller chunks.";
    case HttpErrorType::RateLimited:
        return "HTTP 429 Too Many Requests - the endpoint is throttling this client.";
    case HttpErrorType::Rejected:
        // A wrong tk and an unavailable service look the same from here
        return "Request rejected (HTTP " + std::to_string(status_code) +
               "); the token may not match the server's current key pair.";
    case HttpErrorType::NetworkError:
        return "Network error: " + details;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(status_code) + ")";
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(status_code) + ")";
    default:
        return "HTTP " + std::to_string(status_code);
    }
}

} // namespace helpers
} // namespace translate

#include "mock_http.hpp"

#include <chrono>
#include <thread>

namespace test_utils {

utils::HttpResponse MockHttpClient::get(const std::string& url, const std::vector<utils::Header>& headers,
                                        const utils::SessionConfig& cfg) {
    int delay_ms = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        requests_.push_back({url, headers, cfg.user_agent, cfg.cancel_flag != nullptr});
        delay_ms = delay_ms_;
    }
    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    const MockResponse mock = getResponse(url);
    utils::HttpResponse r;
    if (mock.has_error) {
        r.error = mock.error_message.empty() ? std::string("mock transport error") : mock.error_message;
        return r;
    }
    r.status_code = mock.status_code;
    r.text = mock.body;
    return r;
}

void MockHttpClient::setResponse(const std::string& url, const MockResponse& response) {
    std::lock_guard<std::mutex> lk(mtx_);
    url_responses_[url] = response;
}

void MockHttpClient::setPatternResponse(const std::string& fragment, const MockResponse& response) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& [existing, resp] : pattern_responses_) {
        if (existing == fragment) {
            resp = response;
            return;
        }
    }
    pattern_responses_.emplace_back(fragment, response);
}

void MockHttpClient::simulateNetworkError(const std::string& error_msg) {
    std::lock_guard<std::mutex> lk(mtx_);
    simulate_error_ = true;
    error_message_ = error_msg;
}

void MockHttpClient::setDelayMs(int delay_ms) {
    std::lock_guard<std::mutex> lk(mtx_);
    delay_ms_ = delay_ms;
}

void MockHttpClient::clearResponses() {
    std::lock_guard<std::mutex> lk(mtx_);
    url_responses_.clear();
    pattern_responses_.clear();
    simulate_error_ = false;
    error_message_.clear();
}

MockResponse MockHttpClient::getResponse(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (simulate_error_) {
        MockResponse error_resp;
        error_resp.has_error = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }

    // Check exact URL match first
    auto url_it = url_responses_.find(url);
    if (url_it != url_responses_.end()) {
        return url_it->second;
    }

    for (const auto& [fragment, response] : pattern_responses_) {
        if (url.find(fragment) != std::string::npos) {
            return response;
        }
    }

    // Default 404 response
    MockResponse not_found;
    not_found.status_code = 404;
    not_found.body = "Not Found";
    return not_found;
}

std::vector<RecordedRequest> MockHttpClient::requests() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return requests_;
}

std::size_t MockHttpClient::requestCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return requests_.size();
}

std::size_t MockHttpClient::requestCount(const std::string& fragment) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::size_t n = 0;
    for (const auto& r : requests_) {
        if (r.url.find(fragment) != std::string::npos) {
            ++n;
        }
    }
    return n;
}

MockResponse MockResponses::host_page(const std::string& key_pair) {
    MockResponse resp;
    resp.status_code = 200;
    resp.body = "<!DOCTYPE html><html><head><script>"
                "window.TKK=null;(function(){var c={ctx:1,tkk:'" + key_pair + "',lang:'en'};})();"
                "</script></head><body>Google Translate</body></html>";
    return resp;
}

MockResponse MockResponses::host_page_without_key() {
    MockResponse resp;
    resp.status_code = 200;
    resp.body = "<!DOCTYPE html><html><head><script>var c={ctx:1,lang:'en'};</script></head></html>";
    return resp;
}

MockResponse MockResponses::translate_success(const std::string& translated_text, const std::string& original) {
    MockResponse resp;
    resp.status_code = 200;
    resp.body = R"({"sentences":[{"trans":")" + translated_text + R"(","orig":")" + original +
                R"(","backend":10}],"src":"en","confidence":1,"spell":{},"ld_result":{"srclangs":["en"],)"
                R"("srclangs_confidences":[1],"extended_srclangs":["en"]}})";
    return resp;
}

MockResponse MockResponses::detect_success(const std::string& src, double confidence) {
    MockResponse resp;
    resp.status_code = 200;
    resp.body = R"({"sentences":[{"trans":"hello","orig":"hola","backend":3}],"src":")" + src +
                R"(","confidence":)" + std::to_string(confidence) +
                R"(,"ld_result":{"srclangs":[")" + src + R"("],"srclangs_confidences":[)" +
                std::to_string(confidence) + R"(],"extended_srclangs":[")" + src + R"("]}})";
    return resp;
}

MockResponse MockResponses::invalid_json() {
    MockResponse resp;
    resp.status_code = 200;
    resp.body = R"({"sentences": [{"trans": "incomplete")";
    return resp;
}

MockResponse MockResponses::languages_page(const std::vector<std::pair<std::string, std::string>>& rows) {
    MockResponse resp;
    resp.status_code = 200;
    resp.body = "<html><body><h1>Language support</h1><table class=\"languages\">"
                "<thead><tr><th>Language</th><th>ISO-639 code</th></tr></thead><tbody>";
    for (const auto& [name, code] : rows) {
        resp.body += "<tr>\n<td>" + name + "</td>\n<td><code>" + code + "</code></td>\n</tr>";
    }
    resp.body += "</tbody></table></body></html>";
    return resp;
}

MockResponse MockResponses::error_status(int status_code) {
    MockResponse resp;
    resp.status_code = status_code;
    resp.body = "<html><title>Error " + std::to_string(status_code) + "</title></html>";
    return resp;
}

MockResponse MockResponses::network_error() {
    MockResponse resp;
    resp.has_error = true;
    resp.error_message = "Could not resolve host";
    return resp;
}

MockResponse MockResponses::timeout_error() {
    MockResponse resp;
    resp.has_error = true;
    resp.error_message = "Operation timed out after 30000 milliseconds";
    return resp;
}

}  // namespace test_utils

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace translate {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Parameters sent by the browser extension popup, in wire order.
// dt=t and dt=bd select translation and dictionary blocks, dj=1 asks for the JSON object shape.
QueryParams build_query_params(const std::string& text,
                               const std::string& source_lang,
                               const std::string& target_lang,
                               const std::string& token);

// https://<host>/translate_a/single?<params>, every value percent-encoded
std::string build_translate_url(const std::string& host,
                                const std::string& text,
                                const std::string& source_lang,
                                const std::string& target_lang,
                                const std::string& token);

} // namespace translate

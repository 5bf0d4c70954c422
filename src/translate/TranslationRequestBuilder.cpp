#include "TranslationRequestBuilder.hpp"
#include "../utils/HttpCommon.hpp"

namespace translate
{

QueryParams build_query_params(const std::string& text, const std::string& source_lang,
                               const std::string& target_lang, const std::string& token)
{
    QueryParams params{
        { "client", "gtx"                                      },
        { "sl",     source_lang.empty() ? "auto" : source_lang },
        { "tl",     target_lang                                },
        { "hl",     target_lang                                },
        { "tk",     token                                      },
        { "q",      text                                       },
        { "dt",     "t"                                        },
        { "dt",     "bd"                                       },
        { "dj",     "1"                                        },
        { "source", "popup"                                    }
    };
    return params;
}

std::string build_translate_url(const std::string& host, const std::string& text, const std::string& source_lang,
                                const std::string& target_lang, const std::string& token)
{
    std::string url = "https://" + host + "/translate_a/single";
    const auto params = build_query_params(text, source_lang, target_lang, token);
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        url.push_back(i == 0 ? '?' : '&');
        url += utils::url_escape(params[i].first);
        url.push_back('=');
        url += utils::url_escape(params[i].second);
    }
    return url;
}

} // namespace translate

#include "GoogleTranslator.hpp"

#include "TranslationRequestBuilder.hpp"
#include "TranslationResponse.hpp"
#include "TranslatorHelpers.hpp"

#include <plog/Log.h>
#include <random>

using namespace translate;

namespace
{

// Consent cookie the documentation site expects before it serves the full table
constexpr const char* kLanguagesCookie = "_ga_devsite=GA1.3.3578724760.1690567683";

std::mt19937_64 make_rng(const std::optional<std::uint64_t>& seed)
{
    if (seed)
        return std::mt19937_64(*seed);
    std::random_device rd;
    return std::mt19937_64((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
}

const std::string& pick(const std::vector<std::string>& choices, std::mt19937_64& rng)
{
    std::uniform_int_distribution<std::size_t> dist(0, choices.size() - 1);
    return choices[dist(rng)];
}

} // namespace

GoogleTranslator::GoogleTranslator(TranslatorConfig cfg, std::shared_ptr<utils::IHttpClient> http,
                                   std::shared_ptr<const LanguageTable> languages, KeyPairStore::Clock clock)
    : cfg_(std::move(cfg))
    , http_(http ? std::move(http) : std::make_shared<utils::CprHttpClient>())
    , languages_(languages ? std::move(languages) : LanguageTable::defaults())
{
    if (cfg_.service_urls.empty())
        cfg_.service_urls.push_back("translate.google.com");
    if (cfg_.user_agents.empty())
        cfg_.user_agents.push_back(kDefaultUserAgent);

    auto rng = make_rng(cfg_.seed);
    host_ = pick(cfg_.service_urls, rng);
    user_agent_ = pick(cfg_.user_agents, rng);

    session_.connect_timeout_ms = cfg_.connect_timeout_ms;
    session_.timeout_ms = cfg_.timeout_ms;
    session_.user_agent = user_agent_;
    session_.proxy = cfg_.proxy;
    session_.verify_tls = cfg_.verify_tls;

    store_ = std::make_shared<KeyPairStore>(http_, host_, cfg_.key_pair, session_, std::move(clock));
    acquirer_ = std::make_unique<TokenAcquirer>(store_);

    PLOG_INFO << "Translator using host " << host_ << (cfg_.proxy.empty() ? "" : " via proxy " + cfg_.proxy);
}

bool GoogleTranslator::translate(const std::string& origin, const std::string& src_lang,
                                 const std::string& dst_lang, Translated& out, const std::atomic<bool>* running)
{
    const std::string src = to_lower_ascii(src_lang);
    const std::string dst = to_lower_ascii(dst_lang);

    std::string body;
    if (!doRequest(origin, src, dst, running, body))
        return false;

    std::string text;
    auto parsed = parse_translation_response(body, text);
    if (!parsed.ok)
    {
        PLOG_DEBUG << "Response body: " << body;
        setError(utils::ErrorCategory::Translation, "Translate response parse failed", parsed.error_message);
        return false;
    }

    PLOG_INFO << "Translation [" << src << " -> " << dst << "]: '" << origin << "' -> '" << text << "'";
    out.src = src;
    out.dest = dst;
    out.origin = origin;
    out.text = std::move(text);
    return true;
}

bool GoogleTranslator::detectLanguage(const std::string& origin, const std::string& dst_lang, DetectResult& out,
                                      const std::atomic<bool>* running)
{
    const std::string dst = to_lower_ascii(dst_lang);

    std::string body;
    if (!doRequest(origin, kDefaultLanguage, dst, running, body))
        return false;

    auto parsed = parse_detection_response(body, out);
    if (!parsed.ok)
    {
        PLOG_DEBUG << "Response body: " << body;
        setError(utils::ErrorCategory::Translation, "Detect response parse failed", parsed.error_message);
        return false;
    }

    PLOG_INFO << "Detected '" << out.src << "' (confidence " << out.confidence << ") for '" << origin << "'";
    return true;
}

bool GoogleTranslator::validLanguageKey(const std::string& lang, std::string& out_key)
{
    if (languages()->findKey(lang, out_key))
        return true;

    out_key = kDefaultLanguage;
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = "invalid language '" + to_lower_ascii(lang) + "'";
    return false;
}

std::shared_ptr<const LanguageTable> GoogleTranslator::languages() const
{
    std::lock_guard<std::mutex> lk(lang_mtx_);
    return languages_;
}

bool GoogleTranslator::fetchLanguages(bool overwrite, std::shared_ptr<const LanguageTable>& out,
                                      const std::atomic<bool>* running)
{
    using namespace translate::helpers;

    const auto current = languages();
    out = current;

    utils::SessionConfig scfg = session_;
    scfg.cancel_flag = running;
    const std::vector<utils::Header> headers{
        { "Cookie", kLanguagesCookie }
    };

    auto r = http_->get(kLanguagesUrl, headers, scfg);
    if (!r.ok())
    {
        auto err_type = categorize_http_error(r.status_code, r.error);
        setError(utils::ErrorCategory::Network, "Language list download failed",
                 get_error_description(err_type, r.status_code, r.error));
        return false;
    }

    LanguageTable::Entries rows;
    if (!parse_language_page(r.text, rows))
    {
        setError(utils::ErrorCategory::Translation, "Language list not recognised",
                 "no language table in documentation page");
        return false;
    }

    auto updated = current->merged(rows);
    PLOG_INFO << "Fetched " << rows.size() << " languages, table now has " << updated->size() << " entries";
    if (overwrite)
    {
        std::lock_guard<std::mutex> lk(lang_mtx_);
        languages_ = updated;
    }
    out = std::move(updated);
    return true;
}

KeyPair GoogleTranslator::refreshKeyPair(const std::atomic<bool>* running) { return store_->refresh(running); }

std::string GoogleTranslator::lastError() const
{
    std::lock_guard<std::mutex> lk(err_mtx_);
    return last_error_;
}

bool GoogleTranslator::doRequest(const std::string& origin, const std::string& src, const std::string& dst,
                                 const std::atomic<bool>* running, std::string& out_body)
{
    using namespace translate::helpers;

    const std::string tk = acquirer_->derive(origin, running);
    const std::string url = build_translate_url(host_, origin, src, dst, tk);
    PLOG_DEBUG << "Request URL length: " << url.size() << " bytes";

    utils::SessionConfig scfg = session_;
    scfg.cancel_flag = running;
    auto r = http_->get(url, {}, scfg);

    if (!r.error.empty())
    {
        auto err_type = categorize_http_error(0, r.error);
        setError(utils::ErrorCategory::Network, "Translate request failed",
                 get_error_description(err_type, 0, r.error));
        return false;
    }
    if (r.status_code != 200)
    {
        auto err_type = categorize_http_error(r.status_code, "");
        // 429/414 and friends say nothing about the token
        if (cfg_.invalidate_key_on_reject && err_type == HttpErrorType::Rejected)
            store_->invalidate();

        PLOG_DEBUG << "Response body: " << r.text;
        setError(utils::ErrorCategory::Translation, "Translate endpoint returned an error",
                 "expected status 200, got: " + std::to_string(r.status_code) + "; " +
                     get_error_description(err_type, r.status_code, r.text));
        return false;
    }

    out_body = std::move(r.text);
    return true;
}

void GoogleTranslator::setError(utils::ErrorCategory category, const char* user_message, const std::string& err_msg)
{
    {
        std::lock_guard<std::mutex> lk(err_mtx_);
        if (last_error_ == err_msg)
        {
            PLOG_DEBUG << user_message << ": " << err_msg;
            return;
        }
        last_error_ = err_msg;
    }
    utils::ErrorReporter::ReportWarning(category, user_message, err_msg);
}

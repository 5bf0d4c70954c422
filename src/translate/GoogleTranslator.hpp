#pragma once

#include "KeyPairStore.hpp"
#include "LanguageTable.hpp"
#include "TokenAcquirer.hpp"
#include "TranslationTypes.hpp"
#include "TranslatorConfig.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/HttpCommon.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace translate
{
    // Client for the browser endpoint translate_a/single.
    // Every request carries a tk derived from the text and the host page key pair.
    // Safe to share between threads; each call blocks on its own HTTP request.
    class GoogleTranslator
    {
    public:
        static constexpr const char* kLanguagesUrl = "https://cloud.google.com/translate/docs/languages";

        explicit GoogleTranslator(TranslatorConfig cfg = {}, std::shared_ptr<utils::IHttpClient> http = nullptr,
                                  std::shared_ptr<const LanguageTable> languages = nullptr,
                                  KeyPairStore::Clock clock = {});

        // src may be "auto". Language codes are lowercased before use.
        bool translate(const std::string& origin, const std::string& src, const std::string& dest, Translated& out,
                       const std::atomic<bool>* running = nullptr);

        // Same request with sl=auto, decoded as a detection response
        bool detectLanguage(const std::string& origin, const std::string& dest, DetectResult& out,
                            const std::atomic<bool>* running = nullptr);

        // Code or English name -> code. On failure out_key is "auto".
        bool validLanguageKey(const std::string& lang, std::string& out_key);

        std::shared_ptr<const LanguageTable> languages() const;

        // Reads the documentation page and merges its rows over the current table.
        // With overwrite the client switches to the new snapshot; out always receives a usable table.
        bool fetchLanguages(bool overwrite, std::shared_ptr<const LanguageTable>& out,
                            const std::atomic<bool>* running = nullptr);

        KeyPair refreshKeyPair(const std::atomic<bool>* running = nullptr);
        TokenAcquirer& tokenAcquirer() { return *acquirer_; }
        KeyPairStore& keyPairStore() { return *store_; }

        const std::string& host() const { return host_; }
        const std::string& userAgent() const { return user_agent_; }
        const TranslatorConfig& config() const { return cfg_; }
        std::string lastError() const;

    private:
        bool doRequest(const std::string& origin, const std::string& src, const std::string& dest,
                       const std::atomic<bool>* running, std::string& out_body);
        void setError(utils::ErrorCategory category, const char* user_message, const std::string& err_msg);

        TranslatorConfig cfg_;
        std::string host_;
        std::string user_agent_;
        utils::SessionConfig session_;
        std::shared_ptr<utils::IHttpClient> http_;
        std::shared_ptr<KeyPairStore> store_;
        std::unique_ptr<TokenAcquirer> acquirer_;

        mutable std::mutex lang_mtx_;
        std::shared_ptr<const LanguageTable> languages_;

        mutable std::mutex err_mtx_;
        std::string last_error_;
    };
}

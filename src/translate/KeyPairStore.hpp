#pragma once

#include "KeyPair.hpp"
#include "../utils/HttpCommon.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace translate
{

struct KeyPairSettings
{
    // Name of the page constant holding the pair; empty accepts any identifier
    std::string key_name = "tkk";
    // 0 keeps a fetched pair until invalidate()/refresh()
    std::chrono::seconds max_age{0};
    // How long a synthetic pair is kept before the page is fetched again; 0 keeps it
    std::chrono::seconds fallback_retry{60};
};

enum class KeyPairSource
{
    Fetched,
    Synthetic
};

enum class KeyPairFailure
{
    None,
    FetchFailed, // transport error or non-2xx host page
    ParseFailed  // 2xx page without a usable key:'<int>.<int>' assignment
};

// Lazily fetches the key pair from https://<host>/ and caches it for every later token.
// Fetch and parse failures never propagate: a time-bucketed synthetic pair is used instead.
class KeyPairStore
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    KeyPairStore(std::shared_ptr<utils::IHttpClient> http, std::string host, KeyPairSettings settings,
                 utils::SessionConfig session, Clock clock = {});

    // Cached pair, fetching first when absent or no longer usable
    KeyPair current(const std::atomic<bool>* running = nullptr);

    // Fetch unconditionally and replace the cached pair
    KeyPair refresh(const std::atomic<bool>* running = nullptr);

    // Drop the cached pair; the next current() fetches
    void invalidate();

    std::optional<KeyPair> cached() const;
    std::optional<KeyPairSource> cachedSource() const;
    KeyPairFailure lastFailure() const;

    const std::string& host() const { return host_; }

    static bool parseKeyPair(const std::string& body, const std::string& key_name, KeyPair& out);
    static KeyPair syntheticKeyPair(std::chrono::system_clock::time_point now);

private:
    struct Entry
    {
        KeyPair pair;
        std::chrono::system_clock::time_point obtained_at;
        KeyPairSource source = KeyPairSource::Fetched;
    };

    bool isUsable(const Entry& e, std::chrono::system_clock::time_point now) const;
    KeyPair refreshLocked(const std::atomic<bool>* running);

    std::shared_ptr<utils::IHttpClient> http_;
    std::string host_;
    KeyPairSettings settings_;
    utils::SessionConfig session_;
    Clock clock_;

    mutable std::mutex mtx_;
    std::mutex refresh_mtx_;
    std::optional<Entry> entry_;
    KeyPairFailure last_failure_ = KeyPairFailure::None;
};

} // namespace translate

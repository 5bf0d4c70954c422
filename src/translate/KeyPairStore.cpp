#include "KeyPairStore.hpp"

#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <cctype>
#include <charconv>

namespace
{

bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::size_t skip_spaces(const std::string& s, std::size_t pos)
{
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
        ++pos;
    return pos;
}

// Reads -?\d+ starting at pos; returns npos when no digits follow
std::size_t scan_integer(const std::string& s, std::size_t pos)
{
    if (pos < s.size() && s[pos] == '-')
        ++pos;
    const std::size_t digits = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
        ++pos;
    return pos == digits ? std::string::npos : pos;
}

bool parse_int64(const std::string& s, std::int64_t& out)
{
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

namespace translate
{

KeyPairStore::KeyPairStore(std::shared_ptr<utils::IHttpClient> http, std::string host, KeyPairSettings settings,
                           utils::SessionConfig session, Clock clock)
    : http_(std::move(http))
    , host_(std::move(host))
    , settings_(std::move(settings))
    , session_(std::move(session))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

KeyPair KeyPairStore::current(const std::atomic<bool>* running)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (entry_ && isUsable(*entry_, clock_()))
            return entry_->pair;
    }

    // One fetch at a time; whoever waited re-checks what the previous holder stored
    std::lock_guard<std::mutex> refresh_lock(refresh_mtx_);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (entry_ && isUsable(*entry_, clock_()))
            return entry_->pair;
    }
    return refreshLocked(running);
}

KeyPair KeyPairStore::refresh(const std::atomic<bool>* running)
{
    std::lock_guard<std::mutex> refresh_lock(refresh_mtx_);
    return refreshLocked(running);
}

void KeyPairStore::invalidate()
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (entry_)
        PLOG_DEBUG << "Key pair " << entry_->pair.toString() << " invalidated";
    entry_.reset();
}

std::optional<KeyPair> KeyPairStore::cached() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (!entry_)
        return std::nullopt;
    return entry_->pair;
}

std::optional<KeyPairSource> KeyPairStore::cachedSource() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (!entry_)
        return std::nullopt;
    return entry_->source;
}

KeyPairFailure KeyPairStore::lastFailure() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return last_failure_;
}

bool KeyPairStore::isUsable(const Entry& e, std::chrono::system_clock::time_point now) const
{
    const auto age = now - e.obtained_at;
    if (e.source == KeyPairSource::Synthetic)
        return settings_.fallback_retry.count() <= 0 || age < settings_.fallback_retry;
    return settings_.max_age.count() <= 0 || age < settings_.max_age;
}

KeyPair KeyPairStore::refreshLocked(const std::atomic<bool>* running)
{
    const std::string url = "https://" + host_ + "/";

    utils::SessionConfig scfg = session_;
    scfg.cancel_flag = running;

    Entry e;
    KeyPairFailure failure = KeyPairFailure::None;
    std::string details;

    auto r = http_ ? http_->get(url, {}, scfg) : utils::HttpResponse{0, {}, "no http client"};
    if (!r.error.empty())
    {
        failure = KeyPairFailure::FetchFailed;
        details = r.error;
    }
    else if (r.status_code < 200 || r.status_code >= 300)
    {
        failure = KeyPairFailure::FetchFailed;
        details = "HTTP " + std::to_string(r.status_code) + " from " + url;
    }
    else if (!parseKeyPair(r.text, settings_.key_name, e.pair))
    {
        failure = KeyPairFailure::ParseFailed;
        details = "no " + (settings_.key_name.empty() ? std::string("key") : settings_.key_name) +
                  ":'<int>.<int>' assignment in " + std::to_string(r.text.size()) + " byte page from " + url;
    }

    e.obtained_at = clock_();
    if (failure == KeyPairFailure::None)
    {
        e.source = KeyPairSource::Fetched;
        PLOG_INFO << "Key pair refreshed from " << host_;
        PLOG_DEBUG << "Key pair: " << e.pair.toString();
    }
    else
    {
        e.source = KeyPairSource::Synthetic;
        e.pair = syntheticKeyPair(e.obtained_at);

        if (running && !running->load())
        {
            // Aborted by the caller: serve this request but let the next one try again
            PLOG_DEBUG << "Key pair fetch cancelled, fallback pair not cached";
            return e.pair;
        }

        const char* what = failure == KeyPairFailure::FetchFailed ? "Could not fetch key pair from host page"
                                                                   : "Key pair not found in host page";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::KeyPair,
                                            std::string(what) + ", using time-based fallback", details);
    }

    std::lock_guard<std::mutex> lk(mtx_);
    entry_ = e;
    last_failure_ = failure;
    return e.pair;
}

bool KeyPairStore::parseKeyPair(const std::string& body, const std::string& key_name, KeyPair& out)
{
    // Looks for <key_name>:'<int>.<int>' with optional spaces around the colon
    std::size_t colon = body.find(':');
    while (colon != std::string::npos)
    {
        const std::size_t next = body.find(':', colon + 1);

        std::size_t name_end = colon;
        while (name_end > 0 && std::isspace(static_cast<unsigned char>(body[name_end - 1])))
            --name_end;
        std::size_t name_begin = name_end;
        while (name_begin > 0 && is_ident_char(body[name_begin - 1]))
            --name_begin;

        const bool name_ok = key_name.empty()
                                 ? name_begin < name_end
                                 : body.compare(name_begin, name_end - name_begin, key_name) == 0;

        std::size_t pos = skip_spaces(body, colon + 1);
        if (name_ok && pos < body.size() && body[pos] == '\'')
        {
            const std::size_t a_begin = pos + 1;
            const std::size_t a_end = scan_integer(body, a_begin);
            if (a_end != std::string::npos && a_end < body.size() && body[a_end] == '.')
            {
                const std::size_t b_begin = a_end + 1;
                const std::size_t b_end = scan_integer(body, b_begin);
                if (b_end != std::string::npos && b_end < body.size() && body[b_end] == '\'')
                {
                    KeyPair parsed;
                    if (parse_int64(body.substr(a_begin, a_end - a_begin), parsed.a) &&
                        parse_int64(body.substr(b_begin, b_end - b_begin), parsed.b))
                    {
                        out = parsed;
                        return true;
                    }
                    // Out of range; a later assignment may still be usable
                }
            }
        }
        colon = next;
    }
    return false;
}

KeyPair KeyPairStore::syntheticKeyPair(std::chrono::system_clock::time_point now)
{
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch()).count();
    const auto h = static_cast<std::int64_t>(hours);
    return KeyPair{h, h};
}

} // namespace translate

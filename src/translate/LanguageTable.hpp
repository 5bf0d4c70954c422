#pragma once

#include <map>
#include <memory>
#include <string>

namespace translate
{

inline constexpr const char* kDefaultLanguage = "auto";

// Immutable code -> English name table (both lowercase). Updates produce a new snapshot.
class LanguageTable
{
public:
    using Entries = std::map<std::string, std::string>;

    explicit LanguageTable(Entries entries);

    // Built-in table shared by every client that does not bring its own
    static std::shared_ptr<const LanguageTable> defaults();

    // Accepts a code ("pt") or a full name ("Portuguese"), case-insensitive
    bool findKey(const std::string& lang, std::string& out_key) const;

    const Entries& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }

    // New snapshot: this table with `updates` added or overriding existing codes
    std::shared_ptr<const LanguageTable> merged(const Entries& updates) const;

private:
    Entries entries_;
};

// Extracts (code, name) rows from the first <table> of the Cloud Translation language
// documentation page. Returns false when no table or no usable row is present.
bool parse_language_page(const std::string& html, LanguageTable::Entries& out);

std::string to_lower_ascii(std::string s);

// "auto" in any case, surrounding whitespace ignored
bool is_auto_language(const std::string& lang);

} // namespace translate

#include "LanguageTable.hpp"

#include <algorithm>
#include <cctype>

namespace translate
{

namespace
{

const LanguageTable::Entries& builtin_entries()
{
    static const LanguageTable::Entries entries{
        { "af",    "afrikaans"             },
        { "sq",    "albanian"              },
        { "am",    "amharic"               },
        { "ar",    "arabic"                },
        { "hy",    "armenian"              },
        { "az",    "azerbaijani"           },
        { "eu",    "basque"                },
        { "be",    "belarusian"            },
        { "bn",    "bengali"               },
        { "bs",    "bosnian"               },
        { "bg",    "bulgarian"             },
        { "ca",    "catalan"               },
        { "ceb",   "cebuano"               },
        { "ny",    "chichewa"              },
        { "zh-cn", "chinese (simplified)"  },
        { "zh-tw", "chinese (traditional)" },
        { "co",    "corsican"              },
        { "hr",    "croatian"              },
        { "cs",    "czech"                 },
        { "da",    "danish"                },
        { "nl",    "dutch"                 },
        { "en",    "english"               },
        { "eo",    "esperanto"             },
        { "et",    "estonian"              },
        { "tl",    "filipino"              },
        { "fi",    "finnish"               },
        { "fr",    "french"                },
        { "fy",    "frisian"               },
        { "gl",    "galician"              },
        { "ka",    "georgian"              },
        { "de",    "german"                },
        { "el",    "greek"                 },
        { "gu",    "gujarati"              },
        { "ht",    "haitian creole"        },
        { "ha",    "hausa"                 },
        { "haw",   "hawaiian"              },
        { "iw",    "hebrew"                },
        { "he",    "hebrew"                },
        { "hi",    "hindi"                 },
        { "hmn",   "hmong"                 },
        { "hu",    "hungarian"             },
        { "is",    "icelandic"             },
        { "ig",    "igbo"                  },
        { "id",    "indonesian"            },
        { "ga",    "irish"                 },
        { "it",    "italian"               },
        { "ja",    "japanese"              },
        { "jw",    "javanese"              },
        { "kn",    "kannada"               },
        { "kk",    "kazakh"                },
        { "km",    "khmer"                 },
        { "rw",    "kinyarwanda"           },
        { "ko",    "korean"                },
        { "ku",    "kurdish (kurmanji)"    },
        { "ky",    "kyrgyz"                },
        { "lo",    "lao"                   },
        { "la",    "latin"                 },
        { "lv",    "latvian"               },
        { "lt",    "lithuanian"            },
        { "lb",    "luxembourgish"         },
        { "mk",    "macedonian"            },
        { "mg",    "malagasy"              },
        { "ms",    "malay"                 },
        { "ml",    "malayalam"             },
        { "mt",    "maltese"               },
        { "mi",    "maori"                 },
        { "mr",    "marathi"               },
        { "mn",    "mongolian"             },
        { "my",    "myanmar (burmese)"     },
        { "ne",    "nepali"                },
        { "no",    "norwegian"             },
        { "or",    "odia"                  },
        { "ps",    "pashto"                },
        { "fa",    "persian"               },
        { "pl",    "polish"                },
        { "pt",    "portuguese"            },
        { "pa",    "punjabi"               },
        { "ro",    "romanian"              },
        { "ru",    "russian"               },
        { "sm",    "samoan"                },
        { "gd",    "scots gaelic"          },
        { "sr",    "serbian"               },
        { "st",    "sesotho"               },
        { "sn",    "shona"                 },
        { "sd",    "sindhi"                },
        { "si",    "sinhala"               },
        { "sk",    "slovak"                },
        { "sl",    "slovenian"             },
        { "so",    "somali"                },
        { "es",    "spanish"               },
        { "su",    "sundanese"             },
        { "sw",    "swahili"               },
        { "sv",    "swedish"               },
        { "tg",    "tajik"                 },
        { "ta",    "tamil"                 },
        { "tt",    "tatar"                 },
        { "te",    "telugu"                },
        { "th",    "thai"                  },
        { "tr",    "turkish"               },
        { "tk",    "turkmen"               },
        { "uk",    "ukrainian"             },
        { "ur",    "urdu"                  },
        { "ug",    "uyghur"                },
        { "uz",    "uzbek"                 },
        { "vi",    "vietnamese"            },
        { "cy",    "welsh"                 },
        { "xh",    "xhosa"                 },
        { "yi",    "yiddish"               },
        { "yo",    "yoruba"                },
        { "zu",    "zulu"                  }
    };
    return entries;
}

std::string trim(const std::string& s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// Text between the first `open` and the following `close`, tags excluded
bool inner_text(const std::string& s, const std::string& open, const std::string& close, std::string& out,
                std::size_t from = 0)
{
    const std::size_t start = s.find(open, from);
    if (start == std::string::npos)
        return false;
    const std::size_t end = s.find(close, start + open.size());
    if (end == std::string::npos)
        return false;
    out = s.substr(start + open.size(), end - start - open.size());
    return true;
}

} // namespace

std::string to_lower_ascii(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_auto_language(const std::string& lang) { return to_lower_ascii(trim(lang)) == kDefaultLanguage; }

LanguageTable::LanguageTable(Entries entries)
    : entries_(std::move(entries))
{
}

std::shared_ptr<const LanguageTable> LanguageTable::defaults()
{
    static const auto table = std::make_shared<const LanguageTable>(builtin_entries());
    return table;
}

bool LanguageTable::findKey(const std::string& lang, std::string& out_key) const
{
    const std::string wanted = to_lower_ascii(trim(lang));
    if (wanted.empty())
        return false;

    auto it = entries_.find(wanted);
    if (it != entries_.end())
    {
        out_key = it->first;
        return true;
    }
    for (const auto& [code, name] : entries_)
    {
        if (name == wanted)
        {
            out_key = code;
            return true;
        }
    }
    return false;
}

std::shared_ptr<const LanguageTable> LanguageTable::merged(const Entries& updates) const
{
    Entries combined = entries_;
    for (const auto& [code, name] : updates)
        combined[code] = name;
    return std::make_shared<const LanguageTable>(std::move(combined));
}

bool parse_language_page(const std::string& html, LanguageTable::Entries& out)
{
    std::string table;
    if (!inner_text(html, "<table", "</table>", table))
        return false;

    std::string tbody;
    if (!inner_text(table, "<tbody", "</tbody>", tbody))
        tbody = table;

    LanguageTable::Entries rows;
    std::size_t pos = 0;
    while ((pos = tbody.find("<tr", pos)) != std::string::npos)
    {
        std::size_t row_end = tbody.find("</tr>", pos);
        if (row_end == std::string::npos)
            row_end = tbody.size();
        const std::string tr = tbody.substr(pos, row_end - pos);
        pos = row_end;

        std::string name;
        std::string code;
        if (!inner_text(tr, "<td>", "</td>", name) || !inner_text(tr, "<code>", "</code>", code))
            continue;

        // Names sometimes carry markup such as footnote links
        const std::size_t tag = name.find('<');
        if (tag != std::string::npos)
            name.erase(tag);

        name = to_lower_ascii(trim(name));
        code = to_lower_ascii(trim(code));
        if (name.empty() || code.empty())
            continue;
        rows[code] = name;
    }

    if (rows.empty())
        return false;
    out = std::move(rows);
    return true;
}

} // namespace translate

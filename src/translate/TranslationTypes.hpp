#pragma once

#include <string>
#include <vector>

namespace translate
{

struct Translated
{
    std::string src;    // source language as requested ("auto" allowed)
    std::string dest;   // destination language
    std::string origin; // original text
    std::string text;   // translated text
};

struct Sentence
{
    std::string trans;
    std::string orig;
    int backend = 0;
};

struct LdResult
{
    std::vector<std::string> srclangs;
    std::vector<double> srclangs_confidences;
    std::vector<std::string> extended_srclangs;
};

// Language detection response of the translate endpoint
struct DetectResult
{
    std::vector<Sentence> sentences;
    std::string src;
    double confidence = 0.0;
    LdResult ld_result;
};

} // namespace translate

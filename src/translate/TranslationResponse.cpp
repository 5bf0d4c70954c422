#include "TranslationResponse.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{

std::vector<translate::Sentence> read_sentences(const json& root)
{
    std::vector<translate::Sentence> out;
    if (!root.contains("sentences") || !root["sentences"].is_array())
        return out;

    for (const auto& s : root["sentences"])
    {
        if (!s.is_object())
            continue;
        translate::Sentence sentence;
        if (s.contains("trans") && s["trans"].is_string())
            sentence.trans = s["trans"].get<std::string>();
        if (s.contains("orig") && s["orig"].is_string())
            sentence.orig = s["orig"].get<std::string>();
        if (s.contains("backend") && s["backend"].is_number_integer())
            sentence.backend = s["backend"].get<int>();
        out.push_back(std::move(sentence));
    }
    return out;
}

template <typename T>
std::vector<T> read_array(const json& obj, const char* key)
{
    std::vector<T> out;
    if (!obj.contains(key) || !obj[key].is_array())
        return out;
    for (const auto& v : obj[key])
        out.push_back(v.get<T>());
    return out;
}

} // namespace

namespace translate
{

ParseResult parse_translation_response(const std::string& body, std::string& out_text)
{
    ParseResult result;
    try
    {
        auto root = json::parse(body);
        if (!root.is_object())
        {
            result.error_message = "unexpected response shape";
            return result;
        }
        std::string text;
        for (const auto& s : read_sentences(root))
            text += s.trans;
        out_text = std::move(text);
        result.ok = true;
        return result;
    }
    catch (const std::exception& ex)
    {
        result.error_message = std::string("parse error: ") + ex.what();
        return result;
    }
}

ParseResult parse_detection_response(const std::string& body, DetectResult& out)
{
    ParseResult result;
    try
    {
        auto root = json::parse(body);
        if (!root.is_object())
        {
            result.error_message = "unexpected response shape";
            return result;
        }

        DetectResult detected;
        detected.sentences = read_sentences(root);
        detected.src = root.value("src", "");
        if (root.contains("confidence") && root["confidence"].is_number())
            detected.confidence = root["confidence"].get<double>();

        if (root.contains("ld_result") && root["ld_result"].is_object())
        {
            const auto& ld = root["ld_result"];
            detected.ld_result.srclangs = read_array<std::string>(ld, "srclangs");
            detected.ld_result.srclangs_confidences = read_array<double>(ld, "srclangs_confidences");
            detected.ld_result.extended_srclangs = read_array<std::string>(ld, "extended_srclangs");
        }

        out = std::move(detected);
        result.ok = true;
        return result;
    }
    catch (const std::exception& ex)
    {
        result.error_message = std::string("parse error: ") + ex.what();
        return result;
    }
}

} // namespace translate

#pragma once

#include "TranslationTypes.hpp"

#include <string>

namespace translate
{

struct ParseResult
{
    bool ok = false;
    std::string error_message;
};

// Concatenates the "trans" field of every sentence; sentences without one contribute nothing
ParseResult parse_translation_response(const std::string& body, std::string& out_text);

ParseResult parse_detection_response(const std::string& body, DetectResult& out);

} // namespace translate

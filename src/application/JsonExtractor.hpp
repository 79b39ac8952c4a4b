/**
 * @file JsonExtractor.hpp
 * @brief Locates and parses a JSON object inside free-form model output.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace smartcook::application {

/**
 * @class JsonExtractor
 * @brief Multi-stage extraction. "Nothing found" is a normal outcome and is
 * reported as std::nullopt, never as an exception.
 *
 * Stages, first success wins:
 *  1. drop ``` / ```json markers, trim, strip comments, parse the whole text;
 *  2. parse the first balanced {...} span of that text;
 *  3. parse each ```json fenced block of the original text in order.
 *
 * Comment stripping is textual: comment markers inside a JSON string value
 * (a URL, say) are stripped as well.
 */
class JsonExtractor {
public:
    static std::optional<nlohmann::ordered_json> Extract(const std::string& text);

    /** @brief Removes line comments, then block comments, then trims. */
    static std::string StripComments(const std::string& text);

    /** @brief First brace-balanced span starting at the first '{', if it closes. */
    static std::optional<std::string> BalancedObjectSnippet(const std::string& text);

    /** @brief Strips comments and parses; only JSON objects are accepted. */
    static std::optional<nlohmann::ordered_json> TryParseCandidate(const std::string& candidate);

    static std::string Trim(const std::string& text);
};

} // namespace smartcook::application

/**
 * @file JsonExtractor.cpp
 * @brief Implementation of JsonExtractor.
 */

#include "application/JsonExtractor.hpp"
#include <cctype>

namespace smartcook::application {

namespace {

const std::string kJsonFence = "```json";
const std::string kFence = "```";

std::string RemoveAll(std::string text, const std::string& token) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.erase(pos, token.size());
    }
    return text;
}

std::string StripLineComments(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find("//", pos);
        if (start == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, start - pos);
        size_t eol = text.find('\n', start);
        if (eol == std::string::npos) break;
        pos = eol; // keep the newline itself
    }
    return out;
}

std::string StripBlockComments(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find("/*", pos);
        if (start == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        size_t end = text.find("*/", start + 2);
        if (end == std::string::npos) {
            // Unterminated: nothing to strip from here on.
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, start - pos);
        pos = end + 2;
    }
    return out;
}

} // namespace

std::string JsonExtractor::Trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

std::string JsonExtractor::StripComments(const std::string& text) {
    return Trim(StripBlockComments(StripLineComments(text)));
}

std::optional<std::string> JsonExtractor::BalancedObjectSnippet(const std::string& text) {
    size_t start = text.find('{');
    if (start == std::string::npos) return std::nullopt;

    int depth = 0;
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] == '{') {
            ++depth;
        } else if (text[i] == '}') {
            --depth;
            if (depth == 0) {
                return text.substr(start, i - start + 1);
            }
        }
    }
    return std::nullopt;
}

std::optional<nlohmann::ordered_json> JsonExtractor::TryParseCandidate(const std::string& candidate) {
    const std::string trimmed = Trim(candidate);
    if (trimmed.empty()) return std::nullopt;

    const std::string cleaned = StripComments(trimmed);
    auto parsed = nlohmann::ordered_json::parse(cleaned, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<nlohmann::ordered_json> JsonExtractor::Extract(const std::string& text) {
    if (text.empty()) return std::nullopt;

    // 1) Whole response without markdown markers.
    const std::string raw = Trim(RemoveAll(RemoveAll(text, kJsonFence), kFence));
    if (auto parsed = TryParseCandidate(raw)) {
        return parsed;
    }

    // 2) First balanced {...} span.
    if (auto snippet = BalancedObjectSnippet(raw)) {
        if (auto parsed = TryParseCandidate(*snippet)) {
            return parsed;
        }
    }

    // 3) Every ```json ... ``` block of the untouched text.
    size_t pos = 0;
    while ((pos = text.find(kJsonFence, pos)) != std::string::npos) {
        size_t bodyStart = pos + kJsonFence.size();
        size_t close = text.find(kFence, bodyStart);
        if (close == std::string::npos) break;
        if (auto parsed = TryParseCandidate(text.substr(bodyStart, close - bodyStart))) {
            return parsed;
        }
        pos = close + kFence.size();
    }

    return std::nullopt;
}

} // namespace smartcook::application

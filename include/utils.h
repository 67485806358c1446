#pragma once

#include <string>
#include <algorithm>
#include <cctype>

namespace voicekit {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r\f\v"));
    str.erase(str.find_last_not_of(" \t\n\r\f\v") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase (returns copy)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

/**
 * @brief Check if transcript text is blank (empty/whitespace or equals blank sentinel)
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank (e.g. "[BLANK_AUDIO]"); compared after trim
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    return !blank_sentinel.empty() && t == blank_sentinel;
}

/**
 * @brief Language part of a locale identifier ("en-US" -> "en", "pt_BR" -> "pt")
 */
inline std::string locale_language(const std::string& locale) {
    std::string::size_type pos = locale.find_first_of("-_");
    return normalize_copy(pos == std::string::npos ? locale : locale.substr(0, pos));
}

} // namespace utils

} // namespace voicekit

#include "text_util.hpp"
#include <algorithm>
#include <cctype>

namespace wordclip {
namespace text {

std::string trim(const std::string& s) {
    if (s.empty()) return s;

    size_t start = 0;
    size_t end = s.size();

    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }

    if (start >= end) return "";
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string strip_punctuation(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();

    while (start < end && std::ispunct(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    while (end > start && std::ispunct(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }

    return s.substr(start, end - start);
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;

    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }

    return parts;
}

bool ends_with_whitespace(const std::string& s) {
    return !s.empty() && std::isspace(static_cast<unsigned char>(s.back()));
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::string normalize_word(const std::string& word) {
    return to_lower(strip_punctuation(word));
}

} // namespace text
} // namespace wordclip

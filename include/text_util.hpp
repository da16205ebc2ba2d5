#pragma once

#include <string>
#include <vector>

namespace wordclip {
namespace text {

// Strip leading/trailing whitespace (space, tab, CR, LF)
std::string trim(const std::string& s);

std::string to_lower(const std::string& s);

// Strip leading/trailing ASCII punctuation, keep interior characters ("don't" stays intact)
std::string strip_punctuation(const std::string& s);

// Split on runs of whitespace, dropping empty pieces
std::vector<std::string> split_whitespace(const std::string& s);

bool ends_with_whitespace(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Lower-cased, punctuation-stripped form used for whole-word keyword comparison
std::string normalize_word(const std::string& word);

} // namespace text
} // namespace wordclip

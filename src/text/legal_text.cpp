#include "legal_text.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace nyayacpp::text {
namespace {

constexpr std::array<std::string_view, 22> kLegalTerms = {
    "article",          "section",       "act",          "constitution",    "supreme court",
    "high court",       "judgment",      "petition",     "appellant",       "respondent",
    "ratio decidendi",  "obiter dicta",  "precedent",    "doctrine",        "fundamental rights",
    "directive principles", "writ",      "habeas corpus", "mandamus",       "certiorari",
    "prohibition",      "quo warranto",
};

constexpr std::array<std::string_view, 48> kStopWords = {
    "a",    "about", "an",   "and",   "any",   "are",   "as",    "at",   "be",    "been",
    "but",  "by",    "can",  "did",   "do",    "does",  "for",   "from", "had",   "has",
    "have", "how",   "i",    "if",    "in",    "into",  "is",    "it",   "its",   "of",
    "on",   "or",    "that", "the",   "their", "there", "these", "this", "to",    "was",
    "were", "what",  "when", "where", "which", "who",   "why",   "with",
};

bool IsWordChar(unsigned char ch) {
  return std::isalnum(ch) != 0;
}

// Whole-word containment so that "act" does not fire inside "contract".
bool ContainsTerm(std::string_view haystack, std::string_view term) {
  std::size_t pos = haystack.find(term);
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !IsWordChar(static_cast<unsigned char>(haystack[pos - 1]));
    const auto end = pos + term.size();
    const bool right_ok = end >= haystack.size() || !IsWordChar(static_cast<unsigned char>(haystack[end]));
    if (left_ok && right_ok) {
      return true;
    }
    pos = haystack.find(term, pos + 1);
  }
  return false;
}

}  // namespace

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (IsWordChar(ch)) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
      current.reserve(32);
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::vector<std::string> SplitWhitespaceTokens(std::string_view text) {
  std::vector<std::string> tokens{};
  std::size_t start = 0;
  while (start < text.size()) {
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
      ++start;
    }
    if (start >= text.size()) {
      break;
    }
    std::size_t end = start;
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0) {
      ++end;
    }
    tokens.emplace_back(text.substr(start, end - start));
    start = end;
  }
  return tokens;
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

bool IsStopWord(std::string_view token) {
  return std::binary_search(kStopWords.begin(), kStopWords.end(), token);
}

std::vector<std::string> ExtractLegalKeywords(std::string_view text) {
  const auto lowered = ToLower(text);
  std::vector<std::string> found{};
  for (const auto term : kLegalTerms) {
    if (ContainsTerm(lowered, term)) {
      found.emplace_back(term);
    }
  }
  return found;
}

std::string TruncateUtf8(const std::string& text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return text.substr(0, cut);
}

bool IsIsoDate(std::string_view value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
  }
  const int month = (value[5] - '0') * 10 + (value[6] - '0');
  const int day = (value[8] - '0') * 10 + (value[9] - '0');
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

}  // namespace nyayacpp::text

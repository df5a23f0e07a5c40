#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace nyayacpp::text {

// Lower-cased alphanumeric tokens.
std::vector<std::string> Tokenize(std::string_view text);

std::vector<std::string> SplitWhitespaceTokens(std::string_view text);

std::string Trim(std::string_view text);
std::string ToLower(std::string_view text);

bool IsStopWord(std::string_view token);

// Terms from the fixed legal vocabulary that occur in `text`, in vocabulary order.
std::vector<std::string> ExtractLegalKeywords(std::string_view text);

// Prefix of at most `max_bytes` bytes that does not split a UTF-8 sequence.
std::string TruncateUtf8(const std::string& text, std::size_t max_bytes);

bool IsIsoDate(std::string_view value);

}  // namespace nyayacpp::text

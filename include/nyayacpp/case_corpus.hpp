#pragma once

#include "nyayacpp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nyayacpp {

// A row as produced by the dataset reader; every field may be absent.
struct RawCaseRecord {
  std::optional<std::string> case_id;
  std::optional<std::string> title;
  std::optional<std::string> citation;
  std::optional<std::string> court;
  std::optional<std::string> decision_date;
  std::optional<std::string> full_text;
  std::optional<std::string> judges;
  std::vector<std::string> tags;
};

struct CorpusLoadResult {
  std::vector<CaseRecord> records;
  std::vector<IndexingError> errors;
};

inline constexpr const char* kUntitledCase = "Untitled Case";
inline constexpr const char* kNoCitation = "No Citation";

// Throws DataValidationError when the id or text is missing.
[[nodiscard]] CaseRecord NormalizeCaseRecord(const RawCaseRecord& raw);

// Normalizes every row, skipping malformed and duplicate ones.
[[nodiscard]] CorpusLoadResult LoadCorpus(const std::vector<RawCaseRecord>& raw_records);

void ValidateCaseRecord(const CaseRecord& record);

// Accepts YYYY-MM-DD, YYYY/MM/DD, DD-MM-YYYY and DD/MM/YYYY; anything else maps to "Unknown".
[[nodiscard]] std::string NormalizeDecisionDate(const std::string& value);

[[nodiscard]] std::vector<std::string> CaseKeywords(const CaseRecord& record);

}  // namespace nyayacpp

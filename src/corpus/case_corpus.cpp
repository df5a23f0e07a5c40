#include "nyayacpp/case_corpus.hpp"
#include "nyayacpp/errors.hpp"

#include "../text/legal_text.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <vector>

namespace nyayacpp {
namespace {

std::string FieldOrDefault(const std::optional<std::string>& value, const char* fallback) {
  if (!value.has_value()) {
    return fallback;
  }
  auto trimmed = text::Trim(*value);
  if (trimmed.empty()) {
    return fallback;
  }
  return trimmed;
}

bool AllDigits(const std::string& value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::vector<std::string> SplitJudges(const std::string& judges) {
  std::vector<std::string> out{};
  std::string current{};
  for (const char ch : judges) {
    if (ch == ',' || ch == ';') {
      auto name = text::Trim(current);
      if (!name.empty()) {
        out.push_back(std::move(name));
      }
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  auto name = text::Trim(current);
  if (!name.empty()) {
    out.push_back(std::move(name));
  }
  return out;
}

}  // namespace

std::string NormalizeDecisionDate(const std::string& value) {
  const auto trimmed = text::Trim(value);
  if (trimmed.size() != 10) {
    return kUnknownField;
  }
  const char sep = trimmed[4] == '-' || trimmed[4] == '/' ? trimmed[4] : trimmed[2];
  if (sep != '-' && sep != '/') {
    return kUnknownField;
  }

  std::string year{};
  std::string month{};
  std::string day{};
  if (trimmed[4] == sep && trimmed[7] == sep) {
    year = trimmed.substr(0, 4);
    month = trimmed.substr(5, 2);
    day = trimmed.substr(8, 2);
  } else if (trimmed[2] == sep && trimmed[5] == sep) {
    day = trimmed.substr(0, 2);
    month = trimmed.substr(3, 2);
    year = trimmed.substr(6, 4);
  } else {
    return kUnknownField;
  }
  if (!AllDigits(year) || !AllDigits(month) || !AllDigits(day)) {
    return kUnknownField;
  }
  const auto iso = year + "-" + month + "-" + day;
  return text::IsIsoDate(iso) ? iso : std::string(kUnknownField);
}

CaseRecord NormalizeCaseRecord(const RawCaseRecord& raw) {
  const auto case_id = raw.case_id.has_value() ? text::Trim(*raw.case_id) : std::string{};
  if (case_id.empty()) {
    throw DataValidationError("case record is missing case_id");
  }
  if (!raw.full_text.has_value() || text::Trim(*raw.full_text).empty()) {
    throw DataValidationError("case " + case_id + " has empty full_text");
  }

  CaseRecord record{};
  record.case_id = case_id;
  record.title = FieldOrDefault(raw.title, kUntitledCase);
  record.citation = FieldOrDefault(raw.citation, kNoCitation);
  record.court = FieldOrDefault(raw.court, kUnknownField);
  record.decision_date = NormalizeDecisionDate(raw.decision_date.value_or(std::string{}));
  record.full_text = *raw.full_text;
  if (raw.judges.has_value()) {
    record.judges = SplitJudges(*raw.judges);
  }
  for (const auto& tag : raw.tags) {
    auto trimmed = text::Trim(tag);
    if (!trimmed.empty()) {
      record.tags.push_back(std::move(trimmed));
    }
  }
  if (text::IsIsoDate(record.decision_date)) {
    record.year = std::stoi(record.decision_date.substr(0, 4));
  }
  return record;
}

CorpusLoadResult LoadCorpus(const std::vector<RawCaseRecord>& raw_records) {
  CorpusLoadResult result{};
  result.records.reserve(raw_records.size());
  std::unordered_set<std::string> seen{};
  for (std::size_t i = 0; i < raw_records.size(); ++i) {
    const auto& raw = raw_records[i];
    const auto label = raw.case_id.value_or("row " + std::to_string(i));
    try {
      auto record = NormalizeCaseRecord(raw);
      if (!seen.insert(record.case_id).second) {
        result.errors.push_back({record.case_id, "duplicate case_id"});
        continue;
      }
      result.records.push_back(std::move(record));
    } catch (const DataValidationError& ex) {
      result.errors.push_back({label, ex.what()});
    }
  }
  return result;
}

void ValidateCaseRecord(const CaseRecord& record) {
  if (text::Trim(record.case_id).empty()) {
    throw DataValidationError("case record is missing case_id");
  }
  if (record.case_id != text::Trim(record.case_id)) {
    throw DataValidationError("case_id has surrounding whitespace: '" + record.case_id + "'");
  }
  if (text::Trim(record.full_text).empty()) {
    throw DataValidationError("case " + record.case_id + " has empty full_text");
  }
}

std::vector<std::string> CaseKeywords(const CaseRecord& record) {
  auto keywords = text::ExtractLegalKeywords(record.title + "\n" + record.full_text);
  for (const auto& tag : record.tags) {
    auto lowered = text::ToLower(tag);
    if (std::find(keywords.begin(), keywords.end(), lowered) == keywords.end()) {
      keywords.push_back(std::move(lowered));
    }
  }
  return keywords;
}

}  // namespace nyayacpp

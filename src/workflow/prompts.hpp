#pragma once

#include "nyayacpp/generation.hpp"
#include "nyayacpp/types.hpp"
#include "nyayacpp/workflow.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace nyayacpp::prompts {

struct AnalysisResult {
  std::vector<std::string> issues;
  std::vector<std::string> keywords;
};

struct SynthesisResult {
  std::string answer;
  std::vector<std::string> follow_ups;
};

[[nodiscard]] GenerationRequest AnalysisRequest(const std::string& query, const WorkflowConfig& config);
// Reads `- item` bullets under "LEGAL ISSUES:" and "KEYWORDS:" headings.
[[nodiscard]] AnalysisResult ParseAnalysis(std::string_view response,
                                           std::size_t max_issues,
                                           std::size_t max_keywords);

// Joined text of the case's retrieved segments, best first, capped at `max_bytes`.
[[nodiscard]] std::string SegmentContext(const RetrievedCase& retrieved, std::size_t max_segments, std::size_t max_bytes);

[[nodiscard]] GenerationRequest SummaryRequest(const RetrievedCase& retrieved, const WorkflowConfig& config);

// Agentic synthesis over case summaries.
[[nodiscard]] GenerationRequest SynthesisRequest(const WorkflowState& state, const WorkflowConfig& config);
// Direct synthesis over raw segment text of the first `case_count` retrieved cases.
[[nodiscard]] GenerationRequest DirectSynthesisRequest(const WorkflowState& state,
                                                       std::size_t case_count,
                                                       const WorkflowConfig& config);

// Splits the answer from a trailing "FOLLOW-UP QUESTIONS:" list.
[[nodiscard]] SynthesisResult ParseSynthesis(std::string_view response);

// Pads `follow_ups` with deterministic questions up to `min_count` and truncates to `max_count`.
[[nodiscard]] std::vector<std::string> ClampFollowUps(std::vector<std::string> follow_ups,
                                                      const WorkflowState& state,
                                                      std::size_t min_count,
                                                      std::size_t max_count);

// True when `answer` names at least one of `cases` by title or citation.
[[nodiscard]] bool MentionsAnyCase(const std::string& answer, const std::vector<RetrievedCase>& cases);
[[nodiscard]] std::string SourcesLine(const std::vector<RetrievedCase>& cases);

// Answer assembled from summaries (or segment text) when the synthesis call is unavailable.
[[nodiscard]] std::string ExtractiveAnswer(const WorkflowState& state, std::size_t case_count);

}  // namespace nyayacpp::prompts

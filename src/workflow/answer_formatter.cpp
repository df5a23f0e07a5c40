#include "nyayacpp/answer_formatter.hpp"

#include <string>
#include <vector>

namespace nyayacpp {
namespace {

std::string OrUnknown(const std::string& value) {
  return value.empty() ? std::string(kUnknownField) : value;
}

}  // namespace

StructuredAnswer FormatAnswer(const WorkflowState& state) {
  StructuredAnswer answer{};
  answer.query = state.query;
  answer.answer = state.final_answer;
  answer.path = state.path;
  answer.degraded = IsDegraded(state);

  answer.related_cases.reserve(state.retrieved_cases.size());
  for (const auto& retrieved : state.retrieved_cases) {
    answer.related_cases.push_back(RelatedCase{
        .case_id = retrieved.case_id,
        .title = OrUnknown(retrieved.title),
        .citation = OrUnknown(retrieved.citation),
        .court = OrUnknown(retrieved.court),
        .decision_date = OrUnknown(retrieved.decision_date),
    });
  }

  if (state.path == AnswerPath::kAgentic) {
    answer.legal_issues = state.extracted_issues;
  }
  answer.follow_up_questions = state.follow_up_questions;
  answer.reasoning_steps = state.reasoning_steps;

  answer.processing_info.cases_retrieved = static_cast<int>(state.retrieved_cases.size());
  answer.processing_info.cases_analyzed = state.path == AnswerPath::kAgentic
                                              ? static_cast<int>(state.summaries.size())
                                              : state.cases_in_context;
  return answer;
}

}  // namespace nyayacpp

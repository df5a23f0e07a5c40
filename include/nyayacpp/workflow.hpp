#pragma once

#include "nyayacpp/generation.hpp"
#include "nyayacpp/retrieval_engine.hpp"
#include "nyayacpp/types.hpp"

#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace nyayacpp {

inline constexpr const char* kInsufficientEvidenceNotice =
    "Insufficient evidence: no relevant cases were found in the indexed corpus for this query.";

inline constexpr const char* kStepAnalyzing = "Analyzing query for legal issues and keywords";
inline constexpr const char* kStepRetrieving = "Retrieving relevant legal cases from database";
inline constexpr const char* kStepSummarizing = "Summarizing key arguments from retrieved cases";
inline constexpr const char* kStepSynthesizing = "Synthesizing legal analysis and generating final answer";

enum class WorkflowStage {
  kAnalyzing,
  kRetrieving,
  kSummarizing,
  kSynthesizing,
  kDone,
  kFailed,
};

enum class OutcomeKind {
  kOk,
  kDegraded,
  kFatal,
};

struct StageOutcome {
  WorkflowStage stage = WorkflowStage::kAnalyzing;
  OutcomeKind kind = OutcomeKind::kOk;
  std::string reason;
};

struct CaseSummary {
  std::string case_id;
  std::string title;
  std::string citation;
  std::string summary;
};

struct SummaryFailure {
  std::string case_id;
  std::string reason;
};

// Everything one workflow execution knows. Stages take it by value and return the successor.
struct WorkflowState {
  std::string query;
  AnswerPath path = AnswerPath::kAgentic;
  WorkflowStage stage = WorkflowStage::kAnalyzing;

  int top_k_cases = 0;
  int cases_analyzed_cap = 0;
  SearchFilters filters{};

  std::vector<std::string> extracted_issues;
  std::vector<std::string> keywords;
  // False when the issues are the raw-query fallback.
  bool issues_generated = false;

  std::vector<RetrievedCase> retrieved_cases;
  bool evidence_found = false;

  std::vector<CaseSummary> summaries;
  std::vector<SummaryFailure> summary_failures;
  // Cases whose segments were placed in the direct-path synthesis prompt.
  int cases_in_context = 0;

  std::string final_answer;
  std::vector<std::string> follow_up_questions;
  std::vector<std::string> reasoning_steps;
  std::vector<StageOutcome> outcomes;

  std::string failure_reason;
  // Set when FAILED was caused by a configuration-level exception.
  std::exception_ptr fatal_error;
};

[[nodiscard]] const char* StageName(WorkflowStage stage);
[[nodiscard]] bool IsDegraded(const WorkflowState& state);

struct WorkflowRunOptions {
  bool use_agentic = true;
  // Zero selects the configured default.
  int top_k_cases = 0;
  int cases_analyzed = 0;
  SearchFilters filters{};
};

class LegalReasoningWorkflow {
 public:
  LegalReasoningWorkflow(std::shared_ptr<GenerationClient> generator,
                         std::shared_ptr<const RetrievalEngine> retrieval,
                         WorkflowConfig config = {},
                         ProviderPolicies policies = {});

  [[nodiscard]] WorkflowState Begin(const std::string& query, const WorkflowRunOptions& options) const;

  // Each stage requires `state.stage` to name it and throws std::logic_error otherwise.
  [[nodiscard]] WorkflowState Analyze(WorkflowState state) const;
  [[nodiscard]] WorkflowState RetrieveCases(WorkflowState state) const;
  [[nodiscard]] WorkflowState Summarize(WorkflowState state) const;
  [[nodiscard]] WorkflowState Synthesize(WorkflowState state) const;

  // Runs stages until DONE or FAILED.
  [[nodiscard]] WorkflowState Run(const std::string& query, const WorkflowRunOptions& options) const;

  const WorkflowConfig& config() const { return config_; }

 private:
  std::string GenerateWithPolicy(const CallPolicy& policy, const std::string& what, GenerationRequest request) const;

  std::shared_ptr<GenerationClient> generator_;
  std::shared_ptr<const RetrievalEngine> retrieval_;
  WorkflowConfig config_;
  ProviderPolicies policies_;
};

}  // namespace nyayacpp

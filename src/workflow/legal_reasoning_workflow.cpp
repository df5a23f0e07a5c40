#include "nyayacpp/workflow.hpp"
#include "nyayacpp/errors.hpp"
#include "nyayacpp/provider_call.hpp"

#include "prompts.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nyayacpp {
namespace {

void RequireStage(const WorkflowState& state, WorkflowStage expected, const char* operation) {
  if (state.stage != expected) {
    throw std::logic_error(std::string("LegalReasoningWorkflow::") + operation + " called in stage " +
                           StageName(state.stage) + ", expected " + StageName(expected));
  }
}

void Record(WorkflowState& state, WorkflowStage stage, OutcomeKind kind, std::string reason) {
  if (kind == OutcomeKind::kDegraded) {
    spdlog::warn("workflow {}: degraded: {}", StageName(stage), reason);
  }
  state.outcomes.push_back(StageOutcome{.stage = stage, .kind = kind, .reason = std::move(reason)});
}

WorkflowState Fail(WorkflowState state, WorkflowStage stage, std::string reason, std::exception_ptr error) {
  spdlog::error("workflow {}: failed: {}", StageName(stage), reason);
  state.failure_reason = reason;
  state.fatal_error = std::move(error);
  state.outcomes.push_back(StageOutcome{.stage = stage, .kind = OutcomeKind::kFatal, .reason = std::move(reason)});
  state.stage = WorkflowStage::kFailed;
  return state;
}

std::size_t ContextCaseCount(const WorkflowState& state) {
  const auto cap = static_cast<std::size_t>(std::max(state.cases_analyzed_cap, 0));
  return std::min(state.retrieved_cases.size(), cap);
}

// Cases whose content reached the synthesis prompt.
std::vector<RetrievedCase> CasesInContext(const WorkflowState& state) {
  std::vector<RetrievedCase> cases{};
  if (state.path == AnswerPath::kAgentic && !state.summaries.empty()) {
    for (const auto& summary : state.summaries) {
      const auto it = std::find_if(state.retrieved_cases.begin(),
                                   state.retrieved_cases.end(),
                                   [&](const RetrievedCase& c) { return c.case_id == summary.case_id; });
      if (it != state.retrieved_cases.end()) {
        cases.push_back(*it);
      }
    }
    return cases;
  }
  const auto count = ContextCaseCount(state);
  cases.assign(state.retrieved_cases.begin(), state.retrieved_cases.begin() + static_cast<std::ptrdiff_t>(count));
  return cases;
}

}  // namespace

const char* StageName(WorkflowStage stage) {
  switch (stage) {
    case WorkflowStage::kAnalyzing:
      return "ANALYZING";
    case WorkflowStage::kRetrieving:
      return "RETRIEVING";
    case WorkflowStage::kSummarizing:
      return "SUMMARIZING";
    case WorkflowStage::kSynthesizing:
      return "SYNTHESIZING";
    case WorkflowStage::kDone:
      return "DONE";
    case WorkflowStage::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

bool IsDegraded(const WorkflowState& state) {
  return std::any_of(state.outcomes.begin(), state.outcomes.end(), [](const StageOutcome& outcome) {
    return outcome.kind == OutcomeKind::kDegraded;
  });
}

LegalReasoningWorkflow::LegalReasoningWorkflow(std::shared_ptr<GenerationClient> generator,
                                               std::shared_ptr<const RetrievalEngine> retrieval,
                                               WorkflowConfig config,
                                               ProviderPolicies policies)
    : generator_(std::move(generator)),
      retrieval_(std::move(retrieval)),
      config_(config),
      policies_(policies) {
  if (generator_ == nullptr || retrieval_ == nullptr) {
    throw ConfigurationError("LegalReasoningWorkflow requires a generation client and a retrieval engine");
  }
}

std::string LegalReasoningWorkflow::GenerateWithPolicy(const CallPolicy& policy,
                                                       const std::string& what,
                                                       GenerationRequest request) const {
  auto generator = generator_;
  return CallWithPolicy(policy, what, [generator, request = std::move(request)]() {
    return generator->Generate(request);
  });
}

WorkflowState LegalReasoningWorkflow::Begin(const std::string& query, const WorkflowRunOptions& options) const {
  WorkflowState state{};
  state.query = query;
  state.path = options.use_agentic ? AnswerPath::kAgentic : AnswerPath::kDirect;
  state.stage = options.use_agentic ? WorkflowStage::kAnalyzing : WorkflowStage::kRetrieving;
  state.top_k_cases = options.top_k_cases > 0 ? options.top_k_cases : retrieval_->config().top_k_cases;
  state.cases_analyzed_cap = options.cases_analyzed > 0 ? options.cases_analyzed : config_.cases_analyzed;
  state.filters = options.filters;
  return state;
}

WorkflowState LegalReasoningWorkflow::Analyze(WorkflowState state) const {
  RequireStage(state, WorkflowStage::kAnalyzing, "Analyze");
  state.reasoning_steps.emplace_back(kStepAnalyzing);

  std::optional<std::string> degraded_reason{};
  try {
    const auto response =
        GenerateWithPolicy(policies_.analysis, "query analysis", prompts::AnalysisRequest(state.query, config_));
    auto parsed = prompts::ParseAnalysis(response,
                                         static_cast<std::size_t>(config_.max_issues),
                                         static_cast<std::size_t>(config_.max_keywords));
    if (parsed.issues.empty()) {
      degraded_reason = "analysis response contained no legal issues";
    } else {
      state.extracted_issues = std::move(parsed.issues);
      state.keywords = parsed.keywords.empty() ? std::vector<std::string>{state.query} : std::move(parsed.keywords);
      state.issues_generated = true;
    }
  } catch (const ConfigurationError& e) {
    return Fail(std::move(state), WorkflowStage::kAnalyzing, e.what(), std::current_exception());
  } catch (const ProviderError& e) {
    degraded_reason = std::string("query analysis unavailable: ") + e.what();
  }

  if (degraded_reason.has_value()) {
    state.extracted_issues = {state.query};
    state.keywords = {state.query};
    state.issues_generated = false;
    Record(state, WorkflowStage::kAnalyzing, OutcomeKind::kDegraded, std::move(*degraded_reason));
  } else {
    Record(state, WorkflowStage::kAnalyzing, OutcomeKind::kOk, {});
  }
  state.stage = WorkflowStage::kRetrieving;
  return state;
}

WorkflowState LegalReasoningWorkflow::RetrieveCases(WorkflowState state) const {
  RequireStage(state, WorkflowStage::kRetrieving, "RetrieveCases");
  state.reasoning_steps.emplace_back(kStepRetrieving);

  try {
    auto result = retrieval_->Retrieve(state.query, state.top_k_cases, 0, state.filters);
    state.retrieved_cases = std::move(result.cases);
  } catch (const ConfigurationError& e) {
    return Fail(std::move(state), WorkflowStage::kRetrieving, e.what(), std::current_exception());
  } catch (const DimensionMismatchError& e) {
    return Fail(std::move(state), WorkflowStage::kRetrieving, e.what(), std::current_exception());
  } catch (const ProviderError& e) {
    if (!state.issues_generated) {
      return Fail(std::move(state),
                  WorkflowStage::kRetrieving,
                  std::string("no provider reachable: ") + e.what(),
                  nullptr);
    }
    state.retrieved_cases.clear();
    state.evidence_found = false;
    Record(state, WorkflowStage::kRetrieving, OutcomeKind::kDegraded,
           std::string("retrieval unavailable: ") + e.what());
    state.stage = WorkflowStage::kSynthesizing;
    return state;
  }

  state.evidence_found = !state.retrieved_cases.empty();
  if (!state.evidence_found) {
    Record(state, WorkflowStage::kRetrieving, OutcomeKind::kOk, "no evidence found");
    state.stage = WorkflowStage::kSynthesizing;
    return state;
  }
  Record(state, WorkflowStage::kRetrieving, OutcomeKind::kOk, {});
  state.stage = state.path == AnswerPath::kAgentic ? WorkflowStage::kSummarizing : WorkflowStage::kSynthesizing;
  return state;
}

WorkflowState LegalReasoningWorkflow::Summarize(WorkflowState state) const {
  RequireStage(state, WorkflowStage::kSummarizing, "Summarize");
  state.reasoning_steps.emplace_back(kStepSummarizing);

  const auto count = ContextCaseCount(state);
  std::vector<std::future<std::string>> pending{};
  pending.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto request = prompts::SummaryRequest(state.retrieved_cases[i], config_);
    pending.push_back(std::async(std::launch::async, [this, request = std::move(request)]() mutable {
      return GenerateWithPolicy(policies_.summarization, "case summarization", std::move(request));
    }));
  }

  std::exception_ptr configuration_error{};
  std::string configuration_reason{};
  // Collected in rank order regardless of completion order.
  for (std::size_t i = 0; i < count; ++i) {
    const auto& retrieved = state.retrieved_cases[i];
    try {
      auto summary = pending[i].get();
      state.summaries.push_back(CaseSummary{
          .case_id = retrieved.case_id,
          .title = retrieved.title,
          .citation = retrieved.citation,
          .summary = std::move(summary),
      });
    } catch (const ConfigurationError& e) {
      if (configuration_error == nullptr) {
        configuration_error = std::current_exception();
        configuration_reason = e.what();
      }
    } catch (const ProviderError& e) {
      spdlog::warn("workflow SUMMARIZING: case {} failed: {}", retrieved.case_id, e.what());
      state.summary_failures.push_back(SummaryFailure{.case_id = retrieved.case_id, .reason = e.what()});
    } catch (const std::exception& e) {
      // Client-side failures (prompt files, third-party clients) stay confined to their case.
      spdlog::warn("workflow SUMMARIZING: case {} failed in the client: {}", retrieved.case_id, e.what());
      state.summary_failures.push_back(
          SummaryFailure{.case_id = retrieved.case_id, .reason = std::string("client error: ") + e.what()});
    }
  }
  if (configuration_error != nullptr) {
    return Fail(std::move(state), WorkflowStage::kSummarizing, configuration_reason, configuration_error);
  }

  if (state.summary_failures.empty()) {
    Record(state, WorkflowStage::kSummarizing, OutcomeKind::kOk, {});
  } else {
    Record(state,
           WorkflowStage::kSummarizing,
           OutcomeKind::kDegraded,
           std::to_string(state.summary_failures.size()) + " of " + std::to_string(count) +
               " case summaries failed");
  }
  state.stage = WorkflowStage::kSynthesizing;
  return state;
}

WorkflowState LegalReasoningWorkflow::Synthesize(WorkflowState state) const {
  RequireStage(state, WorkflowStage::kSynthesizing, "Synthesize");
  state.reasoning_steps.emplace_back(kStepSynthesizing);

  const auto min_follow_ups = static_cast<std::size_t>(config_.min_follow_ups);
  const auto max_follow_ups = static_cast<std::size_t>(config_.max_follow_ups);

  if (!state.evidence_found) {
    state.final_answer = kInsufficientEvidenceNotice;
    state.final_answer += " The answer cannot be grounded in prior judgments; please refine the query or broaden the "
                          "filters.";
    state.follow_up_questions = prompts::ClampFollowUps({}, state, min_follow_ups, max_follow_ups);
    Record(state, WorkflowStage::kSynthesizing, OutcomeKind::kOk, "insufficient evidence");
    state.stage = WorkflowStage::kDone;
    return state;
  }

  const auto context_count = ContextCaseCount(state);
  if (state.path == AnswerPath::kDirect) {
    state.cases_in_context = static_cast<int>(context_count);
  }
  const auto request = state.path == AnswerPath::kAgentic
                           ? prompts::SynthesisRequest(state, config_)
                           : prompts::DirectSynthesisRequest(state, context_count, config_);

  std::optional<std::string> degraded_reason{};
  prompts::SynthesisResult parsed{};
  try {
    parsed = prompts::ParseSynthesis(GenerateWithPolicy(policies_.synthesis, "answer synthesis", request));
    if (parsed.answer.empty()) {
      degraded_reason = "synthesis response contained no answer";
    }
  } catch (const ConfigurationError& e) {
    return Fail(std::move(state), WorkflowStage::kSynthesizing, e.what(), std::current_exception());
  } catch (const ProviderError& e) {
    degraded_reason = std::string("answer synthesis unavailable: ") + e.what();
  }

  if (degraded_reason.has_value()) {
    state.final_answer = prompts::ExtractiveAnswer(state, context_count);
    state.follow_up_questions = prompts::ClampFollowUps({}, state, min_follow_ups, max_follow_ups);
    Record(state, WorkflowStage::kSynthesizing, OutcomeKind::kDegraded, std::move(*degraded_reason));
    state.stage = WorkflowStage::kDone;
    return state;
  }

  const auto cited = CasesInContext(state);
  state.final_answer = std::move(parsed.answer);
  if (!cited.empty() && !prompts::MentionsAnyCase(state.final_answer, cited)) {
    state.final_answer += "\n\n" + prompts::SourcesLine(cited);
  }
  state.follow_up_questions =
      prompts::ClampFollowUps(std::move(parsed.follow_ups), state, min_follow_ups, max_follow_ups);
  Record(state, WorkflowStage::kSynthesizing, OutcomeKind::kOk, {});
  state.stage = WorkflowStage::kDone;
  return state;
}

WorkflowState LegalReasoningWorkflow::Run(const std::string& query, const WorkflowRunOptions& options) const {
  auto state = Begin(query, options);
  spdlog::info("workflow: answering query via {} path", options.use_agentic ? "agentic" : "direct");
  while (state.stage != WorkflowStage::kDone && state.stage != WorkflowStage::kFailed) {
    switch (state.stage) {
      case WorkflowStage::kAnalyzing:
        state = Analyze(std::move(state));
        break;
      case WorkflowStage::kRetrieving:
        state = RetrieveCases(std::move(state));
        break;
      case WorkflowStage::kSummarizing:
        state = Summarize(std::move(state));
        break;
      case WorkflowStage::kSynthesizing:
        state = Synthesize(std::move(state));
        break;
      case WorkflowStage::kDone:
      case WorkflowStage::kFailed:
        break;
    }
  }
  return state;
}

}  // namespace nyayacpp

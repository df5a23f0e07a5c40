#include "nyayacpp/errors.hpp"
#include "nyayacpp/legal_assistant.hpp"
#include "nyayacpp/vector_index.hpp"

#include "../test_fakes.hpp"
#include "../test_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

nyayacpp::AssistantConfig FastConfig() {
  const nyayacpp::CallPolicy fast{std::chrono::milliseconds(0), 1, std::chrono::milliseconds(1)};
  nyayacpp::AssistantConfig config{};
  config.policies = nyayacpp::ProviderPolicies{
      .analysis = fast,
      .retrieval_embedding = fast,
      .summarization = fast,
      .synthesis = fast,
      .indexing_embedding = fast,
  };
  return config;
}

struct Harness {
  std::shared_ptr<nyayacpp::tests::ControllableEmbedder> embedder;
  std::shared_ptr<nyayacpp::tests::ScriptedGenerationClient> generator;
  std::unique_ptr<nyayacpp::LegalAssistant> assistant;
};

Harness MakeHarness(const std::filesystem::path& storage_dir = {},
                    nyayacpp::tests::ScriptedGenerationClient::Responder responder = nyayacpp::tests::CannedResponse) {
  Harness harness{};
  harness.embedder = std::make_shared<nyayacpp::tests::ControllableEmbedder>(64);
  harness.generator = std::make_shared<nyayacpp::tests::ScriptedGenerationClient>(std::move(responder));
  harness.assistant =
      std::make_unique<nyayacpp::LegalAssistant>(storage_dir, FastConfig(), harness.embedder, harness.generator);
  return harness;
}

std::vector<nyayacpp::CaseRecord> PrivacyCorpus() {
  return {
      nyayacpp::tests::MakeCase("A", "Puttaswamy v Union of India",
                                "The right to privacy is a fundamental right protected under Article 21."),
      nyayacpp::tests::MakeCase("B", "Carlill v Carbolic Smoke Ball",
                                "A unilateral offer of a reward forms a binding contract upon performance.",
                                "Court of Appeal", "1892-12-07"),
  };
}

std::vector<nyayacpp::CaseRecord> ShortCases(int count) {
  std::vector<nyayacpp::CaseRecord> cases{};
  for (int i = 0; i < count; ++i) {
    const auto id = "S" + std::to_string(i);
    cases.push_back(nyayacpp::tests::MakeCase(id, "Short case " + id, "Brief judgment number " + id + "."));
  }
  return cases;
}

std::string LongText() {
  std::string text{};
  for (int i = 0; i < 12; ++i) {
    text += "Paragraph " + std::to_string(i) + " of the judgment discusses liberty. ";
  }
  return text;
}

void ScenarioDirectAnswerCitesTopCase() {
  nyayacpp::tests::Log("scenario: direct answer ranks and cites the privacy case");
  auto harness = MakeHarness();
  const auto report = harness.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);
  Require(report.cases_indexed == 2 && report.errors.empty(), "both cases must index");

  const auto answer = harness.assistant->AnswerQuery("Is privacy a fundamental right?", false, 2, 2);
  Require(answer.path == nyayacpp::AnswerPath::kDirect, "direct path expected");
  Require(!answer.related_cases.empty() && answer.related_cases[0].case_id == "A", "privacy case must rank first");
  Require(Contains(answer.answer, "Puttaswamy v Union of India"), "answer must cite the top case");
  Require(answer.legal_issues.empty(), "direct path reports no legal issues");
  Require(answer.processing_info.cases_retrieved == 2, "two related cases expected");
  Require(answer.processing_info.cases_analyzed == 2, "both cases were placed in context");
  Require(answer.reasoning_steps.size() == 2, "direct path has two steps");
  Require(answer.follow_up_questions.size() >= 2 && answer.follow_up_questions.size() <= 4, "follow-up bounds");
  Require(harness.generator->analysis_calls() == 0, "direct path must not analyze");
}

void ScenarioAgenticAnswer() {
  nyayacpp::tests::Log("scenario: agentic answer reports issues and analyzed cases");
  auto harness = MakeHarness();
  (void)harness.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);

  nyayacpp::QueryOptions options{};
  options.cases_analyzed = 1;
  const auto answer = harness.assistant->AnswerQuery("Is privacy a fundamental right?", options);
  Require(answer.path == nyayacpp::AnswerPath::kAgentic, "agentic path expected");
  Require(answer.legal_issues.size() == 2, "generated legal issues expected");
  Require(answer.processing_info.cases_analyzed == 1, "cases_analyzed must respect the cap");
  Require(answer.reasoning_steps.size() == 4, "agentic path has four steps");
  Require(!answer.degraded, "clean run must not be degraded");
}

void ScenarioLargeTopKAnswersFromEvidence() {
  nyayacpp::tests::Log("scenario: very large top_k still answers from the indexed case");
  auto harness = MakeHarness();
  (void)harness.assistant->IndexCorpus(
      {nyayacpp::tests::MakeCase("P", "Right to Privacy", "Privacy rights are protected under Article 21.")},
      1024,
      128,
      100);
  const auto answer =
      harness.assistant->AnswerQuery("What are privacy rights?", false, std::numeric_limits<int>::max() / 2, 0);
  Require(answer.related_cases.size() == 1 && answer.related_cases[0].case_id == "P", "indexed case must be related");
  Require(!Contains(answer.answer, "Insufficient evidence"), "evidence must not be lost to the fanout");
}

void ScenarioReindexIsIdempotent() {
  nyayacpp::tests::Log("scenario: re-indexing the same corpus changes nothing");
  auto harness = MakeHarness();
  const auto first = harness.assistant->IndexCorpus(PrivacyCorpus(), 32, 8, 3);
  const auto status_after_first = harness.assistant->GetStatus();
  const auto second = harness.assistant->IndexCorpus(PrivacyCorpus(), 32, 8, 3);
  const auto status_after_second = harness.assistant->GetStatus();
  nyayacpp::tests::LogKV("segments_indexed", first.segments_indexed);
  nyayacpp::tests::LogKV("batches_committed", first.batches_committed);

  Require(first.segments_indexed == second.segments_indexed, "same segments must be produced");
  Require(second.segments_pruned == 0, "nothing may be pruned on identical segmentation");
  Require(status_after_first.indexed_segment_count == status_after_second.indexed_segment_count,
          "segment count must be stable");
  Require(status_after_second.indexed_segment_count == first.segments_indexed, "no duplicate segments");
  Require(status_after_second.indexed_case_count == 2, "case count must be stable");
  Require(first.batches_committed > 1, "small batches must produce several commits");
}

void ScenarioInterruptedIndexingConverges() {
  nyayacpp::tests::Log("scenario: interrupted indexing converges on rerun");
  nyayacpp::tests::ScopedDir dir("assistant_crash");
  const auto corpus = ShortCases(4);
  {
    auto harness = MakeHarness(dir.path());
    nyayacpp::vector::testing::FailCommitAfter(1);
    bool threw = false;
    try {
      (void)harness.assistant->IndexCorpus(corpus, 1024, 128, 2);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    nyayacpp::vector::testing::ClearCommitFailure();
    Require(threw, "second batch commit must fail");
    const auto partial = harness.assistant->GetStatus();
    Require(partial.indexed_segment_count == 2, "only the committed batch may be visible");
    Require(partial.indexed_case_count == 2, "only fully committed cases are cataloged");
  }

  auto reopened = MakeHarness(dir.path());
  Require(reopened.assistant->GetStatus().indexed_segment_count == 2, "committed batch must survive restart");
  const auto report = reopened.assistant->IndexCorpus(corpus, 1024, 128, 2);
  Require(report.cases_indexed == 4 && report.errors.empty(), "rerun must complete every case");
  const auto status = reopened.assistant->GetStatus();
  Require(status.indexed_segment_count == 4, "rerun must not duplicate segments");
  Require(status.indexed_case_count == 4, "every case must be cataloged");
}

void ScenarioResegmentationPrunes() {
  nyayacpp::tests::Log("scenario: coarser segmentation prunes stale segments");
  auto harness = MakeHarness();
  const std::vector<nyayacpp::CaseRecord> corpus = {nyayacpp::tests::MakeCase("L", "Long judgment", LongText())};

  const auto fine = harness.assistant->IndexCorpus(corpus, 64, 8, 100);
  Require(fine.segments_indexed > 3, "fine segmentation must produce several segments");
  const auto coarse = harness.assistant->IndexCorpus(corpus, 2048, 0, 100);
  Require(coarse.segments_indexed == 1, "coarse segmentation must produce one segment");
  Require(coarse.segments_pruned == fine.segments_indexed - 1, "stale segments must be pruned");
  Require(harness.assistant->GetStatus().indexed_segment_count == 1, "one segment must remain");
}

void ScenarioStatusReadiness() {
  nyayacpp::tests::Log("scenario: status reflects index and providers");
  auto harness = MakeHarness();
  auto status = harness.assistant->GetStatus();
  Require(status.indexed_segment_count == 0 && status.indexed_case_count == 0, "fresh assistant must be empty");
  Require(status.embedding_ready && status.generation_ready, "providers must be ready");
  Require(!status.ready, "empty index must not be ready");

  (void)harness.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);
  status = harness.assistant->GetStatus();
  Require(status.ready && status.indexed_case_count == 2, "indexed assistant must be ready");

  harness.generator->set_available(false);
  status = harness.assistant->GetStatus();
  Require(!status.generation_ready && !status.ready, "unavailable generator must clear readiness");
  harness.generator->set_available(true);
  harness.embedder->set_available(false);
  Require(!harness.assistant->GetStatus().ready, "unavailable embedder must clear readiness");
}

void ScenarioRebuildAndRemove() {
  nyayacpp::tests::Log("scenario: rebuild drops prior data, remove drops one case");
  auto harness = MakeHarness();
  (void)harness.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);
  Require(harness.assistant->GetCase("A").has_value(), "case must be retrievable");
  Require(!harness.assistant->Suggest("putt").empty(), "suggestions must find the case");

  Require(harness.assistant->RemoveCase("A"), "stored case must be removed");
  Require(!harness.assistant->RemoveCase("A"), "second removal must report nothing removed");
  Require(!harness.assistant->GetCase("A").has_value(), "removed case must be gone");
  Require(harness.assistant->Suggest("putt").empty(), "removed case must leave suggestions");
  Require(harness.assistant->GetStatus().indexed_case_count == 1, "one case must remain");

  nyayacpp::IndexOptions options{};
  options.rebuild = true;
  const auto report = harness.assistant->IndexCorpus(ShortCases(1), options);
  Require(report.cases_indexed == 1, "rebuild must index the new corpus");
  const auto status = harness.assistant->GetStatus();
  Require(status.indexed_case_count == 1 && status.indexed_segment_count == 1, "rebuild must drop old data");
  Require(!harness.assistant->GetCase("B").has_value(), "old case must be gone after rebuild");
}

void ScenarioIndexingErrorsReported() {
  nyayacpp::tests::Log("scenario: bad records and failed batches are reported, not fatal");
  auto harness = MakeHarness();
  auto corpus = ShortCases(3);
  nyayacpp::CaseRecord blank{};
  blank.case_id = "blank";
  blank.full_text = "   ";
  corpus.push_back(blank);
  corpus.push_back(corpus.front());

  harness.embedder->FailBatchAfter(1);
  const auto report = harness.assistant->IndexCorpus(corpus, 1024, 128, 1);
  Require(report.cases_indexed == 2, "two cases must survive the failed batch");
  Require(report.errors.size() == 3, "invalid, duplicate and embedding failures expected");
  const auto embedding_error = std::find_if(report.errors.begin(), report.errors.end(), [](const auto& error) {
    return error.case_id == "S1";
  });
  Require(embedding_error != report.errors.end() && Contains(embedding_error->message, "embedding failed"),
          "failed batch must name its case");
  Require(!harness.assistant->GetCase("S1").has_value(), "failed case must not be cataloged");
  Require(harness.assistant->GetCase("S2").has_value(), "later batches must still index");

  bool threw = false;
  try {
    (void)harness.assistant->IndexCorpus(corpus, 100, 100, 10);
  } catch (const nyayacpp::ConfigurationError&) {
    threw = true;
  }
  Require(threw, "overlap equal to chunk size must be rejected");
}

void ScenarioQueryFailures() {
  nyayacpp::tests::Log("scenario: query failures surface as typed errors");
  auto harness = MakeHarness();
  (void)harness.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);

  bool threw = false;
  try {
    (void)harness.assistant->AnswerQuery("   ", true, 0, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "blank query must be rejected");

  harness.embedder->set_failing(true);
  threw = false;
  try {
    (void)harness.assistant->AnswerQuery("Is privacy a fundamental right?", false, 0, 0);
  } catch (const nyayacpp::ProviderUnavailableError&) {
    threw = true;
  }
  Require(threw, "direct path without embeddings must report the outage");
  harness.embedder->set_failing(false);

  auto misconfigured = MakeHarness({}, [](const nyayacpp::GenerationRequest& request) -> std::string {
    if (nyayacpp::tests::ClassifyRequest(request) == nyayacpp::tests::RequestKind::kSynthesis) {
      throw nyayacpp::ConfigurationError("model not found");
    }
    return nyayacpp::tests::CannedResponse(request);
  });
  (void)misconfigured.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);
  threw = false;
  try {
    (void)misconfigured.assistant->AnswerQuery("Is privacy a fundamental right?", true, 0, 0);
  } catch (const nyayacpp::ConfigurationError& e) {
    threw = std::string(e.what()) == "model not found";
  }
  Require(threw, "configuration error must be rethrown unchanged");
}

void ScenarioFilteredQueryWithoutEvidence() {
  nyayacpp::tests::Log("scenario: filters excluding every case yield the insufficient-evidence answer");
  auto harness = MakeHarness();
  (void)harness.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);
  nyayacpp::QueryOptions options{};
  options.use_agentic = false;
  options.filters.court = "District Court";
  const auto answer = harness.assistant->AnswerQuery("Is privacy a fundamental right?", options);
  Require(answer.related_cases.empty(), "no related cases expected");
  Require(answer.answer.rfind(nyayacpp::kInsufficientEvidenceNotice, 0) == 0, "notice must lead the answer");
  Require(harness.generator->synthesis_calls() == 0, "no synthesis call without evidence");
}

void ScenarioPersistentStorage() {
  nyayacpp::tests::Log("scenario: indexed corpus survives restart");
  nyayacpp::tests::ScopedDir dir("assistant_persist");
  {
    auto harness = MakeHarness(dir.path());
    (void)harness.assistant->IndexCorpus(PrivacyCorpus(), 1024, 128, 100);
  }
  Require(std::filesystem::exists(dir.path() / "segments.sqlite"), "segment store must exist on disk");
  Require(std::filesystem::exists(dir.path() / "cases.sqlite"), "case catalog must exist on disk");

  auto reopened = MakeHarness(dir.path());
  const auto status = reopened.assistant->GetStatus();
  Require(status.indexed_case_count == 2 && status.ready, "reopened assistant must be ready");
  const auto answer = reopened.assistant->AnswerQuery("Is privacy a fundamental right?", false, 1, 1);
  Require(answer.related_cases.size() == 1 && answer.related_cases[0].case_id == "A", "reopened retrieval mismatch");
}

}  // namespace

int main() {
  try {
    nyayacpp::tests::Log("legal_assistant_test: start");
    ScenarioDirectAnswerCitesTopCase();
    ScenarioAgenticAnswer();
    ScenarioLargeTopKAnswersFromEvidence();
    ScenarioReindexIsIdempotent();
    ScenarioInterruptedIndexingConverges();
    ScenarioResegmentationPrunes();
    ScenarioStatusReadiness();
    ScenarioRebuildAndRemove();
    ScenarioIndexingErrorsReported();
    ScenarioQueryFailures();
    ScenarioFilteredQueryWithoutEvidence();
    ScenarioPersistentStorage();
    nyayacpp::tests::Log("legal_assistant_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    nyayacpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

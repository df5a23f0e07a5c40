#include "nyayacpp/legal_assistant.hpp"
#include "nyayacpp/answer_formatter.hpp"
#include "nyayacpp/case_corpus.hpp"
#include "nyayacpp/errors.hpp"
#include "nyayacpp/provider_call.hpp"
#include "nyayacpp/segmenter.hpp"

#include "../text/legal_text.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace nyayacpp {
namespace {

constexpr const char* kSegmentsDbName = "segments.sqlite";
constexpr const char* kCasesDbName = "cases.sqlite";

struct PendingCase {
  const CaseRecord* record = nullptr;
  std::uint32_t segment_count = 0;
  std::uint32_t committed = 0;
  bool failed = false;
};

struct PendingSegment {
  std::size_t case_slot = 0;
  Segment segment;
};

void RequirePositive(int value, const char* name) {
  if (value <= 0) {
    throw ConfigurationError(std::string(name) + " must be positive");
  }
}

void ValidatePolicy(const CallPolicy& policy, const char* name) {
  if (policy.timeout.count() < 0 || policy.backoff.count() < 0) {
    throw ConfigurationError(std::string(name) + " timeout and backoff must not be negative");
  }
  if (policy.max_retries < 0 || policy.max_retries > 1) {
    throw ConfigurationError(std::string(name) + " max_retries must be 0 or 1");
  }
}

std::filesystem::path StoragePath(const std::filesystem::path& storage_dir, const char* file_name) {
  if (storage_dir.empty()) {
    return {};
  }
  return storage_dir / file_name;
}

SegmentMetadata MetadataFor(const CaseRecord& record, const Segment& segment) {
  std::string judges{};
  for (const auto& judge : record.judges) {
    if (!judges.empty()) {
      judges += "; ";
    }
    judges += judge;
  }
  return SegmentMetadata{
      .case_id = record.case_id,
      .title = record.title,
      .citation = record.citation,
      .court = record.court,
      .decision_date = record.decision_date,
      .judges = judges.empty() ? std::string(kUnknownField) : judges,
      .sequence_index = segment.sequence_index,
      .start_offset = segment.start_offset,
      .end_offset = segment.end_offset,
  };
}

}  // namespace

void ValidateConfig(const AssistantConfig& config) {
  ValidateChunking(config.chunking);
  RequirePositive(config.ingest_batch_size, "ingest_batch_size");
  RequirePositive(config.suggestion_limit, "suggestion_limit");

  RequirePositive(config.retrieval.top_k_cases, "retrieval.top_k_cases");
  if (config.retrieval.fanout_multiplier <= 1) {
    throw ConfigurationError("retrieval.fanout_multiplier must be greater than 1");
  }

  const auto& workflow = config.workflow;
  RequirePositive(workflow.cases_analyzed, "workflow.cases_analyzed");
  RequirePositive(workflow.max_issues, "workflow.max_issues");
  RequirePositive(workflow.max_keywords, "workflow.max_keywords");
  RequirePositive(workflow.summary_context_chars, "workflow.summary_context_chars");
  RequirePositive(workflow.direct_context_segments_per_case, "workflow.direct_context_segments_per_case");
  RequirePositive(workflow.analysis_max_tokens, "workflow.analysis_max_tokens");
  RequirePositive(workflow.summary_max_tokens, "workflow.summary_max_tokens");
  RequirePositive(workflow.synthesis_max_tokens, "workflow.synthesis_max_tokens");
  if (workflow.min_follow_ups <= 0 || workflow.min_follow_ups > workflow.max_follow_ups) {
    throw ConfigurationError("workflow follow-up bounds must satisfy 0 < min_follow_ups <= max_follow_ups");
  }
  if (workflow.temperature < 0.0F || workflow.temperature > 2.0F) {
    throw ConfigurationError("workflow.temperature must be within [0, 2]");
  }

  ValidatePolicy(config.policies.analysis, "policies.analysis");
  ValidatePolicy(config.policies.retrieval_embedding, "policies.retrieval_embedding");
  ValidatePolicy(config.policies.summarization, "policies.summarization");
  ValidatePolicy(config.policies.synthesis, "policies.synthesis");
  ValidatePolicy(config.policies.indexing_embedding, "policies.indexing_embedding");
}

LegalAssistant::LegalAssistant(const std::filesystem::path& storage_dir,
                               const AssistantConfig& config,
                               std::shared_ptr<EmbeddingProvider> embedder,
                               std::shared_ptr<GenerationClient> generator)
    : config_(config), embedder_(std::move(embedder)), generator_(std::move(generator)) {
  ValidateConfig(config_);
  if (embedder_ == nullptr) {
    throw ConfigurationError("LegalAssistant requires an embedding provider");
  }
  if (generator_ == nullptr) {
    throw ConfigurationError("LegalAssistant requires a generation client");
  }
  if (!storage_dir.empty()) {
    std::filesystem::create_directories(storage_dir);
  }

  index_ = std::make_shared<VectorIndex>(StoragePath(storage_dir, kSegmentsDbName),
                                         embedder_->dimensions(),
                                         config_.vector_index.similarity);
  catalog_ = std::make_unique<CaseCatalog>(StoragePath(storage_dir, kCasesDbName));
  retrieval_ = std::make_shared<RetrievalEngine>(embedder_, index_, config_.retrieval,
                                                 config_.policies.retrieval_embedding);
  workflow_ = std::make_unique<LegalReasoningWorkflow>(generator_, retrieval_, config_.workflow, config_.policies);
  spdlog::info("legal assistant ready: {} segments across {} cases",
               index_->Count(),
               index_->CaseIds().size());
}

IndexingReport LegalAssistant::IndexCorpus(const std::vector<CaseRecord>& records,
                                           int chunk_size,
                                           int overlap,
                                           int batch_size) {
  return IndexCorpus(records,
                     IndexOptions{
                         .chunking = ChunkingStrategy{.chunk_size = chunk_size, .overlap = overlap},
                         .batch_size = batch_size,
                         .rebuild = false,
                     });
}

IndexingReport LegalAssistant::IndexCorpus(const std::vector<CaseRecord>& records, const IndexOptions& options) {
  ValidateChunking(options.chunking);
  RequirePositive(options.batch_size, "batch_size");

  std::lock_guard<std::mutex> lock(indexing_mutex_);
  IndexingReport report{};
  if (options.rebuild) {
    spdlog::info("indexing: rebuild requested, clearing {} segments", index_->Count());
    index_->Clear();
    catalog_->Clear();
  }

  std::vector<PendingCase> cases{};
  cases.reserve(records.size());
  std::unordered_set<std::string> seen{};
  for (const auto& record : records) {
    try {
      ValidateCaseRecord(record);
    } catch (const DataValidationError& e) {
      spdlog::warn("indexing: skipping record: {}", e.what());
      report.errors.push_back({record.case_id, e.what()});
      continue;
    }
    if (!seen.insert(record.case_id).second) {
      spdlog::warn("indexing: skipping duplicate case_id {}", record.case_id);
      report.errors.push_back({record.case_id, "duplicate case_id"});
      continue;
    }
    cases.push_back(PendingCase{.record = &record});
  }

  const auto batch_size = static_cast<std::size_t>(options.batch_size);
  std::vector<PendingSegment> batch{};
  batch.reserve(batch_size);

  auto flush = [&]() {
    if (batch.empty()) {
      return;
    }
    std::vector<std::string> texts{};
    texts.reserve(batch.size());
    for (const auto& pending : batch) {
      texts.push_back(SegmentEmbeddingInput(cases[pending.case_slot].record->title, pending.segment.text));
    }

    std::vector<std::vector<float>> vectors{};
    try {
      auto embedder = embedder_;
      vectors = CallWithPolicy(config_.policies.indexing_embedding,
                               "segment embedding",
                               [embedder, texts, batch_size]() { return EmbedTexts(*embedder, texts, batch_size); });
    } catch (const ProviderError& e) {
      for (const auto& pending : batch) {
        auto& owner = cases[pending.case_slot];
        if (!owner.failed) {
          owner.failed = true;
          report.errors.push_back({owner.record->case_id, std::string("embedding failed: ") + e.what()});
        }
      }
      spdlog::warn("indexing: embedding batch of {} segments failed: {}", batch.size(), e.what());
      batch.clear();
      return;
    }

    std::vector<IndexEntry> entries{};
    entries.reserve(batch.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
      const auto& pending = batch[i];
      const auto& owner = cases[pending.case_slot];
      if (owner.failed) {
        continue;
      }
      entries.push_back(IndexEntry{
          .segment_id = pending.segment.segment_id,
          .vector = std::move(vectors[i]),
          .text = pending.segment.text,
          .metadata = MetadataFor(*owner.record, pending.segment),
      });
    }
    if (entries.empty()) {
      batch.clear();
      return;
    }
    index_->Upsert(entries);
    report.segments_indexed += entries.size();
    ++report.batches_committed;

    for (const auto& pending : batch) {
      auto& owner = cases[pending.case_slot];
      if (owner.failed) {
        continue;
      }
      ++owner.committed;
      if (owner.committed == owner.segment_count) {
        // All segments of the case are durable; drop leftovers from a longer earlier segmentation.
        report.segments_pruned += index_->PruneCaseSegments(owner.record->case_id, owner.segment_count);
        catalog_->Upsert(*owner.record);
        ++report.cases_indexed;
      }
    }
    spdlog::info("indexing: committed batch {} ({} segments, {} total)",
                 report.batches_committed,
                 entries.size(),
                 report.segments_indexed);
    batch.clear();
  };

  for (std::size_t slot = 0; slot < cases.size(); ++slot) {
    auto segments = SegmentCase(*cases[slot].record, options.chunking);
    cases[slot].segment_count = static_cast<std::uint32_t>(segments.size());
    for (auto& segment : segments) {
      if (cases[slot].failed) {
        break;
      }
      batch.push_back(PendingSegment{.case_slot = slot, .segment = std::move(segment)});
      if (batch.size() >= batch_size) {
        flush();
      }
    }
  }
  flush();

  spdlog::info("indexing: {} cases, {} segments, {} pruned, {} errors",
               report.cases_indexed,
               report.segments_indexed,
               report.segments_pruned,
               report.errors.size());
  return report;
}

SystemStatus LegalAssistant::GetStatus() const {
  SystemStatus status{};
  status.indexed_segment_count = index_->Count();
  status.indexed_case_count = catalog_->Count();
  status.embedding_ready = embedder_->available();
  status.generation_ready = generator_->available();
  status.ready = status.indexed_segment_count > 0 && status.embedding_ready && status.generation_ready;
  return status;
}

StructuredAnswer LegalAssistant::AnswerQuery(const std::string& query,
                                             bool use_agentic,
                                             int top_k_cases,
                                             int cases_analyzed) {
  return AnswerQuery(query,
                     QueryOptions{
                         .use_agentic = use_agentic,
                         .top_k_cases = top_k_cases,
                         .cases_analyzed = cases_analyzed,
                         .filters = {},
                     });
}

StructuredAnswer LegalAssistant::AnswerQuery(const std::string& query, const QueryOptions& options) {
  if (text::Trim(query).empty()) {
    throw std::invalid_argument("AnswerQuery: query must not be empty");
  }
  if (options.top_k_cases < 0 || options.cases_analyzed < 0) {
    throw std::invalid_argument("AnswerQuery: top_k_cases and cases_analyzed must not be negative");
  }

  const auto state = workflow_->Run(query,
                                    WorkflowRunOptions{
                                        .use_agentic = options.use_agentic,
                                        .top_k_cases = options.top_k_cases,
                                        .cases_analyzed = options.cases_analyzed,
                                        .filters = options.filters,
                                    });
  if (state.stage == WorkflowStage::kFailed) {
    if (state.fatal_error != nullptr) {
      std::rethrow_exception(state.fatal_error);
    }
    throw ProviderUnavailableError("AnswerQuery: " + state.failure_reason);
  }
  return FormatAnswer(state);
}

std::vector<std::string> LegalAssistant::Suggest(const std::string& partial_query) const {
  return catalog_->Suggest(partial_query, config_.suggestion_limit);
}

std::optional<CaseRecord> LegalAssistant::GetCase(const std::string& case_id) const {
  return catalog_->Get(case_id);
}

bool LegalAssistant::RemoveCase(const std::string& case_id) {
  std::lock_guard<std::mutex> lock(indexing_mutex_);
  const auto removed_segments = index_->RemoveCase(case_id);
  const bool removed_row = catalog_->Remove(case_id);
  if (removed_segments > 0 || removed_row) {
    spdlog::info("removed case {} ({} segments)", case_id, removed_segments);
  }
  return removed_segments > 0 || removed_row;
}

}  // namespace nyayacpp

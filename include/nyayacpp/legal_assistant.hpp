#pragma once

#include "nyayacpp/case_catalog.hpp"
#include "nyayacpp/embeddings.hpp"
#include "nyayacpp/generation.hpp"
#include "nyayacpp/retrieval_engine.hpp"
#include "nyayacpp/types.hpp"
#include "nyayacpp/vector_index.hpp"
#include "nyayacpp/workflow.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nyayacpp {

struct IndexOptions {
  ChunkingStrategy chunking{};
  int batch_size = 100;
  // Drops every indexed segment and catalog row before indexing.
  bool rebuild = false;
};

struct QueryOptions {
  bool use_agentic = true;
  // Zero selects the configured default.
  int top_k_cases = 0;
  int cases_analyzed = 0;
  SearchFilters filters{};
};

// Throws ConfigurationError naming the first invalid setting.
void ValidateConfig(const AssistantConfig& config);

class LegalAssistant {
 public:
  // An empty `storage_dir` keeps the index and catalog in memory.
  LegalAssistant(const std::filesystem::path& storage_dir,
                 const AssistantConfig& config,
                 std::shared_ptr<EmbeddingProvider> embedder,
                 std::shared_ptr<GenerationClient> generator);

  LegalAssistant(const LegalAssistant&) = delete;
  LegalAssistant& operator=(const LegalAssistant&) = delete;

  IndexingReport IndexCorpus(const std::vector<CaseRecord>& records, int chunk_size, int overlap, int batch_size);
  IndexingReport IndexCorpus(const std::vector<CaseRecord>& records, const IndexOptions& options);

  SystemStatus GetStatus() const;

  StructuredAnswer AnswerQuery(const std::string& query, bool use_agentic, int top_k_cases, int cases_analyzed);
  StructuredAnswer AnswerQuery(const std::string& query, const QueryOptions& options);

  std::vector<std::string> Suggest(const std::string& partial_query) const;
  std::optional<CaseRecord> GetCase(const std::string& case_id) const;
  // Removes the case's segments and catalog row. Returns false when nothing was stored.
  bool RemoveCase(const std::string& case_id);

  const AssistantConfig& config() const { return config_; }

 private:
  AssistantConfig config_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<GenerationClient> generator_;
  std::shared_ptr<VectorIndex> index_;
  std::unique_ptr<CaseCatalog> catalog_;
  std::shared_ptr<RetrievalEngine> retrieval_;
  std::unique_ptr<LegalReasoningWorkflow> workflow_;
  std::mutex indexing_mutex_{};
};

}  // namespace nyayacpp

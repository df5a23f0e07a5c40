#pragma once

#include "nyayacpp/embeddings.hpp"
#include "nyayacpp/types.hpp"
#include "nyayacpp/vector_index.hpp"

#include <memory>
#include <string>
#include <vector>

namespace nyayacpp {

// Groups segment hits by case using the best segment score per case. Cases are ordered by
// score, then most recent decision date (unparseable dates sort last), then case_id.
// Supporting segments keep descending score order.
[[nodiscard]] std::vector<RetrievedCase> AggregateByCase(const std::vector<ScoredEntry>& hits, int top_k_cases);

class RetrievalEngine {
 public:
  RetrievalEngine(std::shared_ptr<EmbeddingProvider> embedder,
                  std::shared_ptr<VectorIndex> index,
                  RetrievalConfig config = {},
                  CallPolicy embedding_policy = {});

  // Embeds `query` once and returns up to `top_k_cases` distinct cases. A `segment_fanout`
  // not greater than `top_k_cases` is raised to top_k_cases * fanout_multiplier.
  [[nodiscard]] RetrievalResult Retrieve(const std::string& query,
                                         int top_k_cases,
                                         int segment_fanout = 0,
                                         const SearchFilters& filters = {}) const;

  const RetrievalConfig& config() const { return config_; }

 private:
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<VectorIndex> index_;
  RetrievalConfig config_;
  CallPolicy embedding_policy_;
};

}  // namespace nyayacpp

#include "nyayacpp/retrieval_engine.hpp"
#include "nyayacpp/errors.hpp"
#include "nyayacpp/provider_call.hpp"

#include "../text/legal_text.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nyayacpp {
namespace {

// ISO dates compare lexicographically; anything else ranks as oldest.
bool MoreRecent(const std::string& lhs, const std::string& rhs) {
  const bool lhs_valid = text::IsIsoDate(lhs);
  const bool rhs_valid = text::IsIsoDate(rhs);
  if (lhs_valid != rhs_valid) {
    return lhs_valid;
  }
  if (!lhs_valid) {
    return false;
  }
  return lhs > rhs;
}

}  // namespace

std::vector<RetrievedCase> AggregateByCase(const std::vector<ScoredEntry>& hits, int top_k_cases) {
  if (top_k_cases <= 0 || hits.empty()) {
    return {};
  }

  std::vector<RetrievedCase> cases{};
  std::unordered_map<std::string, std::size_t> case_slots{};
  for (const auto& hit : hits) {
    const auto& metadata = hit.entry.metadata;
    auto slot = case_slots.find(metadata.case_id);
    if (slot == case_slots.end()) {
      RetrievedCase retrieved{};
      retrieved.case_id = metadata.case_id;
      retrieved.title = metadata.title;
      retrieved.citation = metadata.citation;
      retrieved.court = metadata.court;
      retrieved.decision_date = metadata.decision_date;
      retrieved.score = hit.score;
      slot = case_slots.emplace(metadata.case_id, cases.size()).first;
      cases.push_back(std::move(retrieved));
    }
    auto& retrieved = cases[slot->second];
    retrieved.score = std::max(retrieved.score, hit.score);
    retrieved.supporting_segments.push_back(SupportingSegment{
        .segment_id = hit.entry.segment_id,
        .sequence_index = metadata.sequence_index,
        .text = hit.entry.text,
        .score = hit.score,
    });
  }

  for (auto& retrieved : cases) {
    std::stable_sort(retrieved.supporting_segments.begin(),
                     retrieved.supporting_segments.end(),
                     [](const SupportingSegment& lhs, const SupportingSegment& rhs) {
                       if (lhs.score != rhs.score) {
                         return lhs.score > rhs.score;
                       }
                       return lhs.segment_id < rhs.segment_id;
                     });
  }

  std::sort(cases.begin(), cases.end(), [](const RetrievedCase& lhs, const RetrievedCase& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    if (lhs.decision_date != rhs.decision_date) {
      if (MoreRecent(lhs.decision_date, rhs.decision_date)) {
        return true;
      }
      if (MoreRecent(rhs.decision_date, lhs.decision_date)) {
        return false;
      }
    }
    return lhs.case_id < rhs.case_id;
  });
  if (cases.size() > static_cast<std::size_t>(top_k_cases)) {
    cases.resize(static_cast<std::size_t>(top_k_cases));
  }
  return cases;
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<EmbeddingProvider> embedder,
                                 std::shared_ptr<VectorIndex> index,
                                 RetrievalConfig config,
                                 CallPolicy embedding_policy)
    : embedder_(std::move(embedder)),
      index_(std::move(index)),
      config_(config),
      embedding_policy_(embedding_policy) {
  if (embedder_ == nullptr || index_ == nullptr) {
    throw ConfigurationError("RetrievalEngine requires an embedding provider and a vector index");
  }
  if (config_.top_k_cases <= 0 || config_.fanout_multiplier <= 1) {
    throw ConfigurationError("RetrievalEngine: top_k_cases must be positive and fanout_multiplier greater than 1");
  }
  if (embedder_->dimensions() != index_->dimensions()) {
    throw DimensionMismatchError("RetrievalEngine: embedder produces " + std::to_string(embedder_->dimensions()) +
                                 " dimensions, index holds " + std::to_string(index_->dimensions()));
  }
}

RetrievalResult RetrievalEngine::Retrieve(const std::string& query,
                                          int top_k_cases,
                                          int segment_fanout,
                                          const SearchFilters& filters) const {
  RetrievalResult result{};
  result.query = query;
  if (top_k_cases <= 0 || text::Trim(query).empty()) {
    return result;
  }
  const auto indexed = index_->Count();
  if (indexed == 0) {
    return result;
  }
  // Computed wide and capped at the index size, so a large top_k never wraps.
  std::int64_t fanout = segment_fanout;
  if (fanout <= top_k_cases) {
    fanout = static_cast<std::int64_t>(top_k_cases) * static_cast<std::int64_t>(config_.fanout_multiplier);
  }
  fanout = std::min<std::int64_t>(fanout, static_cast<std::int64_t>(std::min<std::size_t>(
                                              indexed, static_cast<std::size_t>(std::numeric_limits<int>::max()))));

  auto embedder = embedder_;
  const auto query_vector =
      CallWithPolicy(embedding_policy_, "query embedding", [embedder, query]() { return embedder->Embed(query); });

  const auto hits = index_->Search(query_vector, static_cast<int>(fanout), filters);
  result.segments_considered = hits.size();
  result.cases = AggregateByCase(hits, top_k_cases);
  return result;
}

}  // namespace nyayacpp

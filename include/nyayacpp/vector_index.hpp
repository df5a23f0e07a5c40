#pragma once

#include "nyayacpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nyayacpp {

// Persistent brute-force nearest-neighbour index over segment embeddings.
//
// Writes go to SQLite first and are published to the in-memory search set only after the
// transaction commits, so readers observe each segment either fully old or fully new.
// All writers share one mutex rather than locking per segment_id, matching SQLite's single
// writer; readers only contend with the short publication step.
class VectorIndex {
 public:
  // An empty path keeps the index in memory only.
  VectorIndex(const std::filesystem::path& db_path,
              int dimensions,
              VecSimilarity similarity = VecSimilarity::kCosine);
  ~VectorIndex();

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  int dimensions() const;
  VecSimilarity similarity() const;

  // Inserts or replaces entries by segment_id in a single atomic commit.
  void Upsert(const std::vector<IndexEntry>& entries);

  // Ranked by descending similarity, ties by ascending segment_id. Filters apply before ranking.
  [[nodiscard]] std::vector<ScoredEntry> Search(const std::vector<float>& query,
                                                int top_k,
                                                const SearchFilters& filters = {}) const;

  [[nodiscard]] std::size_t Count() const;
  [[nodiscard]] std::optional<IndexEntry> Get(const std::string& segment_id) const;
  [[nodiscard]] std::vector<std::string> CaseIds() const;

  std::size_t Remove(const std::vector<std::string>& segment_ids);
  std::size_t RemoveCase(const std::string& case_id);
  // Drops segments of `case_id` whose sequence_index is >= keep_count.
  std::size_t PruneCaseSegments(const std::string& case_id, std::uint32_t keep_count);
  void Clear();

 private:
  struct Storage;

  void LoadFromStorage();
  std::size_t RemoveLocked(const std::vector<std::string>& segment_ids);

  int dimensions_;
  VecSimilarity similarity_;
  std::unique_ptr<Storage> storage_;
  std::map<std::string, std::shared_ptr<const IndexEntry>> entries_;
  std::unordered_map<std::string, std::set<std::string>> case_segments_;
  mutable std::shared_mutex entries_mutex_{};
  std::mutex write_mutex_{};
};

[[nodiscard]] bool MatchesFilters(const SegmentMetadata& metadata, const SearchFilters& filters);

namespace vector::testing {

// Lets `successful_commits` upserts commit, then fails the next one before COMMIT.
void FailCommitAfter(std::uint32_t successful_commits);
void ClearCommitFailure();

}  // namespace vector::testing

}  // namespace nyayacpp

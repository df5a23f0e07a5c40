#include "nyayacpp/vector_index.hpp"
#include "nyayacpp/errors.hpp"

#include "../core/sqlite_support.hpp"
#include "../text/legal_text.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nyayacpp {
namespace {

std::atomic<std::int64_t> g_commits_until_failure{-1};

float Dot(std::span<const float> lhs, std::span<const float> rhs) {
  float dot = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
  }
  return dot;
}

float L2SquaredDistance(std::span<const float> lhs, std::span<const float> rhs) {
  float sum = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const float delta = lhs[i] - rhs[i];
    sum += delta * delta;
  }
  return sum;
}

float Norm(std::span<const float> v) {
  const auto dot = Dot(v, v);
  return std::sqrt(std::max(dot, 0.0F));
}

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs) {
  const auto lhs_norm = Norm(lhs);
  const auto rhs_norm = Norm(rhs);
  if (lhs_norm <= 0.0F || rhs_norm <= 0.0F) {
    return 0.0F;
  }
  return Dot(lhs, rhs) / (lhs_norm * rhs_norm);
}

float Score(VecSimilarity similarity, std::span<const float> query, std::span<const float> doc) {
  float score = 0.0F;
  switch (similarity) {
    case VecSimilarity::kCosine:
      score = CosineSimilarity(query, doc);
      break;
    case VecSimilarity::kDot:
      score = Dot(query, doc);
      break;
    case VecSimilarity::kL2:
      // Negative distance; higher is better.
      score = -L2SquaredDistance(query, doc);
      break;
  }
  return std::isnan(score) ? 0.0F : score;
}

void MaybeInjectCommitFailure() {
  auto remaining = g_commits_until_failure.load(std::memory_order_relaxed);
  while (remaining >= 0) {
    const auto next = remaining == 0 ? -1 : remaining - 1;
    if (g_commits_until_failure.compare_exchange_weak(remaining,
                                                      next,
                                                      std::memory_order_relaxed,
                                                      std::memory_order_relaxed)) {
      if (remaining == 0) {
        throw std::runtime_error("VectorIndex::Upsert injected commit failure");
      }
      return;
    }
  }
}

void AppendU32LE(std::string& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<char>((value >> (8U * i)) & 0xFFU));
  }
}

std::string EncodeVector(const std::vector<float>& vector) {
  std::string out{};
  out.reserve(vector.size() * sizeof(float));
  for (const float value : vector) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    AppendU32LE(out, bits);
  }
  return out;
}

std::vector<float> DecodeVector(const std::string& blob, int dimensions, const std::string& segment_id) {
  if (blob.size() != static_cast<std::size_t>(dimensions) * sizeof(float)) {
    throw std::runtime_error("VectorIndex: stored vector for " + segment_id + " has " +
                             std::to_string(blob.size()) + " bytes, expected " +
                             std::to_string(static_cast<std::size_t>(dimensions) * sizeof(float)));
  }
  std::vector<float> out(static_cast<std::size_t>(dimensions), 0.0F);
  for (std::size_t i = 0; i < out.size(); ++i) {
    std::uint32_t bits = 0;
    for (std::size_t b = 0; b < 4; ++b) {
      bits |= static_cast<std::uint32_t>(static_cast<unsigned char>(blob[i * 4 + b])) << (8U * b);
    }
    std::memcpy(&out[i], &bits, sizeof(bits));
  }
  return out;
}

const char* SimilarityName(VecSimilarity similarity) {
  switch (similarity) {
    case VecSimilarity::kCosine:
      return "cosine";
    case VecSimilarity::kDot:
      return "dot";
    case VecSimilarity::kL2:
      return "l2";
  }
  return "unknown";
}

bool ScoredLess(const ScoredEntry& lhs, const ScoredEntry& rhs) {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  return lhs.entry.segment_id < rhs.entry.segment_id;
}

}  // namespace

struct VectorIndex::Storage {
  explicit Storage(const std::filesystem::path& path) : db(path) {}

  sqlite::Database db;
};

bool MatchesFilters(const SegmentMetadata& metadata, const SearchFilters& filters) {
  if (filters.court.has_value() && metadata.court != *filters.court) {
    return false;
  }
  if (filters.date_from.has_value() || filters.date_to.has_value()) {
    if (!text::IsIsoDate(metadata.decision_date)) {
      return false;
    }
    if (filters.date_from.has_value() && metadata.decision_date < *filters.date_from) {
      return false;
    }
    if (filters.date_to.has_value() && metadata.decision_date > *filters.date_to) {
      return false;
    }
  }
  if (filters.case_ids.has_value() && filters.case_ids->find(metadata.case_id) == filters.case_ids->end()) {
    return false;
  }
  return true;
}

VectorIndex::VectorIndex(const std::filesystem::path& db_path, int dimensions, VecSimilarity similarity)
    : dimensions_(dimensions), similarity_(similarity) {
  if (dimensions_ <= 0) {
    throw ConfigurationError("VectorIndex dimensions must be positive");
  }
  storage_ = std::make_unique<Storage>(db_path.empty() ? std::filesystem::path(":memory:") : db_path);
  auto* db = storage_->db.get();
  sqlite::Exec(db, "PRAGMA journal_mode=WAL;");
  sqlite::Exec(db, "PRAGMA synchronous=NORMAL;");
  sqlite::Exec(db,
               "CREATE TABLE IF NOT EXISTS index_meta("
               "key TEXT PRIMARY KEY,"
               "value TEXT NOT NULL"
               ");");
  sqlite::Exec(db,
               "CREATE TABLE IF NOT EXISTS segments("
               "segment_id TEXT PRIMARY KEY,"
               "case_id TEXT NOT NULL,"
               "sequence_index INTEGER NOT NULL,"
               "start_offset INTEGER NOT NULL,"
               "end_offset INTEGER NOT NULL,"
               "body TEXT NOT NULL,"
               "vector BLOB NOT NULL,"
               "title TEXT NOT NULL,"
               "citation TEXT NOT NULL,"
               "court TEXT NOT NULL,"
               "decision_date TEXT NOT NULL,"
               "judges TEXT NOT NULL"
               ");");
  sqlite::Exec(db, "CREATE INDEX IF NOT EXISTS segments_case_idx ON segments(case_id);");

  {
    sqlite::Statement select_meta(db, "SELECT key, value FROM index_meta;");
    while (select_meta.Step()) {
      const auto key = select_meta.ColumnText(0);
      const auto value = select_meta.ColumnText(1);
      if (key == "dimensions" && value != std::to_string(dimensions_)) {
        throw ConfigurationError("vector index at " + db_path.string() + " was built with " + value +
                                 " dimensions, provider produces " + std::to_string(dimensions_));
      }
      if (key == "similarity" && value != SimilarityName(similarity_)) {
        throw ConfigurationError("vector index at " + db_path.string() + " uses " + value +
                                 " similarity, configured " + SimilarityName(similarity_));
      }
    }
  }
  {
    sqlite::Statement insert_meta(db, "INSERT OR IGNORE INTO index_meta(key, value) VALUES(?1, ?2);");
    insert_meta.BindText(1, "dimensions");
    insert_meta.BindText(2, std::to_string(dimensions_));
    insert_meta.Run();
    insert_meta.Reset();
    insert_meta.BindText(1, "similarity");
    insert_meta.BindText(2, SimilarityName(similarity_));
    insert_meta.Run();
  }
  LoadFromStorage();
}

VectorIndex::~VectorIndex() = default;

void VectorIndex::LoadFromStorage() {
  sqlite::Statement select_stmt(storage_->db.get(),
                                "SELECT segment_id, case_id, sequence_index, start_offset, end_offset, body, vector, "
                                "title, citation, court, decision_date, judges FROM segments;");
  std::map<std::string, std::shared_ptr<const IndexEntry>> loaded{};
  std::unordered_map<std::string, std::set<std::string>> by_case{};
  while (select_stmt.Step()) {
    auto entry = std::make_shared<IndexEntry>();
    entry->segment_id = select_stmt.ColumnText(0);
    entry->metadata.case_id = select_stmt.ColumnText(1);
    entry->metadata.sequence_index = static_cast<std::uint32_t>(select_stmt.ColumnInt64(2));
    entry->metadata.start_offset = static_cast<std::size_t>(select_stmt.ColumnInt64(3));
    entry->metadata.end_offset = static_cast<std::size_t>(select_stmt.ColumnInt64(4));
    entry->text = select_stmt.ColumnText(5);
    entry->vector = DecodeVector(select_stmt.ColumnBlob(6), dimensions_, entry->segment_id);
    entry->metadata.title = select_stmt.ColumnText(7);
    entry->metadata.citation = select_stmt.ColumnText(8);
    entry->metadata.court = select_stmt.ColumnText(9);
    entry->metadata.decision_date = select_stmt.ColumnText(10);
    entry->metadata.judges = select_stmt.ColumnText(11);
    by_case[entry->metadata.case_id].insert(entry->segment_id);
    auto id = entry->segment_id;
    loaded.emplace(std::move(id), std::move(entry));
  }

  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  entries_ = std::move(loaded);
  case_segments_ = std::move(by_case);
}

int VectorIndex::dimensions() const {
  return dimensions_;
}

VecSimilarity VectorIndex::similarity() const {
  return similarity_;
}

void VectorIndex::Upsert(const std::vector<IndexEntry>& entries) {
  if (entries.empty()) {
    return;
  }
  for (const auto& entry : entries) {
    if (entry.segment_id.empty()) {
      throw std::invalid_argument("VectorIndex::Upsert segment_id must not be empty");
    }
    if (entry.metadata.case_id.empty()) {
      throw std::invalid_argument("VectorIndex::Upsert entry " + entry.segment_id + " has no case_id");
    }
    if (entry.vector.size() != static_cast<std::size_t>(dimensions_)) {
      throw DimensionMismatchError("VectorIndex::Upsert dimension mismatch for " + entry.segment_id + ": got " +
                                   std::to_string(entry.vector.size()) + ", expected " +
                                   std::to_string(dimensions_));
    }
  }

  std::lock_guard<std::mutex> write_lock(write_mutex_);
  auto* db = storage_->db.get();
  {
    sqlite::Transaction tx(db);
    sqlite::Statement upsert_stmt(
        db,
        "INSERT INTO segments(segment_id, case_id, sequence_index, start_offset, end_offset, body, vector, "
        "title, citation, court, decision_date, judges) "
        "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12) "
        "ON CONFLICT(segment_id) DO UPDATE SET case_id=excluded.case_id, sequence_index=excluded.sequence_index, "
        "start_offset=excluded.start_offset, end_offset=excluded.end_offset, body=excluded.body, "
        "vector=excluded.vector, title=excluded.title, citation=excluded.citation, court=excluded.court, "
        "decision_date=excluded.decision_date, judges=excluded.judges;");
    for (const auto& entry : entries) {
      const auto blob = EncodeVector(entry.vector);
      upsert_stmt.Reset();
      upsert_stmt.BindText(1, entry.segment_id);
      upsert_stmt.BindText(2, entry.metadata.case_id);
      upsert_stmt.BindInt64(3, static_cast<std::int64_t>(entry.metadata.sequence_index));
      upsert_stmt.BindInt64(4, static_cast<std::int64_t>(entry.metadata.start_offset));
      upsert_stmt.BindInt64(5, static_cast<std::int64_t>(entry.metadata.end_offset));
      upsert_stmt.BindText(6, entry.text);
      upsert_stmt.BindBlob(7, blob.data(), blob.size());
      upsert_stmt.BindText(8, entry.metadata.title);
      upsert_stmt.BindText(9, entry.metadata.citation);
      upsert_stmt.BindText(10, entry.metadata.court);
      upsert_stmt.BindText(11, entry.metadata.decision_date);
      upsert_stmt.BindText(12, entry.metadata.judges);
      upsert_stmt.Run();
    }
    MaybeInjectCommitFailure();
    tx.Commit();
  }

  std::vector<std::shared_ptr<const IndexEntry>> published{};
  published.reserve(entries.size());
  for (const auto& entry : entries) {
    published.push_back(std::make_shared<const IndexEntry>(entry));
  }

  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  for (auto& entry : published) {
    const auto existing = entries_.find(entry->segment_id);
    if (existing != entries_.end() && existing->second->metadata.case_id != entry->metadata.case_id) {
      auto& previous_case = case_segments_[existing->second->metadata.case_id];
      previous_case.erase(entry->segment_id);
      if (previous_case.empty()) {
        case_segments_.erase(existing->second->metadata.case_id);
      }
    }
    case_segments_[entry->metadata.case_id].insert(entry->segment_id);
    entries_[entry->segment_id] = std::move(entry);
  }
}

std::vector<ScoredEntry> VectorIndex::Search(const std::vector<float>& query,
                                             int top_k,
                                             const SearchFilters& filters) const {
  if (query.size() != static_cast<std::size_t>(dimensions_)) {
    throw DimensionMismatchError("VectorIndex::Search dimension mismatch: got " + std::to_string(query.size()) +
                                 ", expected " + std::to_string(dimensions_));
  }
  if (top_k <= 0) {
    return {};
  }

  std::vector<std::pair<float, std::shared_ptr<const IndexEntry>>> candidates{};
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    if (entries_.empty()) {
      return {};
    }
    candidates.reserve(entries_.size());
    const auto query_span = std::span<const float>(query.data(), query.size());
    for (const auto& [segment_id, entry] : entries_) {
      if (!MatchesFilters(entry->metadata, filters)) {
        continue;
      }
      const auto doc = std::span<const float>(entry->vector.data(), entry->vector.size());
      candidates.emplace_back(Score(similarity_, query_span, doc), entry);
    }
  }

  const auto limit = std::min<std::size_t>(candidates.size(), static_cast<std::size_t>(top_k));
  std::partial_sort(candidates.begin(),
                    candidates.begin() + static_cast<std::ptrdiff_t>(limit),
                    candidates.end(),
                    [](const auto& lhs, const auto& rhs) {
                      if (lhs.first != rhs.first) {
                        return lhs.first > rhs.first;
                      }
                      return lhs.second->segment_id < rhs.second->segment_id;
                    });

  std::vector<ScoredEntry> results{};
  results.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    results.push_back(ScoredEntry{*candidates[i].second, candidates[i].first});
  }
  std::sort(results.begin(), results.end(), ScoredLess);
  return results;
}

std::size_t VectorIndex::Count() const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  return entries_.size();
}

std::optional<IndexEntry> VectorIndex::Get(const std::string& segment_id) const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  const auto it = entries_.find(segment_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return *it->second;
}

std::vector<std::string> VectorIndex::CaseIds() const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  std::vector<std::string> ids{};
  ids.reserve(case_segments_.size());
  for (const auto& [case_id, _] : case_segments_) {
    ids.push_back(case_id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::size_t VectorIndex::RemoveLocked(const std::vector<std::string>& segment_ids) {
  if (segment_ids.empty()) {
    return 0;
  }
  auto* db = storage_->db.get();
  {
    sqlite::Transaction tx(db);
    sqlite::Statement delete_stmt(db, "DELETE FROM segments WHERE segment_id = ?1;");
    for (const auto& segment_id : segment_ids) {
      delete_stmt.Reset();
      delete_stmt.BindText(1, segment_id);
      delete_stmt.Run();
    }
    tx.Commit();
  }

  std::size_t removed = 0;
  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  for (const auto& segment_id : segment_ids) {
    const auto it = entries_.find(segment_id);
    if (it == entries_.end()) {
      continue;
    }
    const auto case_id = it->second->metadata.case_id;
    auto case_it = case_segments_.find(case_id);
    if (case_it != case_segments_.end()) {
      case_it->second.erase(segment_id);
      if (case_it->second.empty()) {
        case_segments_.erase(case_it);
      }
    }
    entries_.erase(it);
    ++removed;
  }
  return removed;
}

std::size_t VectorIndex::Remove(const std::vector<std::string>& segment_ids) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  return RemoveLocked(segment_ids);
}

std::size_t VectorIndex::RemoveCase(const std::string& case_id) {
  return PruneCaseSegments(case_id, 0);
}

std::size_t VectorIndex::PruneCaseSegments(const std::string& case_id, std::uint32_t keep_count) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  std::vector<std::string> stale{};
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    const auto case_it = case_segments_.find(case_id);
    if (case_it == case_segments_.end()) {
      return 0;
    }
    for (const auto& segment_id : case_it->second) {
      const auto entry_it = entries_.find(segment_id);
      if (entry_it != entries_.end() && entry_it->second->metadata.sequence_index >= keep_count) {
        stale.push_back(segment_id);
      }
    }
  }
  return RemoveLocked(stale);
}

void VectorIndex::Clear() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  sqlite::Exec(storage_->db.get(), "DELETE FROM segments;");
  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  entries_.clear();
  case_segments_.clear();
}

namespace vector::testing {

void FailCommitAfter(std::uint32_t successful_commits) {
  g_commits_until_failure.store(static_cast<std::int64_t>(successful_commits), std::memory_order_relaxed);
}

void ClearCommitFailure() {
  g_commits_until_failure.store(-1, std::memory_order_relaxed);
}

}  // namespace vector::testing

}  // namespace nyayacpp

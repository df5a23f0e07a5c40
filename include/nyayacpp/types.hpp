#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace nyayacpp {

using Metadata = std::unordered_map<std::string, std::string>;

inline constexpr const char* kUnknownField = "Unknown";

struct CaseRecord {
  std::string case_id;
  std::string title;
  std::string citation;
  std::string court;
  std::string decision_date;
  std::string full_text;
  std::vector<std::string> judges;
  std::vector<std::string> tags;
  std::optional<int> year;
};

struct Segment {
  std::string segment_id;
  std::string case_id;
  std::string text;
  std::size_t start_offset = 0;
  std::size_t end_offset = 0;
  std::uint32_t sequence_index = 0;
};

// Snapshot of the owning case stored next to every indexed segment.
struct SegmentMetadata {
  std::string case_id;
  std::string title;
  std::string citation;
  std::string court;
  std::string decision_date;
  std::string judges;
  std::uint32_t sequence_index = 0;
  std::size_t start_offset = 0;
  std::size_t end_offset = 0;
};

struct IndexEntry {
  std::string segment_id;
  std::vector<float> vector;
  std::string text;
  SegmentMetadata metadata;
};

struct ScoredEntry {
  IndexEntry entry;
  float score = 0.0F;
};

enum class VecSimilarity : std::uint8_t {
  kCosine = 0,
  kDot = 1,
  kL2 = 2,
};

// Restrictions evaluated before ranking. Dates are ISO `YYYY-MM-DD`, inclusive.
struct SearchFilters {
  std::optional<std::string> court;
  std::optional<std::string> date_from;
  std::optional<std::string> date_to;
  std::optional<std::unordered_set<std::string>> case_ids;
};

struct SupportingSegment {
  std::string segment_id;
  std::uint32_t sequence_index = 0;
  std::string text;
  float score = 0.0F;
};

struct RetrievedCase {
  std::string case_id;
  std::string title;
  std::string citation;
  std::string court;
  std::string decision_date;
  float score = 0.0F;
  std::vector<SupportingSegment> supporting_segments;
};

struct RetrievalResult {
  std::string query;
  std::vector<RetrievedCase> cases;
  std::size_t segments_considered = 0;
};

struct IndexingError {
  std::string case_id;
  std::string message;
};

struct IndexingReport {
  std::uint64_t segments_indexed = 0;
  std::uint64_t cases_indexed = 0;
  std::uint64_t batches_committed = 0;
  std::uint64_t segments_pruned = 0;
  std::vector<IndexingError> errors;
};

struct SystemStatus {
  std::uint64_t indexed_segment_count = 0;
  std::uint64_t indexed_case_count = 0;
  bool embedding_ready = false;
  bool generation_ready = false;
  bool ready = false;
};

struct RelatedCase {
  std::string case_id;
  std::string title;
  std::string citation;
  std::string court;
  std::string decision_date;
};

enum class AnswerPath {
  kAgentic,
  kDirect,
};

struct ProcessingInfo {
  int cases_retrieved = 0;
  int cases_analyzed = 0;
};

struct StructuredAnswer {
  std::string query;
  std::string answer;
  std::vector<RelatedCase> related_cases;
  std::vector<std::string> legal_issues;
  std::vector<std::string> follow_up_questions;
  std::vector<std::string> reasoning_steps;
  ProcessingInfo processing_info{};
  AnswerPath path = AnswerPath::kAgentic;
  bool degraded = false;
};

struct ChunkingStrategy {
  int chunk_size = 1024;
  int overlap = 128;
};

// Per-call budget for provider calls. At most one retry is ever applied.
struct CallPolicy {
  std::chrono::milliseconds timeout{30000};
  int max_retries = 1;
  std::chrono::milliseconds backoff{250};
};

struct ProviderPolicies {
  CallPolicy analysis{std::chrono::milliseconds(20000), 1, std::chrono::milliseconds(250)};
  CallPolicy retrieval_embedding{std::chrono::milliseconds(5000), 1, std::chrono::milliseconds(100)};
  CallPolicy summarization{std::chrono::milliseconds(30000), 1, std::chrono::milliseconds(250)};
  CallPolicy synthesis{std::chrono::milliseconds(60000), 1, std::chrono::milliseconds(500)};
  CallPolicy indexing_embedding{std::chrono::milliseconds(120000), 1, std::chrono::milliseconds(1000)};
};

struct RetrievalConfig {
  int top_k_cases = 5;
  int fanout_multiplier = 4;
};

struct WorkflowConfig {
  int cases_analyzed = 5;
  int max_issues = 5;
  int max_keywords = 8;
  int summary_context_chars = 2000;
  int direct_context_segments_per_case = 2;
  int min_follow_ups = 2;
  int max_follow_ups = 4;
  int analysis_max_tokens = 500;
  int summary_max_tokens = 300;
  int synthesis_max_tokens = 2000;
  float temperature = 0.7F;
};

struct VectorIndexConfig {
  VecSimilarity similarity = VecSimilarity::kCosine;
};

struct AssistantConfig {
  ChunkingStrategy chunking{};
  int ingest_batch_size = 100;
  RetrievalConfig retrieval{};
  WorkflowConfig workflow{};
  ProviderPolicies policies{};
  VectorIndexConfig vector_index{};
  int suggestion_limit = 5;
};

}  // namespace nyayacpp

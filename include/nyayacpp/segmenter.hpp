#pragma once

#include "nyayacpp/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace nyayacpp {

// Throws ConfigurationError unless 0 <= overlap < chunk_size.
void ValidateChunking(const ChunkingStrategy& chunking);

[[nodiscard]] std::string MakeSegmentId(const std::string& case_id, std::uint32_t sequence_index);

// Slides a `chunk_size` byte window with `overlap` bytes of overlap across the case text.
// Pure: identical input yields identical segments and ids.
[[nodiscard]] std::vector<Segment> SegmentCase(const CaseRecord& record, const ChunkingStrategy& chunking);

// Text handed to the embedding provider for a segment: the case title, then the segment text.
[[nodiscard]] std::string SegmentEmbeddingInput(const std::string& title, const std::string& segment_text);

}  // namespace nyayacpp

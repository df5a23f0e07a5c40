#include "nyayacpp/segmenter.hpp"
#include "nyayacpp/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace nyayacpp {

void ValidateChunking(const ChunkingStrategy& chunking) {
  if (chunking.chunk_size <= 0) {
    throw ConfigurationError("chunk_size must be positive");
  }
  if (chunking.overlap < 0) {
    throw ConfigurationError("overlap must not be negative");
  }
  if (chunking.overlap >= chunking.chunk_size) {
    throw ConfigurationError("overlap (" + std::to_string(chunking.overlap) + ") must be smaller than chunk_size (" +
                             std::to_string(chunking.chunk_size) + ")");
  }
}

std::string MakeSegmentId(const std::string& case_id, std::uint32_t sequence_index) {
  char suffix[16];
  std::snprintf(suffix, sizeof(suffix), "#%06u", static_cast<unsigned>(sequence_index));
  return case_id + suffix;
}

namespace {

bool IsContinuationByte(char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

// Moves `pos` back onto the first byte of the UTF-8 sequence containing it.
std::size_t SnapToCharStart(const std::string& body, std::size_t pos) {
  while (pos > 0 && pos < body.size() && IsContinuationByte(body[pos])) {
    --pos;
  }
  return pos;
}

std::size_t NextCharStart(const std::string& body, std::size_t pos) {
  ++pos;
  while (pos < body.size() && IsContinuationByte(body[pos])) {
    ++pos;
  }
  return pos;
}

}  // namespace

// Windows are byte-sized but never split a UTF-8 sequence: both edges snap back to a
// character start, so ASCII text keeps exact chunk_size/overlap geometry.
std::vector<Segment> SegmentCase(const CaseRecord& record, const ChunkingStrategy& chunking) {
  ValidateChunking(chunking);
  const auto& body = record.full_text;
  const auto length = body.size();
  const auto window = static_cast<std::size_t>(chunking.chunk_size);
  const auto step = static_cast<std::size_t>(chunking.chunk_size - chunking.overlap);

  std::vector<Segment> segments{};
  segments.reserve(length <= window ? 1 : (length - window + step - 1) / step + 1);
  std::uint32_t sequence_index = 0;
  std::size_t start = 0;
  for (;;) {
    auto end = SnapToCharStart(body, std::min(length, start + window));
    if (end <= start && start < length) {
      end = NextCharStart(body, start);
    }
    Segment segment{};
    segment.segment_id = MakeSegmentId(record.case_id, sequence_index);
    segment.case_id = record.case_id;
    segment.text = body.substr(start, end - start);
    segment.start_offset = start;
    segment.end_offset = end;
    segment.sequence_index = sequence_index;
    segments.push_back(std::move(segment));
    ++sequence_index;
    if (end == length) {
      break;
    }
    auto next = SnapToCharStart(body, start + step);
    if (next <= start) {
      next = NextCharStart(body, start);
    }
    start = next;
  }
  return segments;
}

std::string SegmentEmbeddingInput(const std::string& title, const std::string& segment_text) {
  if (title.empty()) {
    return segment_text;
  }
  std::string out{};
  out.reserve(title.size() + 1 + segment_text.size());
  out.append(title);
  out.push_back('\n');
  out.append(segment_text);
  return out;
}

}  // namespace nyayacpp

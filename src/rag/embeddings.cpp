#include "nyayacpp/embeddings.hpp"
#include "nyayacpp/errors.hpp"

#include "../text/legal_text.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nyayacpp {
namespace {

// 64-bit FNV-1a.
constexpr std::uint64_t FeatureHash(std::string_view token) {
  std::uint64_t hash = 1469598103934665603ULL;
  for (const char ch : token) {
    hash = (hash ^ static_cast<unsigned char>(ch)) * 1099511628211ULL;
  }
  return hash;
}

struct Feature {
  std::size_t bucket;
  float weight;
};

// Top hash bit selects the sign.
Feature FeatureFor(std::string_view token, int dimensions) {
  const auto hash = FeatureHash(token);
  return Feature{
      .bucket = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions)),
      .weight = (hash >> 63U) != 0U ? -1.0F : 1.0F,
  };
}

void ScaleToUnitLength(std::vector<float>& embedding) {
  const double squared = std::inner_product(embedding.begin(), embedding.end(), embedding.begin(), 0.0,
                                            std::plus<>(), [](float a, float b) {
                                              return static_cast<double>(a) * static_cast<double>(b);
                                            });
  if (squared <= 0.0) {
    return;
  }
  const double scale = 1.0 / std::sqrt(squared);
  std::transform(embedding.begin(), embedding.end(), embedding.begin(),
                 [scale](float x) { return static_cast<float>(static_cast<double>(x) * scale); });
}

}  // namespace

std::vector<std::vector<float>> EmbedTexts(EmbeddingProvider& embedder,
                                           const std::vector<std::string>& texts,
                                           std::size_t batch_size) {
  if (texts.empty()) {
    return {};
  }
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());

  auto* batch_embedder = dynamic_cast<BatchEmbeddingProvider*>(&embedder);
  if (batch_embedder == nullptr) {
    for (const auto& text : texts) {
      out.push_back(embedder.Embed(text));
    }
  } else {
    const std::size_t slice_size = batch_size > 0 ? batch_size : texts.size();
    for (std::size_t start = 0; start < texts.size(); start += slice_size) {
      const auto end = std::min(texts.size(), start + slice_size);
      const std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                           texts.begin() + static_cast<std::ptrdiff_t>(end));
      auto partial = batch_embedder->EmbedBatch(slice);
      if (partial.size() != slice.size()) {
        throw ProviderError("embedding batch returned " + std::to_string(partial.size()) + " vectors for " +
                            std::to_string(slice.size()) + " texts");
      }
      out.insert(out.end(), std::make_move_iterator(partial.begin()), std::make_move_iterator(partial.end()));
    }
  }

  const auto expected = static_cast<std::size_t>(embedder.dimensions());
  for (const auto& vector : out) {
    if (vector.size() != expected) {
      throw DimensionMismatchError("embedding provider returned " + std::to_string(vector.size()) +
                                   " dimensions, expected " + std::to_string(expected));
    }
  }
  return out;
}

HashingEmbedder::HashingEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), recent_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw ConfigurationError("HashingEmbedder dimensions must be positive");
  }
}

int HashingEmbedder::dimensions() const {
  return dimensions_;
}

bool HashingEmbedder::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> HashingEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("NyayaCpp"),
      .model = std::string("feature-hash-v1"),
      .dimensions = dimensions_,
      .normalized = true,
  };
}

std::vector<float> HashingEmbedder::Project(const std::string& text) const {
  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);
  for (const auto& token : text::Tokenize(text)) {
    if (!text::IsStopWord(token)) {
      const auto feature = FeatureFor(token, dimensions_);
      embedding[feature.bucket] += feature.weight;
    }
  }
  if (normalize()) {
    ScaleToUnitLength(embedding);
  }
  return embedding;
}

std::optional<std::vector<float>> HashingEmbedder::Recall(const std::string& text) const {
  std::lock_guard<std::mutex> lock(recent_mutex_);
  const auto it = recent_.find(text);
  if (it == recent_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// Oldest-first eviction once the capacity is reached.
void HashingEmbedder::Remember(const std::string& text, const std::vector<float>& embedding) {
  std::lock_guard<std::mutex> lock(recent_mutex_);
  if (!recent_.emplace(text, embedding).second) {
    return;
  }
  eviction_queue_.push_back(text);
  while (recent_.size() > recent_capacity_) {
    recent_.erase(eviction_queue_.front());
    eviction_queue_.pop_front();
  }
}

std::vector<float> HashingEmbedder::Embed(const std::string& text) {
  if (recent_capacity_ == 0) {
    return Project(text);
  }
  if (auto cached = Recall(text)) {
    return std::move(*cached);
  }
  auto embedding = Project(text);
  Remember(text, embedding);
  return embedding;
}

std::vector<std::vector<float>> HashingEmbedder::EmbedBatch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::size_t HashingEmbedder::cache_size() const {
  std::lock_guard<std::mutex> lock(recent_mutex_);
  return recent_.size();
}

}  // namespace nyayacpp

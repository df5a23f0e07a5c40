#pragma once

#include "nyayacpp/types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nyayacpp {

struct EmbeddingIdentity {
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<int> dimensions;
  std::optional<bool> normalized;
};

// Implementations must be safe to call from several threads at once.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual bool normalize() const = 0;
  virtual std::optional<EmbeddingIdentity> identity() const = 0;
  virtual bool available() const { return true; }
  virtual std::vector<float> Embed(const std::string& text) = 0;
};

// Embeds a whole batch or throws; partial results are never returned.
class BatchEmbeddingProvider : public EmbeddingProvider {
 public:
  ~BatchEmbeddingProvider() override = default;
  virtual std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) = 0;
};

// Embeds `texts` in slices of `batch_size`, preserving order. Uses EmbedBatch when available.
[[nodiscard]] std::vector<std::vector<float>> EmbedTexts(EmbeddingProvider& embedder,
                                                         const std::vector<std::string>& texts,
                                                         std::size_t batch_size);

// Signed feature hashing over stop-word-filtered tokens, L2 normalized.
class HashingEmbedder final : public BatchEmbeddingProvider {
 public:
  explicit HashingEmbedder(int dimensions = 384, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  bool normalize() const override;
  std::optional<EmbeddingIdentity> identity() const override;
  std::vector<float> Embed(const std::string& text) override;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override;
  [[nodiscard]] std::size_t cache_size() const;

 private:
  std::vector<float> Project(const std::string& text) const;
  std::optional<std::vector<float>> Recall(const std::string& text) const;
  void Remember(const std::string& text, const std::vector<float>& embedding);

  int dimensions_;
  std::size_t recent_capacity_ = 0;
  std::unordered_map<std::string, std::vector<float>> recent_{};
  std::deque<std::string> eviction_queue_{};
  mutable std::mutex recent_mutex_{};
};

}  // namespace nyayacpp

#pragma once

#include "nyayacpp/types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nyayacpp {

// Durable store of normalized case records with an FTS5 index over title and keywords.
class CaseCatalog {
 public:
  // An empty path keeps the catalog in memory only.
  explicit CaseCatalog(const std::filesystem::path& db_path);
  ~CaseCatalog();

  CaseCatalog(const CaseCatalog&) = delete;
  CaseCatalog& operator=(const CaseCatalog&) = delete;

  void Upsert(const CaseRecord& record);
  [[nodiscard]] std::optional<CaseRecord> Get(const std::string& case_id) const;
  bool Remove(const std::string& case_id);
  [[nodiscard]] std::size_t Count() const;
  void Clear();

  // Titles whose words prefix-match the last token (and match any earlier tokens), ranked by
  // bm25 then title, followed by matching keywords. At most `limit` distinct strings.
  [[nodiscard]] std::vector<std::string> Suggest(const std::string& partial, int limit) const;

 private:
  struct Storage;

  std::unique_ptr<Storage> storage_;
  mutable std::mutex mutex_{};
};

}  // namespace nyayacpp

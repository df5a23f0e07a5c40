#include "nyayacpp/case_catalog.hpp"
#include "nyayacpp/case_corpus.hpp"

#include "../core/sqlite_support.hpp"
#include "legal_text.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace nyayacpp {
namespace {

constexpr char kListSeparator = '\n';

std::string JoinList(const std::vector<std::string>& values) {
  std::string out{};
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0) {
      out.push_back(kListSeparator);
    }
    out += values[i];
  }
  return out;
}

std::vector<std::string> SplitList(const std::string& joined) {
  std::vector<std::string> out{};
  std::string current{};
  for (const char ch : joined) {
    if (ch == kListSeparator) {
      if (!current.empty()) {
        out.push_back(std::move(current));
      }
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    out.push_back(std::move(current));
  }
  return out;
}

// FTS5 expression requiring every token, the last one as a prefix. Tokens are alphanumeric,
// so quoting them is enough to keep FTS5 operators out.
std::string BuildPrefixMatch(const std::vector<std::string>& tokens) {
  std::string expression{};
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i != 0) {
      expression.push_back(' ');
    }
    expression += "\"" + tokens[i] + "\"";
    if (i + 1 == tokens.size()) {
      expression.push_back('*');
    }
  }
  return expression;
}

bool KeywordMatchesPrefix(const std::string& keyword, const std::string& prefix) {
  for (const auto& word : text::Tokenize(keyword)) {
    if (word.compare(0, prefix.size(), prefix) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

struct CaseCatalog::Storage {
  explicit Storage(const std::filesystem::path& path) : db(path) {}

  sqlite::Database db;
};

CaseCatalog::CaseCatalog(const std::filesystem::path& db_path)
    : storage_(std::make_unique<Storage>(db_path.empty() ? std::filesystem::path(":memory:") : db_path)) {
  auto* db = storage_->db.get();
  sqlite::Exec(db, "PRAGMA journal_mode=WAL;");
  sqlite::Exec(db,
               "CREATE TABLE IF NOT EXISTS cases("
               "case_id TEXT PRIMARY KEY,"
               "title TEXT NOT NULL,"
               "citation TEXT NOT NULL,"
               "court TEXT NOT NULL,"
               "decision_date TEXT NOT NULL,"
               "full_text TEXT NOT NULL,"
               "judges TEXT NOT NULL,"
               "tags TEXT NOT NULL,"
               "year INTEGER,"
               "keywords TEXT NOT NULL"
               ");");
  sqlite::Exec(db,
               "CREATE VIRTUAL TABLE IF NOT EXISTS cases_fts USING fts5("
               "title,"
               "keywords,"
               "content='cases',"
               "content_rowid='rowid',"
               "tokenize='unicode61 remove_diacritics 0'"
               ");");
  sqlite::Exec(db,
               "CREATE TRIGGER IF NOT EXISTS cases_ai AFTER INSERT ON cases BEGIN "
               "INSERT INTO cases_fts(rowid, title, keywords) VALUES(new.rowid, new.title, new.keywords); "
               "END;");
  sqlite::Exec(db,
               "CREATE TRIGGER IF NOT EXISTS cases_ad AFTER DELETE ON cases BEGIN "
               "INSERT INTO cases_fts(cases_fts, rowid, title, keywords) "
               "VALUES('delete', old.rowid, old.title, old.keywords); "
               "END;");
  sqlite::Exec(db,
               "CREATE TRIGGER IF NOT EXISTS cases_au AFTER UPDATE ON cases BEGIN "
               "INSERT INTO cases_fts(cases_fts, rowid, title, keywords) "
               "VALUES('delete', old.rowid, old.title, old.keywords); "
               "INSERT INTO cases_fts(rowid, title, keywords) VALUES(new.rowid, new.title, new.keywords); "
               "END;");
}

CaseCatalog::~CaseCatalog() = default;

void CaseCatalog::Upsert(const CaseRecord& record) {
  ValidateCaseRecord(record);
  const auto keywords = JoinList(CaseKeywords(record));

  std::lock_guard<std::mutex> lock(mutex_);
  auto* db = storage_->db.get();
  sqlite::Transaction tx(db);
  sqlite::Statement upsert_stmt(
      db,
      "INSERT INTO cases(case_id, title, citation, court, decision_date, full_text, judges, tags, year, keywords) "
      "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10) "
      "ON CONFLICT(case_id) DO UPDATE SET title=excluded.title, citation=excluded.citation, "
      "court=excluded.court, decision_date=excluded.decision_date, full_text=excluded.full_text, "
      "judges=excluded.judges, tags=excluded.tags, year=excluded.year, keywords=excluded.keywords;");
  upsert_stmt.BindText(1, record.case_id);
  upsert_stmt.BindText(2, record.title);
  upsert_stmt.BindText(3, record.citation);
  upsert_stmt.BindText(4, record.court);
  upsert_stmt.BindText(5, record.decision_date);
  upsert_stmt.BindText(6, record.full_text);
  upsert_stmt.BindText(7, JoinList(record.judges));
  upsert_stmt.BindText(8, JoinList(record.tags));
  if (record.year.has_value()) {
    upsert_stmt.BindInt64(9, *record.year);
  } else {
    upsert_stmt.BindNull(9);
  }
  upsert_stmt.BindText(10, keywords);
  upsert_stmt.Run();
  tx.Commit();
}

std::optional<CaseRecord> CaseCatalog::Get(const std::string& case_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite::Statement select_stmt(storage_->db.get(),
                                "SELECT case_id, title, citation, court, decision_date, full_text, judges, tags, year "
                                "FROM cases WHERE case_id = ?1;");
  select_stmt.BindText(1, case_id);
  if (!select_stmt.Step()) {
    return std::nullopt;
  }
  CaseRecord record{};
  record.case_id = select_stmt.ColumnText(0);
  record.title = select_stmt.ColumnText(1);
  record.citation = select_stmt.ColumnText(2);
  record.court = select_stmt.ColumnText(3);
  record.decision_date = select_stmt.ColumnText(4);
  record.full_text = select_stmt.ColumnText(5);
  record.judges = SplitList(select_stmt.ColumnText(6));
  record.tags = SplitList(select_stmt.ColumnText(7));
  if (!select_stmt.ColumnIsNull(8)) {
    record.year = static_cast<int>(select_stmt.ColumnInt64(8));
  }
  return record;
}

bool CaseCatalog::Remove(const std::string& case_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* db = storage_->db.get();
  sqlite::Statement delete_stmt(db, "DELETE FROM cases WHERE case_id = ?1;");
  delete_stmt.BindText(1, case_id);
  delete_stmt.Run();
  return sqlite3_changes(db) > 0;
}

std::size_t CaseCatalog::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite::Statement count_stmt(storage_->db.get(), "SELECT COUNT(*) FROM cases;");
  if (!count_stmt.Step()) {
    return 0;
  }
  return static_cast<std::size_t>(count_stmt.ColumnInt64(0));
}

void CaseCatalog::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite::Exec(storage_->db.get(), "DELETE FROM cases;");
}

std::vector<std::string> CaseCatalog::Suggest(const std::string& partial, int limit) const {
  if (limit <= 0) {
    return {};
  }
  const auto tokens = text::Tokenize(partial);
  if (tokens.empty()) {
    return {};
  }
  const auto& prefix = tokens.back();
  const auto max_results = static_cast<std::size_t>(limit);

  std::vector<std::string> titles{};
  std::vector<std::string> keywords{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement match_stmt(storage_->db.get(),
                                 "SELECT c.title, c.keywords FROM cases_fts "
                                 "JOIN cases c ON c.rowid = cases_fts.rowid "
                                 "WHERE cases_fts MATCH ?1 "
                                 "ORDER BY bm25(cases_fts), c.title;");
    match_stmt.BindText(1, BuildPrefixMatch(tokens));
    while (match_stmt.Step()) {
      titles.push_back(match_stmt.ColumnText(0));
      for (auto& keyword : SplitList(match_stmt.ColumnText(1))) {
        if (KeywordMatchesPrefix(keyword, prefix)) {
          keywords.push_back(std::move(keyword));
        }
      }
    }
  }

  std::vector<std::string> suggestions{};
  std::unordered_set<std::string> seen{};
  for (auto* source : {&titles, &keywords}) {
    for (auto& candidate : *source) {
      if (suggestions.size() >= max_results) {
        return suggestions;
      }
      if (seen.insert(candidate).second) {
        suggestions.push_back(std::move(candidate));
      }
    }
  }
  return suggestions;
}

}  // namespace nyayacpp

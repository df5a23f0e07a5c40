#include "nyayacpp/errors.hpp"
#include "nyayacpp/vector_index.hpp"

#include "../test_fakes.hpp"
#include "../test_logger.hpp"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

nyayacpp::IndexEntry MakeEntry(const std::string& case_id,
                               std::uint32_t sequence_index,
                               std::vector<float> vector,
                               const std::string& court = "Supreme Court",
                               const std::string& decision_date = "2017-08-24") {
  nyayacpp::IndexEntry entry{};
  entry.segment_id = case_id + "#" + std::to_string(sequence_index);
  entry.vector = std::move(vector);
  entry.text = "text of " + entry.segment_id;
  entry.metadata.case_id = case_id;
  entry.metadata.title = "Title " + case_id;
  entry.metadata.citation = "Citation " + case_id;
  entry.metadata.court = court;
  entry.metadata.decision_date = decision_date;
  entry.metadata.judges = "Unknown";
  entry.metadata.sequence_index = sequence_index;
  return entry;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const nyayacpp::DimensionMismatchError&) {
    return true;
  }
  return false;
}

void ScenarioEmptyIndex() {
  nyayacpp::tests::Log("scenario: empty index search returns nothing");
  nyayacpp::VectorIndex index({}, 3);
  Require(index.Count() == 0, "new index must be empty");
  Require(index.Search({1.0F, 0.0F, 0.0F}, 5).empty(), "empty index must return no hits");
}

void ScenarioUpsertIsIdempotent() {
  nyayacpp::tests::Log("scenario: upsert idempotent by segment_id");
  nyayacpp::VectorIndex index({}, 3);
  const std::vector<nyayacpp::IndexEntry> entries = {
      MakeEntry("A", 0, {1.0F, 0.0F, 0.0F}),
      MakeEntry("A", 1, {0.0F, 1.0F, 0.0F}),
      MakeEntry("B", 0, {0.0F, 0.0F, 1.0F}),
  };
  index.Upsert(entries);
  index.Upsert(entries);
  Require(index.Count() == 3, "re-upsert must not duplicate entries");

  auto replacement = MakeEntry("A", 1, {0.5F, 0.5F, 0.0F});
  replacement.text = "replaced";
  index.Upsert({replacement});
  Require(index.Count() == 3, "replacement must not add entries");
  const auto stored = index.Get("A#1");
  Require(stored.has_value() && stored->text == "replaced", "replacement text must be visible");
  Require(stored->vector == replacement.vector, "replacement vector must be visible");
  Require(!index.Get("missing").has_value(), "unknown id must be absent");

  const auto case_ids = index.CaseIds();
  Require(case_ids.size() == 2 && case_ids[0] == "A" && case_ids[1] == "B", "case ids mismatch");
}

void ScenarioRankingAndTieBreak() {
  nyayacpp::tests::Log("scenario: ranking by similarity, ties by segment_id");
  nyayacpp::VectorIndex index({}, 3);
  index.Upsert({
      MakeEntry("C", 0, {1.0F, 0.0F, 0.0F}),
      MakeEntry("B", 0, {1.0F, 0.0F, 0.0F}),
      MakeEntry("A", 0, {0.0F, 1.0F, 0.0F}),
      MakeEntry("D", 0, {0.7F, 0.7F, 0.0F}),
  });
  const auto hits = index.Search({1.0F, 0.0F, 0.0F}, 10);
  Require(hits.size() == 4, "all entries expected");
  Require(hits[0].entry.segment_id == "B#0", "tie must resolve to lower segment_id");
  Require(hits[1].entry.segment_id == "C#0", "tie partner must follow");
  Require(hits[2].entry.segment_id == "D#0", "partial match must be third");
  Require(hits[0].score >= hits[2].score && hits[2].score >= hits[3].score, "scores must descend");

  const auto again = index.Search({1.0F, 0.0F, 0.0F}, 10);
  for (std::size_t i = 0; i < hits.size(); ++i) {
    Require(again[i].entry.segment_id == hits[i].entry.segment_id, "repeated search must be identical");
  }
  Require(index.Search({1.0F, 0.0F, 0.0F}, 2).size() == 2, "top_k must bound results");
  Require(index.Search({1.0F, 0.0F, 0.0F}, 0).empty(), "top_k of zero returns nothing");
}

void ScenarioFiltersApplyBeforeRanking() {
  nyayacpp::tests::Log("scenario: filters applied before ranking");
  nyayacpp::VectorIndex index({}, 3);
  index.Upsert({
      MakeEntry("HC1", 0, {1.0F, 0.0F, 0.0F}, "High Court", "2019-01-01"),
      MakeEntry("HC2", 0, {0.9F, 0.1F, 0.0F}, "High Court", "2020-01-01"),
      MakeEntry("SC1", 0, {0.1F, 0.9F, 0.0F}, "Supreme Court", "2017-08-24"),
      MakeEntry("SC2", 0, {0.0F, 1.0F, 0.0F}, "Supreme Court", "Unknown"),
  });

  nyayacpp::SearchFilters court_only{};
  court_only.court = "Supreme Court";
  const auto court_hits = index.Search({1.0F, 0.0F, 0.0F}, 1, court_only);
  Require(court_hits.size() == 1, "court filter must not under-fill top_k");
  Require(court_hits[0].entry.segment_id == "SC1#0", "best Supreme Court segment expected");

  nyayacpp::SearchFilters dated{};
  dated.date_from = "2017-01-01";
  dated.date_to = "2019-12-31";
  const auto dated_hits = index.Search({1.0F, 0.0F, 0.0F}, 10, dated);
  Require(dated_hits.size() == 2, "date range must keep two segments");
  Require(dated_hits[0].entry.segment_id == "HC1#0", "in-range best match expected first");
  Require(dated_hits[1].entry.segment_id == "SC1#0", "in-range second match expected");

  nyayacpp::SearchFilters by_case{};
  by_case.case_ids = std::unordered_set<std::string>{"SC2", "HC2"};
  const auto case_hits = index.Search({1.0F, 0.0F, 0.0F}, 10, by_case);
  Require(case_hits.size() == 2 && case_hits[0].entry.segment_id == "HC2#0", "case id filter mismatch");

  nyayacpp::SearchFilters nothing{};
  nothing.court = "District Court";
  Require(index.Search({1.0F, 0.0F, 0.0F}, 5, nothing).empty(), "unmatched filter yields nothing");
}

void ScenarioDimensionMismatch() {
  nyayacpp::tests::Log("scenario: dimension mismatch is a hard error");
  nyayacpp::VectorIndex index({}, 3);
  Require(Throws([&]() { (void)index.Search({1.0F, 0.0F}, 5); }), "short query must throw even when empty");
  Require(Throws([&]() { index.Upsert({MakeEntry("A", 0, {1.0F, 0.0F, 0.0F, 0.0F})}); }),
          "wrong-size entry must throw");
  Require(index.Count() == 0, "rejected upsert must not store anything");
}

void ScenarioRemoveAndPrune() {
  nyayacpp::tests::Log("scenario: remove case and prune stale segments");
  nyayacpp::VectorIndex index({}, 3);
  index.Upsert({
      MakeEntry("A", 0, {1.0F, 0.0F, 0.0F}),
      MakeEntry("A", 1, {1.0F, 0.0F, 0.0F}),
      MakeEntry("A", 2, {1.0F, 0.0F, 0.0F}),
      MakeEntry("B", 0, {0.0F, 1.0F, 0.0F}),
  });
  Require(index.PruneCaseSegments("A", 2) == 1, "one stale segment expected");
  Require(!index.Get("A#2").has_value(), "pruned segment must be gone");
  Require(index.Get("A#1").has_value(), "kept segment must remain");
  Require(index.PruneCaseSegments("A", 2) == 0, "prune must be idempotent");

  Require(index.RemoveCase("A") == 2, "remaining A segments must be removed");
  Require(index.Count() == 1, "only B must remain");
  Require(index.RemoveCase("missing") == 0, "unknown case removes nothing");
  Require(index.Remove({"B#0", "nope"}) == 1, "explicit removal count mismatch");
  Require(index.CaseIds().empty(), "no cases must remain");

  index.Upsert({MakeEntry("C", 0, {1.0F, 0.0F, 0.0F})});
  index.Clear();
  Require(index.Count() == 0, "clear must empty the index");
}

void ScenarioPersistence() {
  nyayacpp::tests::Log("scenario: persistence across reopen");
  nyayacpp::tests::ScopedDir dir("vector_index");
  std::filesystem::create_directories(dir.path());
  const auto db_path = dir.path() / "segments.sqlite";
  {
    nyayacpp::VectorIndex index(db_path, 3);
    index.Upsert({
        MakeEntry("A", 0, {1.0F, 0.0F, 0.0F}, "Supreme Court", "2017-08-24"),
        MakeEntry("B", 0, {0.25F, -0.5F, 0.75F}, "High Court", "Unknown"),
    });
  }
  {
    nyayacpp::VectorIndex reopened(db_path, 3);
    Require(reopened.Count() == 2, "reopened index must keep entries");
    const auto stored = reopened.Get("B#0");
    Require(stored.has_value(), "stored entry must survive reopen");
    Require(stored->vector == std::vector<float>({0.25F, -0.5F, 0.75F}), "vector must round-trip exactly");
    Require(stored->metadata.court == "High Court" && stored->metadata.decision_date == "Unknown",
            "metadata must round-trip");
    const auto hits = reopened.Search({1.0F, 0.0F, 0.0F}, 1);
    Require(hits.size() == 1 && hits[0].entry.segment_id == "A#0", "reopened search mismatch");
  }

  bool threw = false;
  try {
    nyayacpp::VectorIndex wrong(db_path, 4);
  } catch (const nyayacpp::ConfigurationError&) {
    threw = true;
  }
  Require(threw, "reopening with different dimensions must fail");
}

void ScenarioInjectedCommitFailure() {
  nyayacpp::tests::Log("scenario: failed commit publishes nothing");
  nyayacpp::VectorIndex index({}, 3);
  nyayacpp::vector::testing::FailCommitAfter(1);
  index.Upsert({MakeEntry("A", 0, {1.0F, 0.0F, 0.0F})});
  bool threw = false;
  try {
    index.Upsert({MakeEntry("B", 0, {0.0F, 1.0F, 0.0F}), MakeEntry("B", 1, {0.0F, 1.0F, 0.0F})});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  nyayacpp::vector::testing::ClearCommitFailure();
  Require(threw, "second upsert must fail");
  Require(index.Count() == 1, "failed batch must not be visible");
  Require(!index.Get("B#0").has_value(), "failed entry must not be visible");

  index.Upsert({MakeEntry("B", 0, {0.0F, 1.0F, 0.0F})});
  Require(index.Count() == 2, "upserts must work after clearing the hook");
}

void ScenarioConcurrentReadersSeeWholeEntries() {
  nyayacpp::tests::Log("scenario: readers never observe partial entries");
  nyayacpp::VectorIndex index({}, 3);
  auto versioned = [](int version) {
    auto entry = MakeEntry("A", 0, {static_cast<float>(version), 1.0F, 0.0F});
    entry.text = "version " + std::to_string(version);
    return entry;
  };
  index.Upsert({versioned(1)});

  std::atomic<bool> done{false};
  std::atomic<int> inconsistencies{0};
  std::vector<std::thread> readers{};
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&]() {
      while (!done.load()) {
        for (const auto& hit : index.Search({1.0F, 1.0F, 0.0F}, 5)) {
          const auto expected = "version " + std::to_string(static_cast<int>(hit.entry.vector[0]));
          if (hit.entry.text != expected) {
            inconsistencies.fetch_add(1);
          }
        }
      }
    });
  }
  for (int version = 2; version <= 60; ++version) {
    index.Upsert({versioned(version)});
  }
  done.store(true);
  for (auto& reader : readers) {
    reader.join();
  }
  Require(inconsistencies.load() == 0, "reader observed a half-updated entry");
  Require(index.Count() == 1, "versions must overwrite one entry");
  Require(index.Get("A#0")->text == "version 60", "last writer must win");
}

}  // namespace

int main() {
  try {
    nyayacpp::tests::Log("vector_index_test: start");
    ScenarioEmptyIndex();
    ScenarioUpsertIsIdempotent();
    ScenarioRankingAndTieBreak();
    ScenarioFiltersApplyBeforeRanking();
    ScenarioDimensionMismatch();
    ScenarioRemoveAndPrune();
    ScenarioPersistence();
    ScenarioInjectedCommitFailure();
    ScenarioConcurrentReadersSeeWholeEntries();
    nyayacpp::tests::Log("vector_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    nyayacpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

#include <railtriage/app/triage_runner.hpp>
#include <railtriage/dedup/in_memory_cluster_store.hpp>
#include <railtriage/nlp/keyword_text_model.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace ra = railtriage::app;
namespace rc = railtriage::core;
namespace nl = railtriage::nlp;
namespace rd = railtriage::dedup;
namespace rm = railtriage::media;
namespace rr = railtriage::routing;

namespace {

const rc::Timestamp kNow = rc::Timestamp{} + std::chrono::hours(500000);

std::unique_ptr<ra::TriageOrchestrator> make_orchestrator(
    std::shared_ptr<rd::InMemoryClusterStore> store) {
  ra::TriageComponents c;
  c.extractor = std::make_shared<rm::FeatureExtractor>(nullptr, nl::TextVectorizer(128));
  c.classifier = std::make_shared<nl::Classifier>(std::make_shared<nl::KeywordTextModel>(),
                                                  nl::UrgencyScorer{});
  c.deduplicator = std::make_shared<rd::Deduplicator>(std::move(store));
  c.router = std::make_shared<rr::Router>();
  c.executor = std::make_shared<rc::TaskExecutor>(2);
  return std::make_unique<ra::TriageOrchestrator>(std::move(c), ra::TriageOptions{},
                                                  [] { return kNow; });
}

std::vector<rc::ComplaintInput> batch(std::size_t n) {
  std::vector<rc::ComplaintInput> inputs;
  for (std::size_t i = 0; i < n; ++i) {
    rc::ComplaintInput in;
    in.text = i % 2 == 0 ? "toilet dirty and smelly" : "fan not working";
    in.reporter_location = "coach-b12";
    in.submitted_at = kNow;
    inputs.push_back(std::move(in));
  }
  return inputs;
}

}  // namespace

TEST(TriageRunner, SequentialCallsBackInOrder) {
  auto store = std::make_shared<rd::InMemoryClusterStore>();
  auto orch = make_orchestrator(store);
  std::vector<std::size_t> order;
  ra::triage_batch(*orch, batch(4), [&order](std::size_t i, const ra::TriageResult& r) {
    EXPECT_TRUE(r.has_value());
    order.push_back(i);
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3}));
  // Two distinct issues at one location.
  EXPECT_EQ(store->size(), 2u);
}

TEST(TriageRunner, ParallelCoversEveryComplaint) {
  auto store = std::make_shared<rd::InMemoryClusterStore>();
  auto orch = make_orchestrator(store);
  constexpr std::size_t kCount = 40;
  std::mutex mutex;
  std::set<std::size_t> seen;
  std::set<std::uint64_t> ids;
  std::atomic<std::size_t> duplicates{0};
  ra::triage_batch_parallel(
      *orch, batch(kCount),
      [&](std::size_t i, const ra::TriageResult& r) {
        ASSERT_TRUE(r.has_value());
        if (!r->is_new_cluster) ++duplicates;
        std::lock_guard lock(mutex);
        seen.insert(i);
        ids.insert(r->complaint_id);
      },
      4);
  EXPECT_EQ(seen.size(), kCount);
  EXPECT_EQ(ids.size(), kCount);
  // Same-key updates are serialized: exactly one cluster per distinct issue.
  EXPECT_EQ(store->size(), 2u);
  EXPECT_EQ(duplicates.load(), kCount - 2);
  std::uint32_t members = 0;
  for (const auto& c : store->history()) members += c.member_count;
  EXPECT_EQ(members, kCount);
}

TEST(TriageRunner, EmptyBatchDoesNotCallBack) {
  auto orch = make_orchestrator(std::make_shared<rd::InMemoryClusterStore>());
  std::atomic<int> calls{0};
  ra::triage_batch_parallel(*orch, {}, [&calls](std::size_t, const ra::TriageResult&) { ++calls; });
  ra::triage_batch(*orch, {}, [&calls](std::size_t, const ra::TriageResult&) { ++calls; });
  EXPECT_EQ(calls.load(), 0);
}

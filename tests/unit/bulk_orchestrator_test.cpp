#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/bulk/item_pool.hpp"
#include "internal/bulk/orchestrator.hpp"
#include "internal/bulk/run_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/feed/feed_fetcher.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_utils.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "support/fakes.hpp"

namespace {

using framecomp::bulk::BulkOptions;
using framecomp::bulk::BulkOrchestrator;
using framecomp::bulk::ItemPool;
using framecomp::bulk::RunRegistry;
using framecomp::bulk::RunTask;
using framecomp::db::memory::MemoryRepository;
using framecomp::db::model::FrameProjectRecord;
using framecomp::db::model::OutputRecord;
using framecomp::storage::RamBlobStore;
using framecomp::testing::AtomFeed;
using framecomp::testing::FakeFetcher;
using framecomp::testing::FeedItem;
using framecomp::testing::ProbeCompositor;
using framecomp::testing::SolidImage;
using namespace framecomp::v1;

const cv::Scalar kBlue(255, 0, 0);
const cv::Scalar kRed(0, 0, 255);

struct Fixture {
  std::shared_ptr<MemoryRepository> repo       = std::make_shared<MemoryRepository>();
  std::shared_ptr<RamBlobStore>     blobs      = std::make_shared<RamBlobStore>();
  std::shared_ptr<FakeFetcher>      http       = std::make_shared<FakeFetcher>();
  std::shared_ptr<RunRegistry>      registry   = std::make_shared<RunRegistry>();
  std::shared_ptr<ProbeCompositor>  compositor;
  std::shared_ptr<ItemPool>         pool;
  std::shared_ptr<BulkOrchestrator> orchestrator;

  explicit Fixture(size_t threads = 4, std::chrono::milliseconds hold = std::chrono::milliseconds{0}) {
    compositor   = std::make_shared<ProbeCompositor>(framecomp::image::CompositorOptions{}, hold);
    pool         = std::make_shared<ItemPool>(threads);
    orchestrator = std::make_shared<BulkOrchestrator>(repo, blobs, std::make_shared<framecomp::feed::FeedFetcher>(http), http, compositor,
                                                      pool, registry, BulkOptions{.progress_interval = 2});
  }

  std::string AddProject(const std::string& id, const std::string& feed_url, bool rect_set = true) {
    FrameProjectRecord r;
    r.id              = id;
    r.name            = id;
    r.template_format = IMAGE_FORMAT_PNG;
    r.template_key    = framecomp::storage::common::TemplateKey(id, IMAGE_FORMAT_PNG);
    r.template_width  = 800;
    r.template_height = 600;
    r.rect_x          = 50;
    r.rect_y          = 50;
    r.rect_width      = 200;
    r.rect_height     = 150;
    r.rect_set        = rect_set;
    r.feed_url        = feed_url;
    r.status          = rect_set ? PROJECT_STATUS_RECT_SET : PROJECT_STATUS_DRAFT;
    r.created_at_ms   = 1;

    blobs->Write(r.template_key, framecomp::storage::common::ToBuffer(SolidImage(800, 600, kBlue)));
    auto tx = repo->Begin();
    assert(repo->InsertProject(*tx, r));
    tx->Commit();
    return id;
  }

  // feed of n good items served from the fake network
  std::string ServeFeed(const std::string& name, const std::vector<FeedItem>& items) {
    const std::string url = "https://feeds.example.com/" + name + ".xml";
    http->Serve(url, AtomFeed(items), "application/xml");
    return url;
  }

  BulkRunResult Run(const std::string& project_id) {
    auto handle = registry->Reserve(project_id);
    return orchestrator->Execute(RunTask{handle.run_id(), project_id});
  }

  FrameProjectRecord Project(const std::string& id) {
    auto tx = repo->Begin();
    auto p  = repo->GetProject(*tx, id);
    tx->Commit();
    assert(p.has_value());
    return *p;
  }

  std::optional<OutputRecord> Output(const std::string& project_id, const std::string& product_id) {
    auto tx  = repo->Begin();
    auto out = repo->GetOutput(*tx, project_id, product_id);
    tx->Commit();
    return out;
  }

  uint64_t OutputCount(const std::string& project_id) {
    auto tx     = repo->Begin();
    auto counts = repo->CountOutputs(*tx, project_id);
    tx->Commit();
    return counts.total;
  }
};

// Memory repository whose output upserts fail with a storage error.
class RefusingRepository final : public framecomp::db::Repository {
 public:
  explicit RefusingRepository(std::shared_ptr<MemoryRepository> inner) : inner_(std::move(inner)) {}

  std::unique_ptr<framecomp::db::Transaction> Begin() override { return inner_->Begin(); }
  framecomp::db::Result                       Ping() override { return inner_->Ping(); }

  framecomp::db::Result InsertProject(framecomp::db::Transaction& tx, const FrameProjectRecord& r) override {
    return inner_->InsertProject(tx, r);
  }
  std::optional<FrameProjectRecord> GetProject(framecomp::db::Transaction& tx, const std::string& id) override {
    return inner_->GetProject(tx, id);
  }
  std::vector<FrameProjectRecord> ListProjects(framecomp::db::Transaction& tx, const std::string& owner) override {
    return inner_->ListProjects(tx, owner);
  }
  framecomp::db::Result UpdateProject(framecomp::db::Transaction& tx, const FrameProjectRecord& r) override {
    return inner_->UpdateProject(tx, r);
  }
  framecomp::db::Result DeleteProject(framecomp::db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteProject(tx, id);
  }

  framecomp::db::Result UpsertOutput(framecomp::db::Transaction&, const OutputRecord&) override {
    return framecomp::db::Result::Err(framecomp::db::ErrorCode::IOError, "disk full");
  }
  std::optional<OutputRecord> GetOutput(framecomp::db::Transaction& tx, const std::string& project_id,
                                        const std::string& product_id) override {
    return inner_->GetOutput(tx, project_id, product_id);
  }
  framecomp::db::model::OutputPage PageOutputs(framecomp::db::Transaction& tx, const framecomp::db::model::OutputQuery& q) override {
    return inner_->PageOutputs(tx, q);
  }
  framecomp::db::model::OutputCounts CountOutputs(framecomp::db::Transaction& tx, const std::string& project_id) override {
    return inner_->CountOutputs(tx, project_id);
  }

 private:
  std::shared_ptr<MemoryRepository> inner_;
};

std::string FailureFor(const BulkRunResult& result, const std::string& product_id) {
  for (const auto& failure : result.failures()) {
    if (failure.product_id() == product_id) return failure.reason();
  }
  return {};
}

void TestItemFailuresAreIsolated() {
  Fixture fx;
  fx.http->Serve("https://cdn.example.com/ok.png", SolidImage(400, 300, kRed), "image/png");
  fx.http->Fail("https://cdn.example.com/blocked.png", FakeFetcher::Failure::kValidation);
  fx.http->Serve("https://cdn.example.com/garbage.png", "<html>not an image</html>", "image/png");
  fx.http->Serve("https://cdn.example.com/old.png", SolidImage(400, 300, kBlue), "image/png");

  auto feed = fx.ServeFeed("mixed", {
                                        {"dup", "https://cdn.example.com/old.png"},
                                        {"ok", "https://cdn.example.com/ok.png"},
                                        {"down", "https://cdn.example.com/unreachable.png"},
                                        {"blocked", "https://cdn.example.com/blocked.png"},
                                        {"garbage", "https://cdn.example.com/garbage.png"},
                                        {"no-image", ""},
                                        {"dup", "https://cdn.example.com/ok.png"},
                                    });
  fx.AddProject("p-mixed", feed);

  auto result = fx.Run("p-mixed");
  assert(result.attempted() == 5);
  assert(result.succeeded() == 2);
  assert(result.failed() == 3);
  assert(result.skipped() == 2);
  assert(result.warnings_size() == 2);

  assert(FailureFor(result, "down").rfind("image fetch failed: ", 0) == 0);
  assert(FailureFor(result, "blocked").rfind("image rejected: ", 0) == 0);
  assert(FailureFor(result, "garbage").rfind("composite failed: ", 0) == 0);

  // the later duplicate wins
  auto dup = fx.Output("p-mixed", "dup");
  assert(dup.has_value());
  assert(dup->product_image_url == "https://cdn.example.com/ok.png");
  assert(fx.http->Calls("https://cdn.example.com/old.png") == 0);

  auto ok = fx.Output("p-mixed", "ok");
  assert(ok->status == OUTPUT_STATUS_SUCCEEDED);
  assert(ok->failure_reason.empty());
  auto image = framecomp::image::Decode(framecomp::storage::common::ToString(fx.blobs->Read(ok->image_key)));
  assert(image.cols == 800 && image.rows == 600);

  auto down = fx.Output("p-mixed", "down");
  assert(down->status == OUTPUT_STATUS_FAILED);
  assert(down->image_key.empty());
  assert(!fx.Output("p-mixed", "no-image").has_value());
  assert(fx.OutputCount("p-mixed") == 5);

  auto project = fx.Project("p-mixed");
  assert(project.status == PROJECT_STATUS_COMPLETED);
  assert(project.total_items == 5);
  assert(project.succeeded_items == 2);
  assert(project.failed_items == 3);
  assert(project.last_error.empty());
  assert(project.run_completed_at_ms > 0);

  auto status = fx.registry->Get("p-mixed");
  assert(status->state() == RUN_STATE_COMPLETED);
  assert(status->processed() == 5);
  assert(status->total_items() == 5);
}

void TestConcurrencyIsBounded() {
  Fixture fx(3, std::chrono::milliseconds(20));
  fx.http->Serve("https://cdn.example.com/p.png", SolidImage(40, 40, kRed), "image/png");

  std::vector<FeedItem> items;
  for (int i = 0; i < 12; ++i) items.push_back({"sku-" + std::to_string(i), "https://cdn.example.com/p.png"});
  fx.AddProject("p-bound", fx.ServeFeed("bound", items));

  auto result = fx.Run("p-bound");
  assert(result.succeeded() == 12);
  assert(fx.compositor->Calls() == 12);
  assert(fx.compositor->Peak() <= 3);
  assert(fx.compositor->Peak() >= 1);
}

void TestRerunOverwritesInPlace() {
  Fixture fx;
  fx.http->Serve("https://cdn.example.com/a.png", SolidImage(40, 40, kRed), "image/png");
  auto feed = fx.ServeFeed("rerun", {{"a", "https://cdn.example.com/a.png"}, {"b", "https://cdn.example.com/b.png"}});
  fx.AddProject("p-rerun", feed);

  auto first = fx.Run("p-rerun");
  assert(first.succeeded() == 1 && first.failed() == 1);
  auto a1 = fx.Output("p-rerun", "a");
  auto b1 = fx.Output("p-rerun", "b");

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  // b comes back on the second run
  fx.http->Serve("https://cdn.example.com/b.png", SolidImage(40, 40, kRed), "image/png");
  auto second = fx.Run("p-rerun");
  assert(second.succeeded() == 2 && second.failed() == 0);

  assert(fx.OutputCount("p-rerun") == 2);
  auto a2 = fx.Output("p-rerun", "a");
  auto b2 = fx.Output("p-rerun", "b");
  assert(a2->created_at_ms == a1->created_at_ms);
  assert(a2->generated_at_ms >= a1->generated_at_ms);
  assert(a2->image_key == a1->image_key);
  assert(b2->created_at_ms == b1->created_at_ms);
  assert(b2->status == OUTPUT_STATUS_SUCCEEDED);
  assert(b2->failure_reason.empty());
  assert(fx.blobs->Exists(b2->image_key));
}

void TestCancelStopsWrites() {
  Fixture fx(1);
  fx.http->Serve("https://cdn.example.com/p.png", SolidImage(40, 40, kRed), "image/png");
  std::vector<FeedItem> items;
  for (int i = 0; i < 5; ++i) items.push_back({"sku-" + std::to_string(i), "https://cdn.example.com/p.png"});
  fx.AddProject("p-cancel", fx.ServeFeed("cancel", items));

  fx.compositor->Close();
  auto          handle = fx.registry->Reserve("p-cancel");
  BulkRunResult result;
  std::thread   runner([&] { result = fx.orchestrator->Execute(RunTask{handle.run_id(), "p-cancel"}); });

  fx.compositor->WaitForWaiting(1);
  assert(fx.registry->Cancel("p-cancel"));
  fx.compositor->Open();
  runner.join();

  assert(result.attempted() == 0);
  assert(fx.compositor->Calls() == 1);
  assert(fx.OutputCount("p-cancel") == 0);
  assert(fx.registry->Get("p-cancel")->state() == RUN_STATE_CANCELLED);
  // only the template remains
  assert(fx.blobs->Count() == 1);

  // a cancelled run leaves the project row alone
  auto project = fx.Project("p-cancel");
  assert(project.status == PROJECT_STATUS_RECT_SET);
}

void TestConfigurationErrorsFailTheRun() {
  Fixture fx;
  fx.AddProject("p-norect", "https://feeds.example.com/x.xml", false);
  auto norect = fx.Run("p-norect");
  assert(norect.attempted() == 0);
  auto status = fx.registry->Get("p-norect");
  assert(status->state() == RUN_STATE_FAILED);
  assert(status->error().find("overlay rect") != std::string::npos);
  assert(fx.Project("p-norect").status == PROJECT_STATUS_FAILED);

  fx.AddProject("p-nofeed", "https://feeds.example.com/missing.xml");
  auto nofeed = fx.Run("p-nofeed");
  assert(nofeed.attempted() == 0);
  assert(fx.registry->Get("p-nofeed")->error().find("feed fetch failed") != std::string::npos);
  auto project = fx.Project("p-nofeed");
  assert(project.status == PROJECT_STATUS_FAILED);
  assert(project.last_error.find("feed fetch failed") != std::string::npos);
  assert(fx.http->TotalCalls() == 1);

  auto empty = fx.ServeFeed("empty", {{"", ""}});
  fx.AddProject("p-empty", empty);
  auto none = fx.Run("p-empty");
  assert(none.attempted() == 0);
  assert(none.skipped() == 1);
  assert(fx.registry->Get("p-empty")->error() == "feed has no usable items");
}

void TestAllItemsFailingFailsTheRun() {
  Fixture fx;
  auto feed = fx.ServeFeed("dead", {{"a", "https://cdn.example.com/a.png"}, {"b", "https://cdn.example.com/b.png"}});
  fx.AddProject("p-dead", feed);

  auto result = fx.Run("p-dead");
  assert(result.attempted() == 2);
  assert(result.failed() == 2);
  assert(fx.registry->Get("p-dead")->state() == RUN_STATE_FAILED);
  assert(fx.registry->Get("p-dead")->error() == "no item succeeded");
  assert(fx.OutputCount("p-dead") == 2);
  assert(fx.Project("p-dead").status == PROJECT_STATUS_FAILED);
}

void TestDeletedProjectCancels() {
  Fixture fx;
  auto    handle = fx.registry->Reserve("p-gone");
  auto    result = fx.orchestrator->Execute(RunTask{handle.run_id(), "p-gone"});
  assert(result.attempted() == 0);
  assert(fx.registry->Get("p-gone")->state() == RUN_STATE_CANCELLED);
}

void TestUnrecordedOutputsLeaveNoBlob() {
  Fixture fx;
  fx.http->Serve("https://cdn.example.com/p.png", SolidImage(40, 40, kRed), "image/png");
  fx.AddProject("p-refused", fx.ServeFeed("refused", {{"a", "https://cdn.example.com/p.png"}, {"b", "https://cdn.example.com/p.png"}}));

  auto refusing     = std::make_shared<RefusingRepository>(fx.repo);
  auto orchestrator = std::make_shared<BulkOrchestrator>(refusing, fx.blobs, std::make_shared<framecomp::feed::FeedFetcher>(fx.http),
                                                         fx.http, fx.compositor, fx.pool, fx.registry);
  auto handle       = fx.registry->Reserve("p-refused");
  auto result       = orchestrator->Execute(RunTask{handle.run_id(), "p-refused"});

  assert(fx.compositor->Calls() == 2);
  assert(result.succeeded() == 0);
  assert(result.failed() == 2);
  assert(FailureFor(result, "a") == "output store write failed");
  assert(fx.OutputCount("p-refused") == 0);
  assert(!fx.blobs->Exists(framecomp::storage::common::OutputKey("p-refused", "a", IMAGE_FORMAT_PNG)));
  assert(!fx.blobs->Exists(framecomp::storage::common::OutputKey("p-refused", "b", IMAGE_FORMAT_PNG)));
  assert(fx.blobs->Count() == 1);
}

} // namespace

int main() {
  TestItemFailuresAreIsolated();
  TestConcurrencyIsBounded();
  TestRerunOverwritesInPlace();
  TestCancelStopsWrites();
  TestConfigurationErrorsFailTheRun();
  TestAllItemsFailingFailsTheRun();
  TestDeletedProjectCancels();
  TestUnrecordedOutputsLeaveNoBlob();

  std::cout << "framecomp_unit_bulk_orchestrator: pass\n";
  return 0;
}

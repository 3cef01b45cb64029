#include "Errors.hpp"
#include "Pipeline.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <thread>

using namespace watchflow;
using namespace std::chrono_literals;
using watchflow::test::FakeEventSource;
using watchflow::test::RecordingWorkflow;
using watchflow::test::TempDir;
using watchflow::test::waitFor;

namespace {

// Read only while no other thread is writing
class SyncStream {
public:
  std::shared_ptr<OutputSink> sink() { return m_sink; }
  std::string str() const { return m_stream.str(); }

private:
  std::ostringstream m_stream;
  std::shared_ptr<OutputSink> m_sink = std::make_shared<OutputSink>(m_stream);
};

bool has(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
  SyncStream out;
  SyncStream err;
  std::shared_ptr<FakeEventSource> source =
      std::make_shared<FakeEventSource>();
  TempDir tmp;

  PipelineOptions options(bool verbose = false) {
    PipelineOptions o;
    o.name = "test";
    o.batchInterval = 20ms;
    o.verbose = verbose;
    o.out = out.sink();
    o.err = err.sink();
    auto src = source;
    o.sourceFactory = [src]() -> std::shared_ptr<EventSource> { return src; };
    return o;
  }
};

TEST_F(PipelineTest, WatchDeduplicatesResolvedPaths) {
  tmp.mkdir("src");
  Pipeline pipeline(options());

  std::string first = pipeline.watch(tmp.path() + "/src");
  std::string second = pipeline.watch(tmp.path() + "/./src/");

  EXPECT_EQ(first, second);
  EXPECT_EQ(pipeline.watches(), std::vector<std::string>{first});
}

TEST_F(PipelineTest, WatchReportsResolutionError) {
  Pipeline pipeline(options());
  EXPECT_THROW(pipeline.watch(tmp.path() + "/missing"), ResolutionError);
  EXPECT_THROW(pipeline.watchRecursive(tmp.path() + "/missing", true),
               ResolutionError);
  EXPECT_TRUE(pipeline.watches().empty());
}

TEST_F(PipelineTest, DefaultsUnnamedPipeline) {
  PipelineOptions o = options();
  o.name.clear();
  Pipeline pipeline(o);
  EXPECT_EQ(pipeline.name(), "<UNNAMED>");
}

TEST_F(PipelineTest, StartWarnsWhenEmpty) {
  Pipeline pipeline(options());
  auto handle = pipeline.start();
  ASSERT_NE(handle, nullptr);
  handle->stop();

  std::string text = err.str();
  EXPECT_NE(text.find("Pipeline test is not watching anything"),
            std::string::npos);
  EXPECT_NE(text.find("Pipeline test has no Workflows"), std::string::npos);
}

TEST_F(PipelineTest, StartSubscribesExistingWatches) {
  tmp.mkdir("a/b");
  Pipeline pipeline(options(true));
  pipeline.watchRecursive(tmp.path() + "/a", IgnoreHidden);

  auto handle = pipeline.start();
  ASSERT_NE(handle, nullptr);
  EXPECT_TRUE(pipeline.running());
  EXPECT_TRUE(source->isOpen());

  auto subs = source->subscriptions();
  EXPECT_EQ(subs.size(), 2u);
  EXPECT_TRUE(has(subs, tmp.path() + "/a"));
  EXPECT_TRUE(has(subs, tmp.path() + "/a/b"));
  EXPECT_NE(out.str().find("Watching " + tmp.path() + "/a/b"),
            std::string::npos);

  handle->stop();
}

TEST_F(PipelineTest, SetupErrorReturnsNoHandle) {
  source->failOpen();
  Pipeline pipeline(options());

  EXPECT_EQ(pipeline.start(), nullptr);
  EXPECT_FALSE(pipeline.running());
  EXPECT_FALSE(pipeline.run());
  EXPECT_NE(err.str().find("fake source refused to open"), std::string::npos);
}

TEST_F(PipelineTest, DispatchFansOutPerEvent) {
  std::string path1 = tmp.touch("w/path1");
  std::string path2 = tmp.touch("w/path2");
  Pipeline pipeline(options());
  pipeline.watch(tmp.path() + "/w");

  auto wf1 = std::make_shared<RecordingWorkflow>(
      "one", [path1](const std::string &p, Op) { return p == path1; });
  auto wf2 = std::make_shared<RecordingWorkflow>(
      "two", [](const std::string &, Op) { return true; });
  pipeline.add(wf1);
  pipeline.add(wf2);

  auto handle = pipeline.start();
  ASSERT_NE(handle, nullptr);
  source->emit(path1, Op::Write);
  source->emit(path2, Op::Write);

  EXPECT_TRUE(waitFor([&] { return wf2->runs().size() == 2; }));
  handle->stop();

  EXPECT_EQ(wf1->runs(), std::vector<std::string>{path1});
  EXPECT_EQ(wf2->runs(), (std::vector<std::string>{path1, path2}));
}

TEST_F(PipelineTest, ProcessBatchDispatchesInOrder) {
  Pipeline pipeline(options());
  auto wf = std::make_shared<RecordingWorkflow>(
      "all", [](const std::string &, Op) { return true; });
  pipeline.add(wf);

  pipeline.processBatch(
      {{"/w/A", Op::Write}, {"/w/B", Op::Write}, {"/w/C", Op::Remove}});

  EXPECT_EQ(wf->runs(), (std::vector<std::string>{"/w/A", "/w/B", "/w/C"}));
}

TEST_F(PipelineTest, WatchAfterStartSubscribesImmediately) {
  tmp.mkdir("first");
  tmp.mkdir("later/sub");
  Pipeline pipeline(options());
  pipeline.watch(tmp.path() + "/first");

  auto handle = pipeline.start();
  ASSERT_NE(handle, nullptr);
  EXPECT_EQ(source->subscriptions().size(), 1u);

  pipeline.watchRecursive(tmp.path() + "/later", IgnoreHidden);
  auto subs = source->subscriptions();
  EXPECT_TRUE(has(subs, tmp.path() + "/later"));
  EXPECT_TRUE(has(subs, tmp.path() + "/later/sub"));

  handle->stop();
}

TEST_F(PipelineTest, NewDirectoryUnderRecursiveRootIsWatched) {
  tmp.mkdir("root/sub");
  Pipeline pipeline(options());
  pipeline.watchRecursive(tmp.path() + "/root", IgnoreHidden);
  pipeline.add(std::make_shared<RecordingWorkflow>(
      "none", [](const std::string &, Op) { return false; }));

  auto handle = pipeline.start();
  ASSERT_NE(handle, nullptr);

  std::string fresh = tmp.mkdir("root/sub/new/deeper");
  std::string newDir = tmp.path() + "/root/sub/new";
  source->emit(newDir, Op::Create);

  EXPECT_TRUE(waitFor([&] { return has(source->subscriptions(), fresh); }));
  EXPECT_TRUE(has(pipeline.watches(), newDir));
  handle->stop();
}

TEST_F(PipelineTest, RescanRunsAlongsideDispatch) {
  tmp.mkdir("root");
  Pipeline pipeline(options());
  pipeline.watchRecursive(tmp.path() + "/root", IgnoreHidden);
  auto wf = std::make_shared<RecordingWorkflow>(
      "all", [](const std::string &, Op) { return true; });
  pipeline.add(wf);

  auto handle = pipeline.start();
  ASSERT_NE(handle, nullptr);

  std::string newDir = tmp.mkdir("root/new");
  std::string file = tmp.touch("root/file.txt");
  source->holdSubscribe(newDir);

  // Returns while the rescan for newDir is still stuck in subscribe
  pipeline.processBatch({{newDir, Op::Create}, {file, Op::Write}});
  EXPECT_EQ(wf->runs(), (std::vector<std::string>{newDir, file}));

  EXPECT_TRUE(waitFor([&] { return source->subscribeHeld(); }));
  EXPECT_FALSE(has(source->subscriptions(), newDir));

  source->releaseSubscribe();
  EXPECT_TRUE(waitFor([&] { return has(source->subscriptions(), newDir); }));
  handle->stop();
}

TEST_F(PipelineTest, StopEndsIntake) {
  std::string file = tmp.touch("w/file");
  Pipeline pipeline(options());
  pipeline.watch(tmp.path() + "/w");
  auto wf = std::make_shared<RecordingWorkflow>(
      "all", [](const std::string &, Op) { return true; });
  pipeline.add(wf);

  auto handle = pipeline.start();
  ASSERT_NE(handle, nullptr);
  source->emit(file, Op::Write);
  ASSERT_TRUE(waitFor([&] { return wf->runs().size() == 1; }));

  handle->stop();
  EXPECT_TRUE(handle->stopped());
  EXPECT_FALSE(pipeline.running());
  EXPECT_EQ(source->closeCount(), 1);
  size_t batches = handle->batchCount();

  // Events racing the shutdown go nowhere
  source->emit(file, Op::Write);
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(handle->batchCount(), batches);
  EXPECT_EQ(wf->runs().size(), 1u);

  handle->stop();
  EXPECT_EQ(source->closeCount(), 1);
}

TEST_F(PipelineTest, RunBlocksUntilStopped) {
  tmp.mkdir("w");
  Pipeline pipeline(options());
  pipeline.watch(tmp.path() + "/w");

  std::atomic<bool> returned{false};
  std::thread runner([&] {
    EXPECT_TRUE(pipeline.run());
    returned = true;
  });

  ASSERT_TRUE(waitFor([&] { return pipeline.running(); }));
  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(returned.load());

  pipeline.stop();
  runner.join();
  EXPECT_TRUE(returned.load());
}

TEST_F(PipelineTest, RestartAfterStop) {
  tmp.mkdir("w");
  Pipeline pipeline(options());
  pipeline.watch(tmp.path() + "/w");

  auto first = pipeline.start();
  ASSERT_NE(first, nullptr);
  first->stop();
  EXPECT_FALSE(source->isOpen());

  auto second = pipeline.start();
  ASSERT_NE(second, nullptr);
  EXPECT_NE(first, second);
  EXPECT_TRUE(source->isOpen());
  EXPECT_EQ(source->subscriptions().size(), 2u);
  second->stop();
}

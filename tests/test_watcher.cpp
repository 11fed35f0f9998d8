#include <gtest/gtest.h>
#include <fstream>
#include "clipboard_watcher.hpp"
#include "test_support.hpp"

using namespace clipmesh;
using clipmesh::test::IoRunner;
using clipmesh::test::MemoryClipboard;
using clipmesh::test::TempDir;
using clipmesh::test::wait_until;
using namespace std::chrono_literals;

namespace {

class WatcherTest : public ::testing::Test {
protected:
  std::shared_ptr<ClipboardWatcher> make(asio::io_context &io,
                                         uint64_t limit = 1024 * 1024) {
    return std::make_shared<ClipboardWatcher>(
        asio::make_strand(io), clip_, 10ms, limit, [this](ClipboardContent c) {
          std::lock_guard<std::mutex> lk(mtx_);
          seen_.push_back(std::move(c));
        });
  }
  std::vector<ClipboardContent> seen() {
    std::lock_guard<std::mutex> lk(mtx_);
    return seen_;
  }

  MemoryClipboard clip_;
  std::mutex mtx_;
  std::vector<ClipboardContent> seen_;
};

} // namespace

TEST_F(WatcherTest, BaselineIsNotReported) {
  asio::io_context io;
  clip_.set_text("already there");
  auto w = make(io);
  EXPECT_FALSE(w->poll_once());
  EXPECT_FALSE(w->poll_once());
  EXPECT_TRUE(seen().empty());
}

TEST_F(WatcherTest, ReportsEachChangeOnce) {
  asio::io_context io;
  clip_.set_text("one");
  auto w = make(io);
  w->poll_once();

  clip_.set_text("two");
  EXPECT_TRUE(w->poll_once());
  EXPECT_FALSE(w->poll_once());
  clip_.set_text("three");
  EXPECT_TRUE(w->poll_once());

  auto s = seen();
  ASSERT_EQ(s.size(), 2u);
  EXPECT_EQ(*s[0].text(), "two");
  EXPECT_EQ(*s[1].text(), "three");
}

TEST_F(WatcherTest, ReadFailureSkipsTick) {
  asio::io_context io;
  clip_.set_text("base");
  auto w = make(io);
  w->poll_once();

  clip_.fail_reads(true);
  clip_.set_text("during outage");
  EXPECT_FALSE(w->poll_once());
  EXPECT_FALSE(w->poll_once());
  clip_.fail_reads(false);
  EXPECT_TRUE(w->poll_once());
  ASSERT_EQ(seen().size(), 1u);
  EXPECT_EQ(*seen()[0].text(), "during outage");
}

TEST_F(WatcherTest, FilesTakePriorityAndAreLoaded) {
  TempDir tmp;
  auto file = tmp.path() / "doc.txt";
  {
    std::ofstream out(file, std::ios::binary);
    out << "contents";
  }
  asio::io_context io;
  auto w = make(io);
  w->poll_once();

  clip_.set_files({file.string()});
  EXPECT_TRUE(w->poll_once());
  // unchanged list is not reloaded or reported again
  EXPECT_FALSE(w->poll_once());

  auto s = seen();
  ASSERT_EQ(s.size(), 1u);
  ASSERT_NE(s[0].files(), nullptr);
  ASSERT_EQ(s[0].files()->size(), 1u);
  EXPECT_EQ((*s[0].files())[0].path, "doc.txt");
  EXPECT_EQ((*s[0].files())[0].size, 8u);
  EXPECT_EQ((*s[0].files())[0].data.size(), 8u);
}

TEST_F(WatcherTest, LargeFilesReportedWithoutData) {
  TempDir tmp;
  auto file = tmp.path() / "big.bin";
  {
    std::ofstream out(file, std::ios::binary);
    out << std::string(4096, 'b');
  }
  asio::io_context io;
  auto w = make(io, 1024);
  w->poll_once();
  clip_.set_files({file.string()});
  EXPECT_TRUE(w->poll_once());
  auto s = seen();
  ASSERT_EQ(s.size(), 1u);
  EXPECT_EQ(s[0].byte_size(), 4096u);
  EXPECT_TRUE((*s[0].files())[0].data.empty());
}

TEST_F(WatcherTest, TimerDrivenPolling) {
  IoRunner runner(1);
  clip_.set_text("initial");
  auto w = make(runner.io);
  w->start();
  clip_.set_text("copied later");
  ASSERT_TRUE(wait_until([&]() { return seen().size() == 1; }));
  w->stop();
  std::this_thread::sleep_for(50ms);
  clip_.set_text("after stop");
  std::this_thread::sleep_for(50ms);
  ASSERT_EQ(seen().size(), 1u);
  EXPECT_EQ(*seen()[0].text(), "copied later");
}

#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include "content.hpp"
#include "test_support.hpp"

using namespace clipmesh;
using clipmesh::test::TempDir;

namespace {

void write_file(const std::filesystem::path &p, const std::string &body) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  out << body;
}

FileList sorted(FileList files) {
  std::sort(files.begin(), files.end(),
            [](const FileEntry &a, const FileEntry &b) { return a.path < b.path; });
  return files;
}

} // namespace

TEST(Content, KindAndSize) {
  auto t = ClipboardContent::from_text("abcd");
  EXPECT_EQ(t.kind(), ContentKind::Text);
  EXPECT_EQ(t.byte_size(), 4u);
  EXPECT_EQ(t.image(), nullptr);

  auto i = ClipboardContent::from_image("image/png", {1, 2, 3});
  EXPECT_EQ(i.kind(), ContentKind::Image);
  EXPECT_EQ(i.byte_size(), 3u);

  auto f = ClipboardContent::from_files({{"a", 10, {}}, {"b", 5, {}}});
  EXPECT_EQ(f.kind(), ContentKind::Files);
  EXPECT_EQ(f.byte_size(), 15u);
  EXPECT_EQ(f.describe(), "files count=2 bytes=15");
  EXPECT_STREQ(kind_str(ContentKind::Image), "image");
}

TEST(Content, FingerprintIdentity) {
  auto a = ClipboardContent::from_text("hello");
  auto b = ClipboardContent::from_text("hello");
  EXPECT_EQ(fingerprint(a), fingerprint(b));
  EXPECT_NE(fingerprint(a), fingerprint(ClipboardContent::from_text("hello ")));
  EXPECT_EQ(fingerprint_hex(fingerprint(a)).size(), 64u);

  // identical bytes under another kind or encoding are different content
  std::vector<uint8_t> bytes{'h', 'e', 'l', 'l', 'o'};
  EXPECT_NE(fingerprint(a), fingerprint(ClipboardContent::from_image("image/png", bytes)));
  EXPECT_NE(fingerprint(ClipboardContent::from_image("image/png", bytes)),
            fingerprint(ClipboardContent::from_image("image/bmp", bytes)));

  // field boundaries are unambiguous
  auto f1 = ClipboardContent::from_files({{"ab", 1, {'c'}}});
  auto f2 = ClipboardContent::from_files({{"a", 2, {'b', 'c'}}});
  EXPECT_NE(fingerprint(f1), fingerprint(f2));
}

TEST(Content, CollectFilesExpandsDirectories) {
  TempDir tmp;
  write_file(tmp.path() / "note.txt", "note");
  write_file(tmp.path() / "proj" / "main.c", "int main;");
  write_file(tmp.path() / "proj" / "src" / "x.h", "x");

  FileList files;
  ASSERT_EQ(collect_files({(tmp.path() / "note.txt").string(),
                           (tmp.path() / "proj").string()},
                          1024, files),
            Status::Ok);
  FileList expect{{"note.txt", 4, {'n', 'o', 't', 'e'}},
                  {"proj/main.c", 9, {'i', 'n', 't', ' ', 'm', 'a', 'i', 'n', ';'}},
                  {"proj/src/x.h", 1, {'x'}}};
  EXPECT_EQ(sorted(files), expect);
}

TEST(Content, CollectFilesOverLimitCarriesSizesOnly) {
  TempDir tmp;
  write_file(tmp.path() / "a.bin", std::string(100, 'a'));
  write_file(tmp.path() / "b.bin", std::string(50, 'b'));

  FileList files;
  ASSERT_EQ(collect_files({(tmp.path() / "a.bin").string(),
                           (tmp.path() / "b.bin").string()},
                          120, files),
            Status::Ok);
  ASSERT_EQ(files.size(), 2u);
  EXPECT_TRUE(files[0].data.empty());
  EXPECT_TRUE(files[1].data.empty());
  EXPECT_EQ(ClipboardContent::from_files(files).byte_size(), 150u);
}

TEST(Content, CollectFilesSkipsMissing) {
  TempDir tmp;
  write_file(tmp.path() / "real.txt", "r");
  FileList files;
  ASSERT_EQ(collect_files({(tmp.path() / "gone.txt").string(),
                           (tmp.path() / "real.txt").string()},
                          1024, files),
            Status::Ok);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].path, "real.txt");

  EXPECT_EQ(collect_files({(tmp.path() / "gone.txt").string()}, 1024, files),
            Status::IoError);
  EXPECT_EQ(collect_files({}, 1024, files), Status::Ok);
  EXPECT_TRUE(files.empty());
}

TEST(Content, CollectFilesSortedByPath) {
  TempDir tmp;
  // created in reverse so creation order and path order disagree
  for (const char *name : {"d.txt", "c.txt", "b.txt", "a.txt"})
    write_file(tmp.path() / "share" / name, name);
  write_file(tmp.path() / "share" / "sub" / "0.txt", "zero");

  FileList files;
  ASSERT_EQ(collect_files({(tmp.path() / "share").string()}, 1024, files),
            Status::Ok);
  std::vector<std::string> paths;
  for (const auto &f : files)
    paths.push_back(f.path);
  EXPECT_EQ(paths, (std::vector<std::string>{"share/a.txt", "share/b.txt",
                                             "share/c.txt", "share/d.txt",
                                             "share/sub/0.txt"}));
}

TEST(Content, FileListFingerprintIgnoresEntryOrder) {
  FileEntry a{"share/a.txt", 1, {'a'}};
  FileEntry b{"share/b.txt", 1, {'b'}};
  EXPECT_EQ(fingerprint(ClipboardContent::from_files({a, b})),
            fingerprint(ClipboardContent::from_files({b, a})));
  EXPECT_NE(fingerprint(ClipboardContent::from_files({a, b})),
            fingerprint(ClipboardContent::from_files({a})));
}

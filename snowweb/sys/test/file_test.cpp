#include "snowweb/file.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>
#include <system_error>

#include "snowweb/temp-file.hpp"

namespace snowweb {

TEST(FileTest, OpenReadAndSize) {
  test::ScopedTempDir dir;
  const auto path = dir.writeFile("hello.txt", "hello world");

  File file(path.string());
  ASSERT_TRUE(file);
  EXPECT_TRUE(file.isRegular());
  EXPECT_FALSE(file.isDirectory());
  EXPECT_EQ(file.size(), 11U);

  std::array<std::byte, 5> buf;
  ASSERT_EQ(file.readAt(buf, 6), 5U);
  EXPECT_EQ(std::string(reinterpret_cast<const char*>(buf.data()), buf.size()), "world");
  EXPECT_EQ(file.loadAllContent(), "hello world");
}

TEST(FileTest, DirectoryIsDetected) {
  test::ScopedTempDir dir;
  std::error_code ec;
  File file = File::Open(dir.dirPath().string(), ec);
  ASSERT_FALSE(ec);
  EXPECT_TRUE(file.isDirectory());
}

TEST(FileTest, MissingFileReportsErrno) {
  test::ScopedTempDir dir;
  std::error_code ec;
  File file = File::Open((dir.dirPath() / "missing").string(), ec);
  EXPECT_FALSE(file);
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
  EXPECT_THROW(File((dir.dirPath() / "missing").string()), std::system_error);
}

TEST(FileTest, ComponentThroughFileIsNotADirectory) {
  test::ScopedTempDir dir;
  const auto path = dir.writeFile("plain", "x");
  std::error_code ec;
  File file = File::Open((path / "child").string(), ec);
  EXPECT_EQ(ec, std::errc::not_a_directory);
}

}  // namespace snowweb

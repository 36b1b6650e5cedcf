#include "urikit/fd-stream.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "urikit/base-fd.hpp"
#include "urikit/stream-options.hpp"
#include "urikit/temp-file.hpp"

namespace urikit {

namespace {

std::string ReadFile(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

}  // namespace

class FdStreamTest : public ::testing::Test {
 protected:
  test::ScopedTempDir tmpDir;
  test::ScopedTempFile tmpFile{tmpDir, "0123456789"};
};

TEST_F(FdStreamTest, ReadOnlyMode) {
  FdStream stream(tmpFile.pathStr(), "r");

  EXPECT_TRUE(stream.isReadable());
  EXPECT_FALSE(stream.isWritable());
  EXPECT_TRUE(stream.isSeekable());
  EXPECT_EQ(stream.size(), 10U);

  EXPECT_EQ(stream.read(4), "0123");
  EXPECT_EQ(stream.tell(), 4U);
  EXPECT_EQ(stream.contents(), "456789");
  EXPECT_TRUE(stream.eof());

  EXPECT_THROW(stream.write("x"), std::runtime_error);
}

TEST_F(FdStreamTest, EofAfterZeroByteRead) {
  FdStream stream(tmpFile.pathStr(), "rb");

  EXPECT_EQ(stream.read(10), "0123456789");
  EXPECT_FALSE(stream.eof());
  EXPECT_EQ(stream.read(10), "");
  EXPECT_TRUE(stream.eof());

  stream.rewind();
  EXPECT_FALSE(stream.eof());
  EXPECT_EQ(stream.read(0), "");
  EXPECT_EQ(stream.tell(), 0U);
}

TEST_F(FdStreamTest, SeekWhence) {
  FdStream stream(tmpFile.pathStr(), "r");

  stream.seek(3);
  EXPECT_EQ(stream.read(1), "3");
  stream.seek(2, Whence::Current);
  EXPECT_EQ(stream.read(1), "6");
  stream.seek(-2, Whence::End);
  EXPECT_EQ(stream.contents(), "89");

  EXPECT_THROW(stream.seek(-1), std::system_error);
}

TEST_F(FdStreamTest, WriteInvalidatesKnownSize) {
  FdStream stream(tmpFile.pathStr(), "r+", StreamOptions{}.withSize(3));

  EXPECT_EQ(stream.size(), 3U);
  stream.seek(0, Whence::End);
  EXPECT_EQ(stream.write("abc"), 3U);
  EXPECT_EQ(stream.size(), 13U);
  EXPECT_EQ(stream.str(), "0123456789abc");
}

TEST_F(FdStreamTest, WriteOnlyModes) {
  {
    FdStream stream(tmpFile.pathStr(), "a");
    EXPECT_FALSE(stream.isReadable());
    EXPECT_TRUE(stream.isWritable());
    EXPECT_THROW(stream.read(1), std::runtime_error);
    EXPECT_EQ(stream.str(), "");
    stream.write("A");
  }
  EXPECT_EQ(ReadFile(tmpFile.pathStr()), "0123456789A");

  {
    FdStream stream(tmpFile.pathStr(), "w");
    EXPECT_EQ(stream.size(), 0U);
    stream.write("new");
  }
  EXPECT_EQ(ReadFile(tmpFile.pathStr()), "new");
}

TEST_F(FdStreamTest, ReadWriteModes) {
  for (const char *mode : {"r+", "rb+", "r+b", "w+", "a+", "c+"}) {
    FdStream stream(tmpFile.pathStr(), mode);
    EXPECT_TRUE(stream.isReadable()) << mode;
    EXPECT_TRUE(stream.isWritable()) << mode;
  }
}

TEST_F(FdStreamTest, ExclusiveCreation) {
  EXPECT_THROW(FdStream(tmpFile.pathStr(), "x"), std::system_error);

  const auto newPath = tmpDir.filePath("created").string();
  FdStream stream(newPath, "x+");
  EXPECT_EQ(stream.write("data"), 4U);
  EXPECT_EQ(stream.str(), "data");
}

TEST_F(FdStreamTest, InvalidModes) {
  EXPECT_THROW(FdStream(tmpFile.pathStr(), ""), std::invalid_argument);
  EXPECT_THROW(FdStream(tmpFile.pathStr(), "z"), std::invalid_argument);
  EXPECT_THROW(FdStream(tmpFile.pathStr(), "r++"), std::invalid_argument);
  EXPECT_THROW(FdStream(tmpFile.pathStr(), "rt"), std::invalid_argument);
}

TEST_F(FdStreamTest, OpenFailure) {
  EXPECT_THROW(FdStream(tmpDir.filePath("missing").string(), "r"), std::system_error);
}

TEST_F(FdStreamTest, Metadata) {
  FdStream stream(tmpFile.pathStr(), "r", StreamOptions{}.withMetadata("custom", "value").withMetadata("mode", "x"));

  const StreamMetadata meta = stream.metadata();
  EXPECT_EQ(meta.at("uri"), tmpFile.pathStr());
  EXPECT_EQ(meta.at("seekable"), "true");
  EXPECT_EQ(meta.at("custom"), "value");
  EXPECT_EQ(meta.at("mode"), "x");
  EXPECT_EQ(stream.metadata("stream_type"), "fd");
  EXPECT_EQ(stream.metadata("unknown"), std::nullopt);
}

TEST_F(FdStreamTest, DetachedStream) {
  FdStream stream(tmpFile.pathStr(), "r+");

  BaseFd fd = stream.detach();
  ASSERT_TRUE(fd);
  EXPECT_EQ(::lseek(fd.fd(), 0, SEEK_SET), 0);

  EXPECT_FALSE(stream.isReadable());
  EXPECT_FALSE(stream.isWritable());
  EXPECT_FALSE(stream.isSeekable());
  EXPECT_EQ(stream.size(), std::nullopt);
  EXPECT_TRUE(stream.metadata().empty());
  EXPECT_EQ(stream.metadata("uri"), std::nullopt);
  EXPECT_EQ(stream.str(), "");

  EXPECT_THROW(stream.read(1), std::runtime_error);
  EXPECT_THROW(stream.write("a"), std::runtime_error);
  EXPECT_THROW(stream.seek(0), std::runtime_error);
  EXPECT_THROW((void)stream.tell(), std::runtime_error);
  EXPECT_THROW((void)stream.eof(), std::runtime_error);
  EXPECT_THROW(stream.contents(), std::runtime_error);

  EXPECT_FALSE(stream.detach());
}

TEST_F(FdStreamTest, CloseDetaches) {
  FdStream stream(tmpFile.pathStr(), "r");
  const int fd = stream.fd();

  stream.close();

  EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
  EXPECT_FALSE(stream.isReadable());
  EXPECT_THROW(stream.read(1), std::runtime_error);
  EXPECT_NO_THROW(stream.close());
}

TEST(FdStream, AdoptPipe) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  FdStream reader{BaseFd(fds[0])};
  FdStream writer{BaseFd(fds[1])};

  EXPECT_TRUE(reader.isReadable());
  EXPECT_FALSE(reader.isWritable());
  EXPECT_FALSE(reader.isSeekable());
  EXPECT_TRUE(writer.isWritable());
  EXPECT_FALSE(writer.isReadable());
  EXPECT_EQ(reader.size(), std::nullopt);
  EXPECT_EQ(reader.metadata("mode"), "r");
  EXPECT_EQ(writer.metadata("mode"), "w");

  EXPECT_EQ(writer.write("ping"), 4U);
  EXPECT_EQ(writer.tell(), 4U);
  EXPECT_EQ(reader.read(16), "ping");
  EXPECT_EQ(reader.tell(), 4U);

  EXPECT_THROW(reader.seek(0), std::runtime_error);
  EXPECT_EQ(reader.str(), "");

  writer.close();
  EXPECT_EQ(reader.contents(), "");
  EXPECT_TRUE(reader.eof());
}

TEST(FdStream, AdoptClosedFdThrows) { EXPECT_THROW(FdStream{BaseFd()}, std::invalid_argument); }

}  // namespace urikit

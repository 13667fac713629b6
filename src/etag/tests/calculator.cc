#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "crypto/hash.h"
#include "crypto/hash_list.h"
#include "crypto/hex.h"
#include "crypto/md5.h"
#include "etag/calculator.h"
#include "etag/file_access_error.h"

namespace s3etag {
namespace etag {
namespace tests {

namespace {
constexpr char EMPTY_MD5[] = "d41d8cd98f00b204e9800998ecf8427e";

class TempFile {
 public:
  explicit TempFile(const std::vector<uint8_t> &content) {
    char name[] = "/tmp/" PACKAGE_NAME ".test-XXXXXX";
    int fd = mkstemp(name);
    if (fd == -1) throw std::runtime_error("failed to create temp file");

    path_ = name;

    size_t written = 0;
    while (written < content.size()) {
      ssize_t r = write(fd, content.data() + written, content.size() - written);
      if (r <= 0) {
        close(fd);
        throw std::runtime_error("failed to write temp file");
      }
      written += r;
    }

    close(fd);
  }

  ~TempFile() { unlink(path_.c_str()); }

  inline const std::string &path() const { return path_; }

 private:
  std::string path_;
};

std::vector<uint8_t> MakeContent(size_t size) {
  std::vector<uint8_t> content(size);
  for (size_t i = 0; i < size; i++) content[i] = i % 251;
  return content;
}

std::string PlainMd5(const std::vector<uint8_t> &content) {
  return crypto::Hash::Compute<crypto::Md5, crypto::Hex>(content);
}

std::string ExpectedMultipart(const std::vector<uint8_t> &content,
                              size_t chunk_size) {
  crypto::HashList<crypto::Md5> parts;

  for (size_t offset = 0; offset < content.size(); offset += chunk_size)
    parts.AddPart(content.data() + offset,
                  std::min(chunk_size, content.size() - offset));

  return parts.GetRootHash<crypto::Hex>() + "-" +
         std::to_string(parts.part_count());
}

std::string ComputeFor(const std::vector<uint8_t> &content,
                       uint64_t threshold, uint64_t chunk_size) {
  TempFile file(content);
  return Calculator(threshold, chunk_size).Compute(file.path());
}

// returns the read end of a pipe holding content, with the write end closed.
// content must fit in the pipe buffer.
int FilledPipe(const std::vector<uint8_t> &content) {
  int fds[2];
  if (pipe(fds) == -1) throw std::runtime_error("failed to create pipe");

  const ssize_t r = write(fds[1], content.data(), content.size());
  close(fds[1]);

  if (r != static_cast<ssize_t>(content.size())) {
    close(fds[0]);
    throw std::runtime_error("failed to fill pipe");
  }

  return fds[0];
}

int NextFreeDescriptor() {
  int fd = open("/dev/null", O_RDONLY);
  close(fd);
  return fd;
}
}  // namespace

TEST(Calculator, ZeroChunkSize) {
  EXPECT_THROW(Calculator(1024, 0), std::invalid_argument);
}

TEST(Calculator, EmptyFile) {
  EXPECT_EQ(EMPTY_MD5, ComputeFor({}, 8 * 1024 * 1024, 8 * 1024 * 1024));
  EXPECT_EQ(EMPTY_MD5, ComputeFor({}, 0, 1024));
}

TEST(Calculator, SinglePartIsPlainMd5) {
  const auto content = MakeContent(5000);
  const std::string etag = ComputeFor(content, 8 * 1024, 1024);

  EXPECT_EQ(PlainMd5(content), etag);
  EXPECT_TRUE(crypto::Md5::IsValidHexHash(etag));
}

TEST(Calculator, ThresholdIsInclusive) {
  const auto content = MakeContent(1024);
  EXPECT_EQ(PlainMd5(content), ComputeFor(content, 1024, 1024));
}

TEST(Calculator, OneByteOverThreshold) {
  const auto content = MakeContent(1025);
  const std::string etag = ComputeFor(content, 1024, 1024);

  EXPECT_EQ("770cf8ae816c05e0069a21e4682f50fa-2", etag);
  EXPECT_EQ(ExpectedMultipart(content, 1024), etag);
}

TEST(Calculator, MultipartKnownAnswer) {
  EXPECT_EQ("9254b71e2a4e1cb28c4dd1b5b6fd1eb4-4",
            ComputeFor(MakeContent(3 * 1024 + 17), 1024, 1024));

  EXPECT_EQ("c645324613b439f40a4ef3555830e4e6-4",
            ComputeFor(std::vector<uint8_t>(200000, 'a'), 64 * 1024,
                       64 * 1024));
}

TEST(Calculator, PartCountIsCeiling) {
  constexpr size_t CHUNK_SIZE = 1000;
  constexpr size_t SIZES[] = {1001, 1999, 2000, 2001, 9999, 10000};

  for (const size_t size : SIZES) {
    const auto content = MakeContent(size);
    const std::string etag = ComputeFor(content, CHUNK_SIZE, CHUNK_SIZE);
    const std::string suffix =
        "-" + std::to_string((size + CHUNK_SIZE - 1) / CHUNK_SIZE);

    EXPECT_EQ(ExpectedMultipart(content, CHUNK_SIZE), etag)
        << "with size = " << size;
    ASSERT_GT(etag.size(), suffix.size());
    EXPECT_EQ(suffix, etag.substr(etag.size() - suffix.size()))
        << "with size = " << size;
  }
}

TEST(Calculator, ThresholdAndChunkSizeAreIndependent) {
  const auto content = MakeContent(10 * 1024);

  EXPECT_EQ(ExpectedMultipart(content, 4096), ComputeFor(content, 1024, 4096));
  EXPECT_EQ(ExpectedMultipart(content, 512), ComputeFor(content, 4096, 512));
}

TEST(Calculator, SingleChunkHasNoSuffix) {
  const auto content = MakeContent(3000);
  const std::string etag = ComputeFor(content, 1024, 4096);

  EXPECT_EQ(PlainMd5(content), etag);
  EXPECT_EQ(std::string::npos, etag.find('-'));
}

TEST(Calculator, Idempotent) {
  const auto content = MakeContent(7777);
  TempFile file(content);
  Calculator calculator(1024, 1024);

  const std::string first = calculator.Compute(file.path());
  EXPECT_EQ(first, calculator.Compute(file.path()));
  EXPECT_EQ(first, Calculator(1024, 1024).Compute(file.path()));
}

TEST(Calculator, ComputeFromDescriptor) {
  const auto content = MakeContent(4096 + 1);
  TempFile file(content);
  int fd = open(file.path().c_str(), O_RDONLY);
  ASSERT_NE(-1, fd);

  Calculator calculator(4096, 4096);
  EXPECT_EQ(ExpectedMultipart(content, 4096),
            calculator.Compute(fd, content.size()));

  // the size given selects the mode, the whole file is always read
  EXPECT_EQ(PlainMd5(content), calculator.Compute(fd, 0));

  close(fd);
}

TEST(Calculator, Pipe) {
  const auto content = MakeContent(5000);
  Calculator calculator(1024, 1024);

  // a pipe reports no size, so it's hashed in a single part
  const int single = FilledPipe(content);
  EXPECT_EQ("046b3239eaade30920069f171518d956",
            calculator.Compute("/dev/fd/" + std::to_string(single)));
  close(single);

  const int multi = FilledPipe(content);
  EXPECT_EQ(ExpectedMultipart(content, 1024),
            calculator.Compute(multi, content.size()));
  close(multi);
}

TEST(Calculator, MissingFile) {
  Calculator calculator(1024, 1024);
  const std::string path = "/tmp/this shouldn't be a file";

  try {
    calculator.Compute(path);
    FAIL() << "expected FileAccessError";
  } catch (const FileAccessError &e) {
    EXPECT_EQ(ENOENT, e.code().value());
    EXPECT_EQ(path, e.path());
    EXPECT_EQ("open", e.operation());
    EXPECT_EQ("[Errno " + std::to_string(ENOENT) +
                  "] No such file or directory: '" + path + "'",
              e.Describe());
  }
}

TEST(Calculator, ContinuesAfterFailure) {
  const auto content = MakeContent(100);
  TempFile file(content);
  Calculator calculator(1024, 1024);

  EXPECT_THROW(calculator.Compute("/tmp/this shouldn't be a file"),
               FileAccessError);
  EXPECT_EQ(PlainMd5(content), calculator.Compute(file.path()));
}

TEST(Calculator, ReadErrorClosesFile) {
  const int expected_fd = NextFreeDescriptor();
  ASSERT_NE(-1, expected_fd);

  // opening a directory works, reading it doesn't
  try {
    Calculator(1024, 1024).Compute("/tmp");
    FAIL() << "expected FileAccessError";
  } catch (const FileAccessError &e) {
    EXPECT_EQ(EISDIR, e.code().value());
    EXPECT_EQ("read", e.operation());
  }

  EXPECT_EQ(expected_fd, NextFreeDescriptor());
}

TEST(Calculator, FileAccessErrorIsSystemError) {
  EXPECT_THROW(Calculator(1024, 1024).Compute(""), std::system_error);
}

}  // namespace tests
}  // namespace etag
}  // namespace s3etag

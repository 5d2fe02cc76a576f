#include "splicenet/splice.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <string>
#include <string_view>

#include "splicenet/file.hpp"
#include "splicenet/pipe.hpp"
#include "splicenet/socket-ops.hpp"
#include "splicenet/temp-file.hpp"
#include "splicenet/test-util.hpp"

namespace splicenet {

TEST(Splice, FileToPipeToSocket) {
  test::ScopedTempDir dir;
  test::ScopedTempFile tmp(dir, "zero copy payload");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  Pipe pipe(Pipe::Create{});
  ASSERT_TRUE(pipe);
  auto pair = test::MakeTcpPair();

  const auto in = Splice(file.fd(), pipe.writeFd(), 1024, false);
  ASSERT_EQ(in, SpliceStatus::Progress(tmp.content().size()));

  const auto out = Splice(pipe.readFd(), pair.client.fd(), in.bytes, false);
  ASSERT_EQ(out, SpliceStatus::Progress(in.bytes));

  // End of file.
  EXPECT_EQ(Splice(file.fd(), pipe.writeFd(), 1024, false), SpliceStatus::Progress(0));

  ASSERT_TRUE(pair.client.shutdownWrite());
  EXPECT_EQ(test::ReadUntilEof(pair.server), tmp.content());
}

TEST(Splice, EmptyNonBlockingSocketWouldBlock) {
  Pipe pipe(Pipe::Create{});
  ASSERT_TRUE(pipe);
  auto pair = test::MakeTcpPair();
  EXPECT_EQ(Splice(pair.server.fd(), pipe.writeFd(), 1024, false), SpliceStatus::WouldBlock());
}

TEST(Splice, PipeOutOfBufferSlotsWouldBlockWhenNonBlocking) {
  Pipe pipe(Pipe::Create{});
  ASSERT_TRUE(pipe);
  const std::size_t capacity = pipe.capacity();
  ASSERT_GT(capacity, 0U);
  auto pair = test::MakeUnixPair();
  for (int segment = 0; segment < 64; ++segment) {
    ASSERT_FALSE(pair.client.writeAll(std::string_view("x")).ec);
  }

  // Every one byte segment takes a whole pipe buffer: the pipe is full after a few bytes.
  std::size_t buffered = 0;
  SpliceStatus status = SpliceStatus::Progress(0);
  for (int attempt = 0; attempt < 64; ++attempt) {
    status = Splice(pair.server.fd(), pipe.writeFd(), 1, false, true);
    if (status.kind != SpliceStatus::Kind::Progress) {
      break;
    }
    buffered += status.bytes;
  }
  EXPECT_EQ(status, SpliceStatus::WouldBlock());
  EXPECT_GT(buffered, 0U);
  EXPECT_LT(buffered, capacity);
}

TEST(Splice, SocketToPipeAfterPeerShutdownIsEof) {
  Pipe pipe(Pipe::Create{});
  ASSERT_TRUE(pipe);
  auto pair = test::MakeTcpPair();
  ASSERT_TRUE(pair.client.shutdownWrite());
  EXPECT_EQ(Splice(pair.server.fd(), pipe.writeFd(), 1024, false), SpliceStatus::Progress(0));
}

TEST(Splice, BadDescriptorIsFatal) {
  Pipe pipe(Pipe::Create{});
  ASSERT_TRUE(pipe);
  EXPECT_EQ(Splice(-1, pipe.writeFd(), 16, false), SpliceStatus::Fatal(EBADF));
}

TEST(Splice, WritingToResetPeerIsFatal) {
  IgnoreSigPipe();
  Pipe pipe(Pipe::Create{});
  ASSERT_TRUE(pipe);
  auto pair = test::MakeTcpPair();
  pair.server.close();
  ASSERT_EQ(::write(pipe.writeFd(), "abcd", 4), 4);

  // The first send may still succeed before the RST is received.
  SpliceStatus status = SpliceStatus::Progress(0);
  for (int attempt = 0; attempt < 100 && status.kind != SpliceStatus::Kind::Fatal; ++attempt) {
    if (status.kind == SpliceStatus::Kind::Progress && status.bytes != 0) {
      ASSERT_EQ(::write(pipe.writeFd(), "abcd", 4), 4);
    }
    status = Splice(pipe.readFd(), pair.client.fd(), 4, false);
    if (status.kind == SpliceStatus::Kind::Progress) {
      ::usleep(1000);
    }
  }
  ASSERT_EQ(status.kind, SpliceStatus::Kind::Fatal);
  EXPECT_TRUE(status.err == EPIPE || status.err == ECONNRESET) << status.err;
}

}  // namespace splicenet

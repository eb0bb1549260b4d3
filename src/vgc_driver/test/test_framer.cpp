#include <gtest/gtest.h>

#include "vgc_driver/framer.hpp"
#include "fake_transport.hpp"

using namespace vgc_driver;
using namespace vgc_driver::test;

class FramerTest : public ::testing::Test
{
protected:
  void SetUp() override { state_->open = true; }

  std::shared_ptr<FakeTransport::State> state_ = std::make_shared<FakeTransport::State>();
  FakeTransport transport_{state_};
  Framer framer_{transport_, std::chrono::milliseconds(50)};
};

TEST_F(FramerTest, ReadsUpToAndIncludingTerminator)
{
  reply(*state_, "PR1,7.5e-3\r\nleftover");
  EXPECT_EQ(framer_.read_line(), "PR1,7.5e-3\r\n");
  // Bytes after the terminator are still unread.
  EXPECT_EQ(framer_.read_line(), "leftover");
}

TEST_F(FramerTest, ReassemblesPartialDelivery)
{
  reply(*state_, "1,2.");
  reply(*state_, "5E");
  reply(*state_, "+02\r");
  reply(*state_, "\n");
  EXPECT_EQ(framer_.read_line(), "1,2.5E+02\r\n");
}

TEST_F(FramerTest, LoneCarriageReturnDoesNotEndLine)
{
  reply(*state_, "a\rb\r\n");
  EXPECT_EQ(framer_.read_line(), "a\rb\r\n");
}

TEST_F(FramerTest, StopsAtMaxBytes)
{
  reply(*state_, std::string(20, 'x'));
  EXPECT_EQ(framer_.read_line(kLineTerminator, 8), std::string(8, 'x'));
}

TEST_F(FramerTest, DefaultBoundIs4096)
{
  reply(*state_, std::string(5000, 'y'));
  EXPECT_EQ(framer_.read_line().size(), 4096u);
}

TEST_F(FramerTest, PeerCloseReturnsWhatArrived)
{
  reply(*state_, "abc");
  peer_close(*state_);
  EXPECT_EQ(framer_.read_line(), "abc");
}

TEST_F(FramerTest, SilenceIsTimeout)
{
  EXPECT_THROW(framer_.read_line(), Timeout);
}

TEST_F(FramerTest, IoErrorIsConnectionFault)
{
  reply(*state_, "ab");
  fault(*state_);
  EXPECT_THROW(framer_.read_line(), ConnectionFault);
}

TEST_F(FramerTest, ClosedTransportIsConnectionFault)
{
  state_->open = false;
  EXPECT_THROW(framer_.send("PR1\r\n"), ConnectionFault);
  EXPECT_THROW(framer_.read_line(), ConnectionFault);
  EXPECT_TRUE(state_->sent.empty());
}

TEST_F(FramerTest, SendWritesExactBytes)
{
  framer_.send(std::string(1, '\x05'));
  ASSERT_EQ(state_->sent.size(), 1u);
  EXPECT_EQ(state_->sent[0], "\x05");
}

#include "splicenet/signal-handler.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace splicenet {

class SignalHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override { SignalHandler::ResetStopRequest(); }

  void TearDown() override {
    SignalHandler::Disable();
    SignalHandler::ResetStopRequest();
  }
};

TEST_F(SignalHandlerTest, NoStopRequestInitially) {
  EXPECT_FALSE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::StopSignal(), 0);
}

TEST_F(SignalHandlerTest, SigTermRequestsStop) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::StopSignal(), SIGTERM);
}

TEST_F(SignalHandlerTest, SigIntRequestsStop) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGINT), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  SignalHandler::ResetStopRequest();
  EXPECT_FALSE(SignalHandler::IsStopRequested());
}

}  // namespace splicenet

#include <gtest/gtest.h>
#include <sstream>
#include "node/upload_state.hpp"

using namespace vault::node;
using State = UploadState::State;

class UploadStateTest : public ::testing::Test {
protected:
  UploadState state;
};

TEST_F(UploadStateTest, InitialState) {
  EXPECT_EQ(state.get_state(), State::AWAIT_METADATA);
  EXPECT_FALSE(state.is_terminal());
  EXPECT_EQ(state.get_state_string(), "AWAIT_METADATA");
}

TEST_F(UploadStateTest, HappyPathReachesCommitted) {
  EXPECT_TRUE(state.transition_to(State::STREAMING));
  EXPECT_TRUE(state.transition_to(State::FINALIZING));
  EXPECT_TRUE(state.transition_to(State::COMMITTED));
  EXPECT_TRUE(state.is_terminal());
}

TEST_F(UploadStateTest, PhasesCannotBeSkippedOrReversed) {
  EXPECT_FALSE(state.transition_to(State::FINALIZING));
  EXPECT_FALSE(state.transition_to(State::COMMITTED));

  ASSERT_TRUE(state.transition_to(State::STREAMING));
  EXPECT_FALSE(state.transition_to(State::AWAIT_METADATA));
  EXPECT_FALSE(state.transition_to(State::COMMITTED));
  EXPECT_EQ(state.get_state(), State::STREAMING);
}

TEST_F(UploadStateTest, EveryLivePhaseCanFailOrCancel) {
  for (State live : {State::AWAIT_METADATA, State::STREAMING, State::FINALIZING}) {
    EXPECT_TRUE(UploadState::is_valid_transition(live, State::FAILED));
    EXPECT_TRUE(UploadState::is_valid_transition(live, State::CANCELLED));
  }
}

TEST_F(UploadStateTest, TerminalStatesAreFinal) {
  for (State terminal : {State::COMMITTED, State::FAILED, State::CANCELLED}) {
    for (State next : {State::AWAIT_METADATA, State::STREAMING, State::FINALIZING,
                       State::COMMITTED, State::FAILED, State::CANCELLED}) {
      EXPECT_FALSE(UploadState::is_valid_transition(terminal, next))
        << terminal << " -> " << next;
    }
  }
}

TEST_F(UploadStateTest, StreamsStateName) {
  std::ostringstream os;
  os << State::CANCELLED;
  EXPECT_EQ(os.str(), "CANCELLED");
}

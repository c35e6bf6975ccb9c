#include <gtest/gtest.h>
#include <sstream>
#include "transfer/transfer_state.hpp"

using namespace bxfer::transfer;

class TransferStateTest : public ::testing::Test {
protected:
    TransferState state;
};

// Test initial state
TEST_F(TransferStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), TransferState::State::INITIATED);
    EXPECT_EQ(state.get_state_string(), "INITIATED");
    EXPECT_FALSE(state.is_terminal());
}

// Test the successful lifecycle
TEST_F(TransferStateTest, SuccessfulLifecycle) {
    EXPECT_TRUE(state.transition_to(TransferState::State::AUTHENTICATING));
    EXPECT_TRUE(state.transition_to(TransferState::State::TRANSFERRING));
    EXPECT_TRUE(state.transition_to(TransferState::State::VERIFYING));
    EXPECT_TRUE(state.transition_to(TransferState::State::COMPLETED));
    EXPECT_EQ(state.get_state(), TransferState::State::COMPLETED);
    EXPECT_TRUE(state.is_terminal());
}

// Test invalid state transitions
TEST_F(TransferStateTest, InvalidTransitions) {
    // Can't skip authentication
    EXPECT_FALSE(state.transition_to(TransferState::State::TRANSFERRING));
    EXPECT_FALSE(state.transition_to(TransferState::State::COMPLETED));
    EXPECT_EQ(state.get_state(), TransferState::State::INITIATED);

    EXPECT_TRUE(state.transition_to(TransferState::State::AUTHENTICATING));
    // Can't go back
    EXPECT_FALSE(state.transition_to(TransferState::State::INITIATED));
    // Can't complete without verification
    EXPECT_TRUE(state.transition_to(TransferState::State::TRANSFERRING));
    EXPECT_FALSE(state.transition_to(TransferState::State::COMPLETED));
    EXPECT_EQ(state.get_state(), TransferState::State::TRANSFERRING);
}

// Every non-terminal state may fail or be cancelled
TEST_F(TransferStateTest, FailureAndCancellationFromAnyActiveState) {
    const TransferState::State active[] = {
        TransferState::State::INITIATED,
        TransferState::State::AUTHENTICATING,
        TransferState::State::TRANSFERRING,
        TransferState::State::VERIFYING
    };
    for (auto from : active) {
        EXPECT_TRUE(TransferState::is_valid_transition(from, TransferState::State::FAILED)) << from;
        EXPECT_TRUE(TransferState::is_valid_transition(from, TransferState::State::CANCELLED)) << from;
    }
}

// Terminal states accept no transitions
TEST_F(TransferStateTest, TerminalStatesAreFinal) {
    EXPECT_TRUE(state.transition_to(TransferState::State::CANCELLED));
    EXPECT_TRUE(state.is_terminal());
    EXPECT_FALSE(state.transition_to(TransferState::State::AUTHENTICATING));
    EXPECT_FALSE(state.transition_to(TransferState::State::FAILED));
    EXPECT_EQ(state.get_state(), TransferState::State::CANCELLED);

    EXPECT_FALSE(TransferState::is_valid_transition(TransferState::State::COMPLETED,
                                                    TransferState::State::FAILED));
    EXPECT_FALSE(TransferState::is_valid_transition(TransferState::State::FAILED,
                                                    TransferState::State::TRANSFERRING));
}

TEST_F(TransferStateTest, StreamOperator) {
    std::ostringstream os;
    os << TransferState::State::VERIFYING;
    EXPECT_EQ(os.str(), "VERIFYING");
}

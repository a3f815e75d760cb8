/**
 * @file ReplicationStateTest.cpp
 * @brief Unit tests for ReplicationState
 */

#include <gtest/gtest.h>
#include "application/ReplicationState.hpp"

using namespace copytrader;
using namespace copytrader::application;
using domain::EngineState;

TEST(ReplicationStateTest, InitialState_IsStopped) {
    ReplicationState state;

    EXPECT_EQ(state.current(), EngineState::STOPPED);
    EXPECT_FALSE(state.gatePassed());
}

TEST(ReplicationStateTest, Replicating_RequiresPassedGate) {
    ReplicationState state;
    state.transition({EngineState::STOPPED}, EngineState::CONNECTED);

    EXPECT_THROW(state.transition({EngineState::CONNECTED}, EngineState::REPLICATING),
                 domain::EngineStateException);
    EXPECT_EQ(state.current(), EngineState::CONNECTED);

    state.passGate();
    state.transition({EngineState::CONNECTED}, EngineState::REPLICATING);
    EXPECT_EQ(state.current(), EngineState::REPLICATING);
}

TEST(ReplicationStateTest, Transition_FromDisallowedState_Throws) {
    ReplicationState state;

    EXPECT_THROW(state.transition({EngineState::CONNECTED}, EngineState::STOPPED),
                 domain::EngineStateException);
}

TEST(ReplicationStateTest, PassGate_OutsideConnected_Throws) {
    ReplicationState state;

    EXPECT_THROW(state.passGate(), domain::EngineStateException);
}

TEST(ReplicationStateTest, Reconnect_RearmsGate) {
    ReplicationState state;
    state.transition({EngineState::STOPPED}, EngineState::CONNECTED);
    state.passGate();
    state.transition({EngineState::CONNECTED}, EngineState::REPLICATING);
    state.transition({EngineState::REPLICATING}, EngineState::STOPPED);

    state.transition({EngineState::STOPPED}, EngineState::CONNECTED);

    EXPECT_FALSE(state.gatePassed());
}

TEST(ReplicationStateTest, RequireState_Mismatch_ThrowsWith409) {
    ReplicationState state;

    try {
        state.requireState(EngineState::REPLICATING);
        FAIL() << "Expected EngineStateException";
    } catch (const domain::EngineStateException& e) {
        EXPECT_EQ(e.code(), 409);
    }
}

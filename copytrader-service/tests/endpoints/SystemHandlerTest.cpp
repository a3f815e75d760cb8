/**
 * @file SystemHandlerTest.cpp
 * @brief Unit-тесты для SystemHandler и HealthHandler
 *
 * GET /api/v1/status, POST /api/v1/connect | replication/start | stop | restart
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/SystemHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace copytrader;
using namespace copytrader::adapters::primary;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Mocks
// ============================================================================

class MockEngineControl : public ports::input::IEngineControl
{
public:
    MOCK_METHOD(void, connect, (), (override));
    MOCK_METHOD(void, startReplication, (), (override));
    MOCK_METHOD(void, skipReconciliation, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, restart, (), (override));
    MOCK_METHOD(domain::EngineState, state, (), (const, override));
    MOCK_METHOD(domain::EngineSnapshot, snapshot, (), (const, override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class SystemHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        engine_ = std::make_shared<MockEngineControl>();
        handler_ = std::make_unique<SystemHandler>(engine_);
    }

    SimpleRequest createRequest(const std::string& method, const std::string& path)
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        return req;
    }

    std::shared_ptr<MockEngineControl> engine_;
    std::unique_ptr<SystemHandler> handler_;
};

// ============================================================================
// GET /api/v1/status
// ============================================================================

TEST_F(SystemHandlerTest, Status_ReturnsSnapshot)
{
    domain::EngineSnapshot snapshot;
    snapshot.state = domain::EngineState::CONNECTED;
    snapshot.reconciliationPending = true;
    snapshot.accounts.push_back({"master", "U100", true, true, true});
    snapshot.queuedActions["f2"] = 3;
    EXPECT_CALL(*engine_, snapshot()).WillOnce(Return(snapshot));

    auto req = createRequest("GET", "/api/v1/status");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["state"], "CONNECTED");
    EXPECT_EQ(json["reconciliation_pending"], true);
    EXPECT_EQ(json["accounts"][0]["account_id"], "U100");
    EXPECT_EQ(json["queued_actions"]["f2"], 3);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(SystemHandlerTest, Connect_ReturnsNewState)
{
    EXPECT_CALL(*engine_, connect()).Times(1);
    EXPECT_CALL(*engine_, state()).WillOnce(Return(domain::EngineState::CONNECTED));

    auto req = createRequest("POST", "/api/v1/connect");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["state"], "CONNECTED");
}

TEST_F(SystemHandlerTest, Connect_MasterUnreachable_Returns500)
{
    EXPECT_CALL(*engine_, connect())
        .WillOnce(Throw(domain::BrokerException(domain::BrokerErrorKind::CONNECTIVITY, "master down")));

    auto req = createRequest("POST", "/api/v1/connect");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

TEST_F(SystemHandlerTest, StartReplication_GateNotPassed_Returns409)
{
    EXPECT_CALL(*engine_, startReplication())
        .WillOnce(Throw(domain::EngineStateException("Reconciliation gate not passed")));

    auto req = createRequest("POST", "/api/v1/replication/start");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_NE(json["error"].get<std::string>().find("gate"), std::string::npos);
}

TEST_F(SystemHandlerTest, Stop_ReturnsStopped)
{
    EXPECT_CALL(*engine_, stop()).Times(1);
    EXPECT_CALL(*engine_, state()).WillOnce(Return(domain::EngineState::STOPPED));

    auto req = createRequest("POST", "/api/v1/stop");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["state"], "STOPPED");
}

TEST_F(SystemHandlerTest, Restart_CallsRestart)
{
    EXPECT_CALL(*engine_, restart()).Times(1);
    EXPECT_CALL(*engine_, state()).WillOnce(Return(domain::EngineState::CONNECTED));

    auto req = createRequest("POST", "/api/v1/restart");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(SystemHandlerTest, UnknownRoute_Returns404)
{
    auto req = createRequest("GET", "/api/v1/connect");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

// ============================================================================
// GET /health
// ============================================================================

TEST(HealthHandlerTest, ReturnsOkWithEngineState)
{
    auto engine = std::make_shared<MockEngineControl>();
    EXPECT_CALL(*engine, state()).WillOnce(Return(domain::EngineState::REPLICATING));
    HealthHandler handler(engine);

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "ok");
    EXPECT_EQ(json["service"], "copytrader-service");
    EXPECT_EQ(json["engine"], "REPLICATING");
}

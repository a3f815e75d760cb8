/**
 * @file QueueHandlerTest.cpp
 * @brief Unit-тесты для QueueHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/QueueHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace copytrader;
using namespace copytrader::adapters::primary;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Mocks
// ============================================================================

class MockActionQueueService : public ports::input::IActionQueueService
{
public:
    MOCK_METHOD(std::vector<domain::QueuedAction>, pendingActions, (const std::string&), (const, override));
    MOCK_METHOD(ports::input::ReplayResult, replay, (const std::string&, const std::vector<std::string>&), (override));
    MOCK_METHOD(size_t, discard, (const std::string&, const std::vector<std::string>&), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class QueueHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service_ = std::make_shared<MockActionQueueService>();
        handler_ = std::make_unique<QueueHandler>(service_);
    }

    SimpleRequest createRequest(const std::string& method, const std::string& path,
                                const std::string& body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        if (!body.empty()) {
            req.setBody(body);
            req.setHeader("Content-Type", "application/json");
        }
        return req;
    }

    std::shared_ptr<MockActionQueueService> service_;
    std::unique_ptr<QueueHandler> handler_;
};

// ============================================================================
// GET /api/v1/queue/{followerId}
// ============================================================================

TEST_F(QueueHandlerTest, Pending_ReturnsActions)
{
    domain::QueuedAction action;
    action.id = "qa-1";
    action.followerId = "f2";
    action.type = domain::QueuedActionType::REPLACE;
    action.masterOrderId = "m-7";
    action.symbol = "AAPL";
    action.newQuantity = 300;
    action.reason = "Follower unreachable";

    EXPECT_CALL(*service_, pendingActions("f2")).WillOnce(Return(std::vector<domain::QueuedAction>{action}));

    auto req = createRequest("GET", "/api/v1/queue/f2");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["id"], "qa-1");
    EXPECT_EQ(json[0]["type"], "REPLACE");
    EXPECT_EQ(json[0]["new_quantity"], 300);
    EXPECT_FALSE(json[0].contains("new_price"));
}

// ============================================================================
// POST /api/v1/queue/{followerId}/replay
// ============================================================================

TEST_F(QueueHandlerTest, Replay_SelectedIds)
{
    ports::input::ReplayResult result;
    result.replayed = 1;
    result.skipped = 1;
    EXPECT_CALL(*service_, replay("f2", ElementsAre("qa-1", "qa-2"))).WillOnce(Return(result));

    auto req = createRequest("POST", "/api/v1/queue/f2/replay", R"({"action_ids": ["qa-1", "qa-2"]})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["replayed"], 1);
    EXPECT_EQ(json["skipped"], 1);
}

TEST_F(QueueHandlerTest, Replay_NoBody_ReplaysAll)
{
    EXPECT_CALL(*service_, replay("f2", IsEmpty())).WillOnce(Return(ports::input::ReplayResult{}));

    auto req = createRequest("POST", "/api/v1/queue/f2/replay");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(QueueHandlerTest, Replay_FollowerStillUnreachable_Returns409)
{
    EXPECT_CALL(*service_, replay("f2", _))
        .WillOnce(Throw(domain::EngineStateException("Follower f2 is not connected")));

    auto req = createRequest("POST", "/api/v1/queue/f2/replay");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
}

TEST_F(QueueHandlerTest, Replay_UnknownFollower_Returns404)
{
    EXPECT_CALL(*service_, replay("ghost", _))
        .WillOnce(Throw(domain::NotFoundException("Unknown follower: ghost")));

    auto req = createRequest("POST", "/api/v1/queue/ghost/replay");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

// ============================================================================
// POST /api/v1/queue/{followerId}/discard
// ============================================================================

TEST_F(QueueHandlerTest, Discard_ReturnsCount)
{
    EXPECT_CALL(*service_, discard("f2", ElementsAre("qa-3"))).WillOnce(Return(1u));

    auto req = createRequest("POST", "/api/v1/queue/f2/discard", R"({"action_ids": ["qa-3"]})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["discarded"], 1);
}

TEST_F(QueueHandlerTest, UnknownRoute_Returns404)
{
    auto req = createRequest("DELETE", "/api/v1/queue/f2");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

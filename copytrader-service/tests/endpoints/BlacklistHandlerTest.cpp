/**
 * @file BlacklistHandlerTest.cpp
 * @brief Unit-тесты для BlacklistHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/BlacklistHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace copytrader;
using namespace copytrader::adapters::primary;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Mocks
// ============================================================================

class MockBlacklistService : public ports::input::IBlacklistService
{
public:
    MOCK_METHOD(bool, isBlacklisted, (const std::string&, const std::string&), (const, override));
    MOCK_METHOD(bool, add, (const std::string&, const std::string&, domain::BlacklistReason), (override));
    MOCK_METHOD(bool, remove, (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::vector<domain::BlacklistEntry>, list, (const std::string&), (const, override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class BlacklistHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service_ = std::make_shared<MockBlacklistService>();
        handler_ = std::make_unique<BlacklistHandler>(service_);
    }

    SimpleRequest createRequest(const std::string& method, const std::string& body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath("/api/v1/blacklist");
        if (!body.empty()) {
            req.setBody(body);
            req.setHeader("Content-Type", "application/json");
        }
        return req;
    }

    std::shared_ptr<MockBlacklistService> service_;
    std::unique_ptr<BlacklistHandler> handler_;
};

// ============================================================================
// GET
// ============================================================================

TEST_F(BlacklistHandlerTest, List_ReturnsEntries)
{
    domain::BlacklistEntry entry;
    entry.followerId = "f1";
    entry.symbol = "TSLA";
    entry.reason = domain::BlacklistReason::LOCATE_REJECTED;

    EXPECT_CALL(*service_, list("f1")).WillOnce(Return(std::vector<domain::BlacklistEntry>{entry}));

    auto req = createRequest("GET");
    req.setQueryParam("follower_id", "f1");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["symbol"], "TSLA");
    EXPECT_EQ(json[0]["reason"], "LOCATE_REJECTED");
}

// ============================================================================
// POST
// ============================================================================

TEST_F(BlacklistHandlerTest, Add_NewEntry_Returns201)
{
    EXPECT_CALL(*service_, add("f1", "tsla", domain::BlacklistReason::MANUAL)).WillOnce(Return(true));

    auto req = createRequest("POST", R"({"follower_id": "f1", "symbol": "tsla"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["symbol"], "TSLA");
    EXPECT_EQ(json["added"], true);
}

TEST_F(BlacklistHandlerTest, Add_AlreadyPresent_Returns200)
{
    EXPECT_CALL(*service_, add("f1", "TSLA", _)).WillOnce(Return(false));

    auto req = createRequest("POST", R"({"follower_id": "f1", "symbol": "TSLA"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["added"], false);
}

TEST_F(BlacklistHandlerTest, Add_MissingSymbol_Returns400)
{
    EXPECT_CALL(*service_, add(_, _, _)).Times(0);

    auto req = createRequest("POST", R"({"follower_id": "f1"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(BlacklistHandlerTest, Add_UnknownFollower_Returns404)
{
    EXPECT_CALL(*service_, add("ghost", "TSLA", _))
        .WillOnce(Throw(domain::NotFoundException("Unknown follower: ghost")));

    auto req = createRequest("POST", R"({"follower_id": "ghost", "symbol": "TSLA"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

// ============================================================================
// DELETE
// ============================================================================

TEST_F(BlacklistHandlerTest, Remove_Success_Returns200)
{
    EXPECT_CALL(*service_, remove("f1", "TSLA")).WillOnce(Return(true));

    auto req = createRequest("DELETE");
    req.setQueryParam("follower_id", "f1");
    req.setQueryParam("symbol", "TSLA");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(BlacklistHandlerTest, Remove_NotBlacklisted_Returns404)
{
    EXPECT_CALL(*service_, remove("f1", "AAPL")).WillOnce(Return(false));

    auto req = createRequest("DELETE");
    req.setQueryParam("follower_id", "f1");
    req.setQueryParam("symbol", "AAPL");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

/**
 * @file AuditHandlerTest.cpp
 * @brief Unit-тесты для AuditHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/AuditHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <map>

using namespace copytrader;
using namespace copytrader::adapters::primary;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Mocks
// ============================================================================

class MockAuditLogService : public ports::input::IAuditLogService
{
public:
    MOCK_METHOD(std::vector<domain::AuditEntry>, recent, (size_t, const std::string&), (const, override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class AuditHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service_ = std::make_shared<MockAuditLogService>();
        handler_ = std::make_unique<AuditHandler>(service_);
    }

    SimpleRequest createRequest(const std::string& method, const std::string& path,
                                const std::map<std::string, std::string>& query = {})
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        for (const auto& [key, value] : query) {
            req.setQueryParam(key, value);
        }
        return req;
    }

    std::shared_ptr<MockAuditLogService> service_;
    std::unique_ptr<AuditHandler> handler_;
};

// ============================================================================
// GET /api/v1/audit
// ============================================================================

TEST_F(AuditHandlerTest, Get_DefaultLimit_ReturnsEntries)
{
    domain::AuditEntry entry;
    entry.id = 7;
    entry.level = domain::AuditLevel::ERROR;
    entry.category = domain::audit::ORDER;
    entry.followerId = "f1";
    entry.symbol = "AAPL";
    entry.message = "Failed to replicate AAPL order to f1: rejected";

    EXPECT_CALL(*service_, recent(100u, "")).WillOnce(Return(std::vector<domain::AuditEntry>{entry}));

    auto req = createRequest("GET", "/api/v1/audit");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["id"], 7);
    EXPECT_EQ(body[0]["level"], "ERROR");
    EXPECT_EQ(body[0]["category"], "order");
    EXPECT_EQ(body[0]["follower_id"], "f1");
}

TEST_F(AuditHandlerTest, Get_LimitAndCategory_PassedToService)
{
    domain::AuditEntry entry;
    entry.category = domain::audit::SYSTEM;
    entry.message = "Replication engine started";

    EXPECT_CALL(*service_, recent(5u, "system")).WillOnce(Return(std::vector<domain::AuditEntry>{entry}));

    auto req = createRequest("GET", "/api/v1/audit", {{"limit", "5"}, {"category", "system"}});
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    ASSERT_EQ(body.size(), 1u);
    EXPECT_TRUE(body[0]["follower_id"].is_null());
    EXPECT_TRUE(body[0]["symbol"].is_null());
}

TEST_F(AuditHandlerTest, Get_InvalidLimit_Returns400)
{
    EXPECT_CALL(*service_, recent(_, _)).Times(0);

    for (const std::string limit : {"abc", "0", "1001"}) {
        auto req = createRequest("GET", "/api/v1/audit", {{"limit", limit}});
        SimpleResponse res;
        handler_->handle(req, res);
        EXPECT_EQ(res.getStatus(), 400) << "limit=" << limit;
    }
}

TEST_F(AuditHandlerTest, Get_ServiceThrows_Returns500)
{
    EXPECT_CALL(*service_, recent(_, _)).WillOnce(Throw(std::runtime_error("db down")));

    auto req = createRequest("GET", "/api/v1/audit");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

TEST_F(AuditHandlerTest, Post_Returns405)
{
    auto req = createRequest("POST", "/api/v1/audit");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

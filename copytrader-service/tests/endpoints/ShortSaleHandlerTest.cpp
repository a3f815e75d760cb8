/**
 * @file ShortSaleHandlerTest.cpp
 * @brief Unit-тесты для ShortSaleHandler
 *
 * GET /api/v1/short-sales[?all=true], DELETE /api/v1/short-sales/{id}
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/ShortSaleHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace copytrader;
using namespace copytrader::adapters::primary;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockShortSaleService : public ports::input::IShortSaleService
{
public:
    MOCK_METHOD(bool, cancelTask, (const std::string&), (override));
    MOCK_METHOD(std::vector<domain::ShortSaleTask>, activeTasks, (), (const, override));
    MOCK_METHOD(std::vector<domain::ShortSaleTask>, allTasks, (), (const, override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class ShortSaleHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service_ = std::make_shared<MockShortSaleService>();
        handler_ = std::make_unique<ShortSaleHandler>(service_);
    }

    SimpleRequest createRequest(const std::string& method,
                                const std::string& path,
                                const std::string& pathPattern = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        if (!pathPattern.empty()) {
            req.setPathPattern(pathPattern);
        }
        return req;
    }

    domain::ShortSaleTask makeTask(const std::string& id, domain::ShortSaleStatus status)
    {
        domain::ShortSaleTask task;
        task.id = id;
        task.followerId = "f1";
        task.symbol = "TSLA";
        task.masterOrderId = "m-1";
        task.requiredQuantity = 600;
        task.locateDeficit = 600;
        task.status = status;
        return task;
    }

    std::shared_ptr<MockShortSaleService> service_;
    std::unique_ptr<ShortSaleHandler> handler_;
};

// ============================================================================
// GET
// ============================================================================

TEST_F(ShortSaleHandlerTest, List_ReturnsActiveTasks)
{
    EXPECT_CALL(*service_, activeTasks())
        .WillOnce(Return(std::vector<domain::ShortSaleTask>{makeTask("t-1", domain::ShortSaleStatus::LOCATING)}));
    EXPECT_CALL(*service_, allTasks()).Times(0);

    auto req = createRequest("GET", "/api/v1/short-sales");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["id"], "t-1");
    EXPECT_EQ(json[0]["status"], "LOCATING");
    EXPECT_EQ(json[0]["required_qty"], 600);
    EXPECT_TRUE(json[0]["error"].is_null());
}

TEST_F(ShortSaleHandlerTest, List_AllIncludesTerminal)
{
    auto failed = makeTask("t-2", domain::ShortSaleStatus::FAILED);
    failed.error = "Locate rejected";

    EXPECT_CALL(*service_, allTasks())
        .WillOnce(Return(std::vector<domain::ShortSaleTask>{failed}));
    EXPECT_CALL(*service_, activeTasks()).Times(0);

    auto req = createRequest("GET", "/api/v1/short-sales");
    req.setQueryParam("all", "true");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json[0]["status"], "FAILED");
    EXPECT_EQ(json[0]["error"], "Locate rejected");
}

// ============================================================================
// DELETE
// ============================================================================

TEST_F(ShortSaleHandlerTest, Cancel_Success_Returns200)
{
    EXPECT_CALL(*service_, cancelTask("t-1")).WillOnce(Return(true));

    auto req = createRequest("DELETE", "/api/v1/short-sales/t-1", "/api/v1/short-sales/*");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["task_id"], "t-1");
}

TEST_F(ShortSaleHandlerTest, Cancel_TerminalTask_Returns404)
{
    EXPECT_CALL(*service_, cancelTask("t-9")).WillOnce(Return(false));

    auto req = createRequest("DELETE", "/api/v1/short-sales/t-9", "/api/v1/short-sales/*");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(ShortSaleHandlerTest, Cancel_MissingId_Returns400)
{
    EXPECT_CALL(*service_, cancelTask(_)).Times(0);

    auto req = createRequest("DELETE", "/api/v1/short-sales/");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(ShortSaleHandlerTest, WrongMethod_Returns405)
{
    auto req = createRequest("POST", "/api/v1/short-sales");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

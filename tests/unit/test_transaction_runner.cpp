#include <gtest/gtest.h>
#include "duet/engine/transaction_runner.hpp"
#include "mocks/mock_backend_client.hpp"

#include <memory>
#include <stdexcept>

using namespace duet;
using namespace duet::engine;
using namespace duet::testing;

class TransactionRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<MockBackendClient>(BackendKind::Secondary, "sql-mock");
        client->seed("tools", {{"id", "t1"}, {"name", "Hammer"}});
    }

    TransactionRunner make() {
        return TransactionRunner(client, [this]() { ++commits_observed; });
    }

    std::shared_ptr<MockBackendClient> client;
    int commits_observed = 0;
};

TEST_F(TransactionRunnerTest, CommitsOnSuccess) {
    auto runner = make();

    auto result = runner.run([](backend::IRelationalClient& tx) -> Expected<int> {
        auto created = tx.insert("tools", {{"id", "t2"}, {"name", "Saw"}});
        if (!created) return tl::unexpected(created.error());
        return 42;
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(client->call_count("begin"), 1);
    EXPECT_EQ(client->call_count("commit"), 1);
    EXPECT_EQ(client->call_count("rollback"), 0);
    EXPECT_EQ(client->row_count("tools"), 2U);
    EXPECT_EQ(commits_observed, 1);
    EXPECT_FALSE(client->in_transaction());
}

TEST_F(TransactionRunnerTest, ErrorValueRollsBackAndIsReturnedUnchanged) {
    auto runner = make();

    auto result = runner.run([](backend::IRelationalClient& tx) -> Expected<int> {
        auto created = tx.insert("tools", {{"id", "t2"}, {"name", "Saw"}});
        if (!created) return tl::unexpected(created.error());
        return tl::unexpected(Error{ErrorCode::ValidationFailed, "business rule violated"});
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValidationFailed);
    EXPECT_EQ(result.error().message, "business rule violated");
    EXPECT_EQ(client->call_count("rollback"), 1);
    EXPECT_EQ(client->call_count("commit"), 0);
    EXPECT_EQ(client->row_count("tools"), 1U);
    EXPECT_EQ(commits_observed, 0);
}

TEST_F(TransactionRunnerTest, ExceptionRollsBackAndPropagates) {
    auto runner = make();

    EXPECT_THROW(runner.run([](backend::IRelationalClient& tx) -> Expected<int> {
        auto created = tx.insert("tools", {{"id", "t2"}, {"name", "Saw"}});
        if (!created) return tl::unexpected(created.error());
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_EQ(client->call_count("rollback"), 1);
    EXPECT_EQ(client->row_count("tools"), 1U);
    EXPECT_EQ(commits_observed, 0);
}

TEST_F(TransactionRunnerTest, BeginFailureSkipsBody) {
    auto runner = make();
    client->fail_next("begin", ErrorCode::TransactionBeginFailed);
    bool body_ran = false;

    auto result = runner.run([&body_ran](backend::IRelationalClient&) -> Expected<int> {
        body_ran = true;
        return 1;
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TransactionBeginFailed);
    EXPECT_EQ(result.error().operation, "withTransaction");
    EXPECT_FALSE(body_ran);
    EXPECT_EQ(client->call_count("rollback"), 0);
}

TEST_F(TransactionRunnerTest, CommitFailureRollsBack) {
    auto runner = make();
    client->fail_next("commit", ErrorCode::TransactionCommitFailed);

    auto result = runner.run([](backend::IRelationalClient& tx) -> Expected<int> {
        auto created = tx.insert("tools", {{"id", "t2"}, {"name", "Saw"}});
        if (!created) return tl::unexpected(created.error());
        return 1;
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TransactionCommitFailed);
    EXPECT_EQ(client->call_count("rollback"), 1);
    EXPECT_EQ(client->row_count("tools"), 1U);
    EXPECT_EQ(commits_observed, 0);
}

TEST_F(TransactionRunnerTest, RollbackFailureKeepsOriginalError) {
    auto runner = make();
    client->fail_next("rollback", ErrorCode::BackendUnavailable);

    auto result = runner.run([](backend::IRelationalClient&) -> Expected<int> {
        return tl::unexpected(Error{ErrorCode::NotFound, "no such tool"});
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(client->call_count("rollback"), 1);
}

TEST_F(TransactionRunnerTest, VoidBodies) {
    auto runner = make();

    auto result = runner.run([](backend::IRelationalClient& tx) -> Expected<void> {
        auto removed = tx.remove("tools", "t1");
        if (!removed) return tl::unexpected(removed.error());
        return {};
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(client->row_count("tools"), 0U);
}

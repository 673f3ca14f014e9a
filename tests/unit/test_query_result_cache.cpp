#include <gtest/gtest.h>

#include "duet/engine/query_result_cache.hpp"
#include "mocks/mock_backend_client.hpp"
#include "mocks/mock_query_origin.hpp"

#include <chrono>
#include <memory>

using namespace duet;
using namespace duet::engine;
using namespace duet::testing;

namespace {

const std::string kToolsQuery = "query Tools($category: String) { tools(category: $category) { id name } }";

} // namespace

class QueryResultCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MockBackendClient>(BackendKind::Secondary, "sql-mock");
        origin = std::make_shared<MockQueryOrigin>();
        origin->response = {{"tools", nlohmann::json::array({{{"id", "t1"}, {"name", "Hammer"}}})}};
        semantic = std::make_shared<MockSemanticStore>();
        now = std::make_shared<std::chrono::system_clock::time_point>(
            std::chrono::system_clock::time_point(std::chrono::hours(480000)));

        auto clock = now;
        cache = std::make_unique<QueryResultCache>(
            store, origin, semantic, QueryCacheConfig{},
            [clock]() { return *clock; });
        ASSERT_TRUE(cache->initialize().has_value());
    }

    void advance(std::chrono::milliseconds by) {
        *now += by;
    }

    std::shared_ptr<MockBackendClient> store;
    std::shared_ptr<MockQueryOrigin> origin;
    std::shared_ptr<MockSemanticStore> semantic;
    std::shared_ptr<std::chrono::system_clock::time_point> now;
    std::unique_ptr<QueryResultCache> cache;
};

TEST_F(QueryResultCacheTest, InitializeRegistersCacheTable) {
    const auto tables = store->registered_tables();
    ASSERT_EQ(tables.size(), 1U);
    EXPECT_EQ(tables[0], "gql_cache");
}

TEST_F(QueryResultCacheTest, MissCallsOriginAndStoresRow) {
    const nlohmann::json vars = {{"category", "hardware"}};
    auto result = cache->execute(kToolsQuery, vars);

    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.from_cache);
    EXPECT_EQ(result.data, origin->response);
    EXPECT_EQ(result.variables, vars);
    EXPECT_EQ(origin->call_count, 1);
    EXPECT_EQ(cache->origin_requests(), 1U);

    EXPECT_EQ(store->call_count("upsert"), 1);
    EXPECT_EQ(store->row_count("gql_cache"), 1U);
    auto row = store->get("gql_cache", query_content_hash(kToolsQuery, vars));
    ASSERT_TRUE(row.has_value());
    ASSERT_TRUE(row->has_value());
    EXPECT_EQ((**row)["query"], kToolsQuery);
    EXPECT_EQ((**row)["response"], origin->response);
    EXPECT_EQ((**row)["created_at"].get<long long>(),
              std::chrono::duration_cast<std::chrono::milliseconds>(now->time_since_epoch()).count());

    ASSERT_EQ(semantic->stored.size(), 1U);
    EXPECT_EQ(semantic->stored[0], origin->response.dump());
}

TEST_F(QueryResultCacheTest, HitWithinTtlSkipsOrigin) {
    ASSERT_TRUE(cache->execute(kToolsQuery).success);
    advance(std::chrono::minutes(59));

    auto result = cache->execute(kToolsQuery);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.from_cache);
    EXPECT_EQ(result.data, origin->response);
    EXPECT_EQ(origin->call_count, 1);
    EXPECT_EQ(semantic->stored.size(), 1U);
}

TEST_F(QueryResultCacheTest, RowExpiresAtTtl) {
    ASSERT_TRUE(cache->execute(kToolsQuery).success);
    advance(std::chrono::minutes(60));

    auto result = cache->execute(kToolsQuery);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.from_cache);
    EXPECT_EQ(origin->call_count, 2);
    EXPECT_EQ(store->row_count("gql_cache"), 1U);
}

TEST_F(QueryResultCacheTest, UseCacheFalseBypassesReadAndWrite) {
    auto result = cache->execute(kToolsQuery, nlohmann::json::object(), false);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(store->call_count("get"), 0);
    EXPECT_EQ(store->call_count("upsert"), 0);
    EXPECT_TRUE(semantic->stored.empty());

    ASSERT_TRUE(cache->execute(kToolsQuery, nlohmann::json::object(), false).success);
    EXPECT_EQ(origin->call_count, 2);
}

TEST_F(QueryResultCacheTest, OriginFailureIsReturnedAsValue) {
    origin->should_fail = true;
    origin->error_message = "upstream 502";

    auto result = cache->execute(kToolsQuery);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "upstream 502");
    EXPECT_EQ(store->call_count("upsert"), 0);

    const auto json = result.to_json();
    EXPECT_EQ(json["success"], false);
    EXPECT_EQ(json["error"], "upstream 502");
}

TEST_F(QueryResultCacheTest, EmptyQueryIsRejected) {
    auto result = cache->execute("");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(origin->call_count, 0);
}

TEST_F(QueryResultCacheTest, StoreFailuresDegradeToMisses) {
    store->fail_with("get", ErrorCode::BackendUnavailable);
    store->fail_with("upsert", ErrorCode::BackendUnavailable);

    auto first = cache->execute(kToolsQuery);
    ASSERT_TRUE(first.success);
    auto second = cache->execute(kToolsQuery);
    ASSERT_TRUE(second.success);
    EXPECT_FALSE(second.from_cache);
    EXPECT_EQ(origin->call_count, 2);
}

TEST_F(QueryResultCacheTest, SemanticFailureDoesNotFailCall) {
    semantic->should_fail = true;
    auto result = cache->execute(kToolsQuery);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(store->row_count("gql_cache"), 1U);
}

TEST_F(QueryResultCacheTest, CancellationAfterResponseSkipsWrites) {
    const CallContext ctx = CallContext::cancellable();
    origin->on_response = [ctx]() { ctx.cancel(); };

    auto result = cache->execute(kToolsQuery, nlohmann::json::object(), true, ctx);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, origin->response);
    EXPECT_EQ(semantic->call_count, 0);
    EXPECT_TRUE(semantic->stored.empty());
    EXPECT_EQ(store->row_count("gql_cache"), 0U);
}

TEST_F(QueryResultCacheTest, ExpiredDeadlineSkipsSemanticWrite) {
    CallContext ctx;
    ctx.deadline = std::chrono::steady_clock::now() + std::chrono::hours(1);
    origin->on_response = [&ctx]() { ctx.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1); };

    auto result = cache->execute(kToolsQuery, nlohmann::json::object(), true, ctx);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(semantic->call_count, 0);
}

TEST_F(QueryResultCacheTest, MalformedRowIsAMiss) {
    const std::string id = query_content_hash(kToolsQuery, nlohmann::json::object());
    store->seed("gql_cache", {{"id", id}, {"query", kToolsQuery}, {"response", {{"stale", true}}}, {"created_at", "yesterday"}});

    auto result = cache->execute(kToolsQuery);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.from_cache);
    EXPECT_EQ(result.data, origin->response);
}

TEST_F(QueryResultCacheTest, VariablesAreCanonicalized) {
    nlohmann::json a = nlohmann::json::object();
    a["category"] = "hardware";
    a["limit"] = 5;
    nlohmann::json b = nlohmann::json::object();
    b["limit"] = 5;
    b["category"] = "hardware";

    EXPECT_EQ(query_content_hash(kToolsQuery, a), query_content_hash(kToolsQuery, b));
    EXPECT_NE(query_content_hash(kToolsQuery, a), query_content_hash(kToolsQuery, {{"category", "art"}}));
    EXPECT_EQ(query_content_hash(kToolsQuery, nullptr), query_content_hash(kToolsQuery, nlohmann::json::object()));
    EXPECT_EQ(query_content_hash(kToolsQuery, a).size(), 64U);

    ASSERT_TRUE(cache->execute(kToolsQuery, a).success);
    auto hit = cache->execute(kToolsQuery, b);
    EXPECT_TRUE(hit.from_cache);
    auto other = cache->execute(kToolsQuery, {{"category", "art"}});
    EXPECT_FALSE(other.from_cache);
    EXPECT_EQ(origin->call_count, 2);
}

TEST_F(QueryResultCacheTest, SuccessJsonShape) {
    auto result = cache->execute(kToolsQuery, {{"category", "hardware"}});
    const auto json = result.to_json();
    EXPECT_EQ(json["success"], true);
    EXPECT_EQ(json["query"], kToolsQuery);
    EXPECT_EQ(json["variables"]["category"], "hardware");
    EXPECT_EQ(json["data"], origin->response);
    EXPECT_FALSE(json.contains("error"));
}

TEST(QueryContentHashTest, KnownDigest) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

#include <gtest/gtest.h>

#include "duet/origin/graphql_origin.hpp"

using namespace duet;
using namespace duet::origin;

TEST(GraphQLOriginTest, CreateRejectsEmptyEndpoint) {
    auto origin = GraphQLOrigin::create(GraphQLOriginConfig{});
    ASSERT_FALSE(origin.has_value());
    EXPECT_EQ(origin.error().code, ErrorCode::InvalidConfig);
}

TEST(GraphQLOriginTest, CancelledContextSkipsRequest) {
    auto origin = GraphQLOrigin::create(GraphQLOriginConfig{"http://127.0.0.1:1/graphql", std::nullopt});
    ASSERT_TRUE(origin.has_value());

    auto ctx = CallContext::cancellable();
    ctx.cancel();
    auto result = (*origin)->execute("{ tools { id } }", nlohmann::json::object(), ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
}

TEST(GraphQLOriginTest, UnreachableEndpointIsOriginFailure) {
    GraphQLOriginConfig config;
    config.endpoint_url = "http://127.0.0.1:1/graphql";
    config.api_key = "test-key";
    config.default_timeout = std::chrono::milliseconds(2000);
    auto origin = GraphQLOrigin::create(config);
    ASSERT_TRUE(origin.has_value());
    ASSERT_TRUE((*origin)->config().api_key.has_value());
    EXPECT_EQ(*(*origin)->config().api_key, "test-key");

    auto result = (*origin)->execute("{ tools { id } }", nlohmann::json::object());
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().code == ErrorCode::OriginRequestFailed ||
                result.error().code == ErrorCode::RequestTimeout);
}

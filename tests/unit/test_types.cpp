#include <gtest/gtest.h>
#include "duet/types.hpp"

#include <thread>

using namespace duet;

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, Construction) {
    Error err(ErrorCode::InvalidConfig, "Test error");
    EXPECT_EQ(err.code, ErrorCode::InvalidConfig);
    EXPECT_EQ(err.message, "Test error");
    EXPECT_FALSE(err.context.has_value());
    EXPECT_FALSE(err.backend.has_value());
    EXPECT_TRUE(err.operation.empty());

    Error err_with_context(ErrorCode::NotFound, "Missing", "tools:t9");
    ASSERT_TRUE(err_with_context.context.has_value());
    EXPECT_EQ(*err_with_context.context, "tools:t9");
}

TEST(ErrorTest, ToStringIncludesAnnotations) {
    Error err(ErrorCode::BackendUnavailable, "Connection refused", "document.json");
    err.with_backend(BackendKind::Primary).with_operation("getAll");

    const std::string str = err.to_string();
    EXPECT_NE(str.find("200"), std::string::npos);
    EXPECT_NE(str.find("Connection refused"), std::string::npos);
    EXPECT_NE(str.find("getAll"), std::string::npos);
    EXPECT_NE(str.find("primary"), std::string::npos);
    EXPECT_NE(str.find("document.json"), std::string::npos);
}

TEST(ErrorTest, OnlyConnectionClassIsRecoverable) {
    EXPECT_TRUE(Error(ErrorCode::BackendUnavailable, "").recoverable());
    EXPECT_TRUE(Error(ErrorCode::BackendNotConfigured, "").recoverable());

    EXPECT_FALSE(Error(ErrorCode::ValidationFailed, "").recoverable());
    EXPECT_FALSE(Error(ErrorCode::NotFound, "").recoverable());
    EXPECT_FALSE(Error(ErrorCode::OperationRejected, "").recoverable());
    EXPECT_FALSE(Error(ErrorCode::UnsupportedOperator, "").recoverable());
    EXPECT_FALSE(Error(ErrorCode::RequestCancelled, "").recoverable());
    EXPECT_FALSE(Error(ErrorCode::RequestTimeout, "").recoverable());
    EXPECT_FALSE(Error(ErrorCode::TransactionCommitFailed, "").recoverable());
}

TEST(ErrorTest, Classification) {
    EXPECT_EQ(classify(ErrorCode::TableNotRegistered), ErrorClass::Configuration);
    EXPECT_EQ(classify(ErrorCode::ToolNotFound), ErrorClass::NotFound);
    EXPECT_EQ(classify(ErrorCode::RequestTimeout), ErrorClass::Cancelled);
    EXPECT_EQ(classify(ErrorCode::OriginResponseInvalid), ErrorClass::Origin);
    EXPECT_STREQ(error_class_to_string(ErrorClass::Connection), "connection");
}

TEST(BackendKindTest, ToStringAndOther) {
    EXPECT_STREQ(backend_to_string(BackendKind::Primary), "primary");
    EXPECT_STREQ(backend_to_string(BackendKind::Secondary), "secondary");
    EXPECT_EQ(other_backend(BackendKind::Primary), BackendKind::Secondary);
    EXPECT_EQ(other_backend(BackendKind::Secondary), BackendKind::Primary);
}

TEST(RecordIdTest, IdToString) {
    EXPECT_EQ(id_to_string("abc"), "abc");
    EXPECT_EQ(id_to_string(42), "42");
    EXPECT_EQ(id_to_string(nullptr), "");
}

// ============================================================================
// CallContext Tests
// ============================================================================

TEST(CallContextTest, DefaultNeverFires) {
    CallContext ctx;
    EXPECT_FALSE(ctx.is_cancelled());
    EXPECT_FALSE(ctx.expired());
    EXPECT_FALSE(ctx.remaining().has_value());
    EXPECT_TRUE(ctx.check().has_value());
}

TEST(CallContextTest, CancelIsSharedAcrossCopies) {
    auto ctx = CallContext::cancellable();
    CallContext copy = ctx;
    copy.cancel();

    EXPECT_TRUE(ctx.is_cancelled());
    auto result = ctx.check();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
}

TEST(CallContextTest, DeadlineExpires) {
    auto ctx = CallContext::with_timeout(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_TRUE(ctx.expired());
    EXPECT_EQ(ctx.remaining()->count(), 0);
    auto result = ctx.check();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestTimeout);
}

TEST(CallContextTest, ZeroTimeoutMeansNoDeadline) {
    auto ctx = CallContext::with_timeout(std::chrono::milliseconds(0));
    EXPECT_FALSE(ctx.deadline.has_value());
}

// ============================================================================
// Operator Tests
// ============================================================================

TEST(OperatorTest, RoundTripsEveryName) {
    for (const char* name : {"eq", "neq", "gt", "gte", "lt", "lte", "like", "ilike", "in", "is",
                             "contains", "containedBy", "overlaps", "textSearch", "rangeGt",
                             "rangeLt", "rangeGte", "rangeLte", "rangeAdjacent"}) {
        auto op = operator_from_string(name);
        ASSERT_TRUE(op.has_value()) << name;
        EXPECT_STREQ(operator_to_string(*op), name);
    }
    EXPECT_FALSE(operator_from_string("between").has_value());
}

// ============================================================================
// QueryOptions Tests
// ============================================================================

TEST(QueryOptionsTest, SearchBecomesTextSearchFilter) {
    QueryOptions options;
    options.filters.push_back({"category", Operator::Eq, "hardware"});
    options.search = SearchSpec{"name", "saw"};

    auto filters = options.effective_filters();
    ASSERT_EQ(filters.size(), 2U);
    EXPECT_EQ(filters[1].op, Operator::TextSearch);
    EXPECT_EQ(filters[1].column, "name");
    EXPECT_EQ(filters[1].value, "saw");
}

TEST(QueryOptionsTest, RejectsPageAndCursorTogether) {
    QueryOptions options;
    options.pagination = Pagination{1, 10, std::string("t1")};

    auto result = options.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValidationFailed);
}

TEST(QueryOptionsTest, RejectsNonPositivePage) {
    QueryOptions options;
    options.pagination = Pagination{0, 10, std::nullopt};
    EXPECT_FALSE(options.validate().has_value());

    options.pagination = Pagination{1, 0, std::nullopt};
    EXPECT_FALSE(options.validate().has_value());
}

TEST(QueryOptionsTest, ToJsonDistinguishesQueries) {
    QueryOptions a;
    a.filters.push_back({"category", Operator::Eq, "hardware"});
    QueryOptions b;
    b.filters.push_back({"category", Operator::Eq, "art"});

    EXPECT_NE(a.to_json().dump(), b.to_json().dump());
    EXPECT_EQ(a.to_json().dump(), a.to_json().dump());
    EXPECT_EQ(QueryOptions{}.to_json().dump(), "{}");
}

TEST(QueryOptionsTest, FromJsonInvertsToJson) {
    QueryOptions options;
    options.filters.push_back({"rating", Operator::Gte, 4});
    options.pagination = Pagination{2, 5, std::nullopt};
    options.sort.push_back({"name", false});
    options.select = {"id", "name"};
    options.include.push_back(IncludeSpec{"reviews", "tool_id", "id", {"body"}});
    options.search = SearchSpec{"name", "ham"};
    options.count = true;

    auto parsed = QueryOptions::from_json(options.to_json());
    ASSERT_TRUE(parsed.has_value()) << parsed.error().to_string();
    EXPECT_EQ(parsed->to_json(), options.to_json());
}

TEST(QueryOptionsTest, FromJsonRejectsUnknownOperator) {
    auto parsed = QueryOptions::from_json(nlohmann::json::parse(
        R"({"filters":[{"column":"name","op":"between","value":1}]})"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::UnsupportedOperator);
}

TEST(QueryOptionsTest, FromJsonRejectsMalformedShapes) {
    EXPECT_FALSE(QueryOptions::from_json(nlohmann::json::array()).has_value());

    auto parsed = QueryOptions::from_json(nlohmann::json::parse(R"({"filters":[{"op":"eq"}]})"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::ValidationFailed);
}

TEST(FallbackEventTest, ErrorClass) {
    FallbackEvent event{"getAll", BackendKind::Primary, BackendKind::Secondary,
                        ErrorCode::BackendUnavailable, "down", std::chrono::system_clock::now()};
    EXPECT_EQ(event.error_class(), ErrorClass::Connection);
}

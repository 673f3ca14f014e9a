#include <gtest/gtest.h>

#include "duet/backend/document_backend.hpp"
#include "fixtures/sample_records.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace duet;
using namespace duet::backend;
using namespace duet::testing::fixtures;

namespace {

std::filesystem::path make_temp_store_path(const std::string& prefix) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           (prefix + "_" + std::to_string(now) + ".json");
}

} // namespace

class DocumentBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = DocumentBackend::open(DocumentBackend::kMemoryPath);
        ASSERT_TRUE(opened.has_value());
        store = *opened;
        ASSERT_TRUE(store->register_table(tools_table()).has_value());
        ASSERT_TRUE(store->register_table(reviews_table()).has_value());
        for (const auto& row : sample_tools()) {
            ASSERT_TRUE(store->insert("tools", row).has_value());
        }
        for (const auto& row : sample_reviews()) {
            ASSERT_TRUE(store->insert("reviews", row).has_value());
        }
    }

    std::shared_ptr<DocumentBackend> store;
};

TEST_F(DocumentBackendTest, DeclaresPrimaryKind) {
    EXPECT_EQ(store->kind(), BackendKind::Primary);
    EXPECT_EQ(store->name(), "document");
    EXPECT_EQ(DocumentBackend::key_for("tools", "t1"), "table:tools:t1");
}

TEST_F(DocumentBackendTest, OpenRejectsEmptyPath) {
    auto opened = DocumentBackend::open("");
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().code, ErrorCode::InvalidConfig);
}

TEST_F(DocumentBackendTest, GetReturnsRowOrNothing) {
    auto found = store->get("tools", "t2");
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found->has_value());
    EXPECT_EQ((**found)["name"], "Screwdriver");

    auto missing = store->get("tools", "nope");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->has_value());
}

TEST_F(DocumentBackendTest, InsertGeneratesUuidForTextKeys) {
    auto created = store->insert("tools", {{"name", "Chisel"}});
    ASSERT_TRUE(created.has_value());
    ASSERT_TRUE((*created)["id"].is_string());
    const std::string id = (*created)["id"];
    EXPECT_EQ(id.size(), 36U);
    EXPECT_EQ(id[8], '-');

    auto fetched = store->get("tools", id);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_TRUE(fetched->has_value());
}

TEST_F(DocumentBackendTest, InsertCountsUpForIntegerKeys) {
    ASSERT_TRUE(store->register_table(counters_table()).has_value());
    auto first = store->insert("counters", {{"label", "a"}});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)["id"], 1);

    ASSERT_TRUE(store->insert("counters", {{"id", 10}, {"label", "b"}}).has_value());
    auto next = store->insert("counters", {{"label", "c"}});
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)["id"], 11);

    auto fetched = store->get("counters", "11");
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(fetched->has_value());
    EXPECT_EQ((**fetched)["label"], "c");
}

TEST_F(DocumentBackendTest, CompositeKeys) {
    ASSERT_TRUE(store->register_table(favorites_table()).has_value());
    ASSERT_TRUE(store->insert("favorites", {{"user_id", "u1"}, {"tool_id", "t1"}, {"note", "best"}}).has_value());

    auto fetched = store->get("favorites", "u1:t1");
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(fetched->has_value());
    EXPECT_EQ((**fetched)["note"], "best");

    auto partial = store->insert("favorites", {{"user_id", "u2"}});
    ASSERT_FALSE(partial.has_value());
    EXPECT_EQ(partial.error().code, ErrorCode::ValidationFailed);
}

TEST_F(DocumentBackendTest, DuplicateKeyIsRejected) {
    auto duplicate = store->insert("tools", {{"id", "t1"}, {"name", "Other"}});
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ErrorCode::OperationRejected);
    EXPECT_EQ(duplicate.error().backend, BackendKind::Primary);
}

TEST_F(DocumentBackendTest, UpdateMergesFields) {
    auto updated = store->update("tools", "t1", {{"rating", 4.0}, {"owner", "shop"}});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ((*updated)["name"], "Hammer");
    EXPECT_EQ((*updated)["rating"], 4.0);
    EXPECT_EQ((*updated)["owner"], "shop");

    auto fetched = store->get("tools", "t1");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ((**fetched)["owner"], "shop");
}

TEST_F(DocumentBackendTest, UpdateErrors) {
    auto missing = store->update("tools", "t9", {{"name", "x"}});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto rekey = store->update("tools", "t1", {{"id", "t100"}});
    ASSERT_FALSE(rekey.has_value());
    EXPECT_EQ(rekey.error().code, ErrorCode::ValidationFailed);

    auto scalar = store->update("tools", "t1", 5);
    ASSERT_FALSE(scalar.has_value());
    EXPECT_EQ(scalar.error().code, ErrorCode::ValidationFailed);
}

TEST_F(DocumentBackendTest, UnregisteredTable) {
    auto result = store->get("owners", "o1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TableNotRegistered);
    EXPECT_FALSE(result.error().recoverable());
}

TEST_F(DocumentBackendTest, ListFiltersSortsAndIncludes) {
    QueryOptions options;
    options.filters.push_back(FilterCondition{"category", Operator::Eq, "hardware"});
    options.sort.push_back(SortSpec{"name", true});
    options.select = {"name"};
    options.include.push_back(IncludeSpec{"reviews", "tool_id", "id", {"stars"}});

    auto rows = store->list("tools", options);
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 3U);
    EXPECT_EQ((*rows)[0]["name"], "Hammer");
    EXPECT_EQ((*rows)[1]["name"], "Screwdriver");
    EXPECT_EQ((*rows)[2]["name"], "hand saw");
    EXPECT_FALSE((*rows)[0].contains("rating"));
    ASSERT_EQ((*rows)[0]["reviews"].size(), 2U);
    EXPECT_EQ((*rows)[0]["reviews"][0], nlohmann::json({{"stars", 5}}));
    EXPECT_TRUE((*rows)[1]["reviews"].empty());
}

TEST_F(DocumentBackendTest, ListPaginates) {
    QueryOptions options;
    options.pagination = Pagination{2, 2, std::nullopt};
    auto rows = store->list("tools", options);
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2U);
    EXPECT_EQ((*rows)[0]["id"], "t3");
}

TEST_F(DocumentBackendTest, CountIgnoresPagination) {
    QueryOptions options;
    options.filters.push_back(FilterCondition{"active", Operator::Is, true});
    options.pagination = Pagination{1, 1, std::nullopt};
    auto counted = store->count("tools", options);
    ASSERT_TRUE(counted.has_value());
    EXPECT_EQ(*counted, 3U);
}

TEST_F(DocumentBackendTest, RemoveAndRemoveMany) {
    auto removed = store->remove("tools", "t1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(*removed);

    auto again = store->remove("tools", "t1");
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(*again);

    auto many = store->remove_many("tools", {"t2", "t3", "t9"});
    ASSERT_TRUE(many.has_value());
    EXPECT_EQ(*many, 2U);

    auto left = store->count("tools", QueryOptions{});
    ASSERT_TRUE(left.has_value());
    EXPECT_EQ(*left, 1U);
}

TEST_F(DocumentBackendTest, RawCommands) {
    auto keys = store->raw_query("KEYS table:reviews:", {});
    ASSERT_TRUE(keys.has_value());
    ASSERT_EQ(keys->size(), 3U);
    EXPECT_EQ((*keys)[0]["key"], "table:reviews:r1");

    auto get = store->raw_query("GET tools t3", {});
    ASSERT_TRUE(get.has_value());
    ASSERT_EQ(get->size(), 1U);
    EXPECT_EQ((*get)[0]["name"], "Paint Brush");

    auto count = store->raw_query("COUNT tools", {});
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ((*count)[0]["count"], 4);

    auto unknown = store->raw_query("FLUSHALL", {});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::ValidationFailed);

    auto with_params = store->raw_query("COUNT tools", {1});
    EXPECT_FALSE(with_params.has_value());
}

TEST_F(DocumentBackendTest, CancelledContext) {
    auto ctx = CallContext::cancellable();
    ctx.cancel();
    auto result = store->list("tools", QueryOptions{}, ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
    EXPECT_EQ(result.error().backend, BackendKind::Primary);
}

TEST(DocumentBackendPersistenceTest, SnapshotSurvivesReopen) {
    const auto path = make_temp_store_path("duet_document_store");

    {
        auto opened = DocumentBackend::open(path.string());
        ASSERT_TRUE(opened.has_value());
        auto store = *opened;
        ASSERT_TRUE(store->register_table(tools_table()).has_value());
        ASSERT_TRUE(store->insert("tools", sample_tools()[0]).has_value());
        ASSERT_TRUE(store->insert("tools", sample_tools()[1]).has_value());
        ASSERT_TRUE(store->remove("tools", "t2").has_value());
    }
    EXPECT_TRUE(std::filesystem::exists(path));

    {
        auto reopened = DocumentBackend::open(path.string());
        ASSERT_TRUE(reopened.has_value());
        auto store = *reopened;
        ASSERT_TRUE(store->register_table(tools_table()).has_value());

        auto hammer = store->get("tools", "t1");
        ASSERT_TRUE(hammer.has_value());
        ASSERT_TRUE(hammer->has_value());
        EXPECT_EQ((**hammer)["tags"], nlohmann::json::array({"metal", "classic"}));

        auto gone = store->get("tools", "t2");
        ASSERT_TRUE(gone.has_value());
        EXPECT_FALSE(gone->has_value());
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(DocumentBackendPersistenceTest, CorruptSnapshotFailsToOpen) {
    const auto path = make_temp_store_path("duet_document_corrupt");
    {
        std::ofstream out(path);
        out << "{not json";
    }

    auto opened = DocumentBackend::open(path.string());
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().code, ErrorCode::BackendUnavailable);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

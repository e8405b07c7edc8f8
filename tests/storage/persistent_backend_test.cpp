// File: tests/storage/persistent_backend_test.cpp
#include "storage/persistent_backend.hpp"
#include "core/errors.hpp"
#include "inventory_test_fixtures.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>

namespace stocklens {
namespace {

using testing::MakeRecord;
using testing::TestToday;

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_persistent_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

void RemoveDb(const std::string& db_path) {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
}

class PersistentBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = GetTempDbPath();
        config_.db_path = db_path_;
    }

    void TearDown() override { RemoveDb(db_path_); }

    std::string db_path_;
    PersistentBackend::Config config_;
};

// ============================================================================
// Constructor and Configuration Tests
// ============================================================================

TEST_F(PersistentBackendTest, ConstructorCreatesDatabase) {
    {
        PersistentBackend backend(config_);
        EXPECT_TRUE(backend.GetAllItems().empty());
        EXPECT_EQ(0u, backend.EdgeCount());
    }

    EXPECT_TRUE(std::filesystem::exists(db_path_));
}

TEST_F(PersistentBackendTest, ConfigWithoutWAL) {
    config_.enable_wal = false;
    config_.synchronous = "FULL";

    PersistentBackend backend(config_);
    EXPECT_TRUE(backend.AddCategory(CategoryRef{CategoryID(1), "PPE"}));
}

TEST(PersistentBackendOpenTest, UnopenablePathThrows) {
    PersistentBackend::Config config;
    config.db_path = "/nonexistent_dir_for_stocklens_tests/inventory.db";
    EXPECT_THROW(PersistentBackend backend(config), StorageError);
}

// ============================================================================
// Item Tests
// ============================================================================

TEST_F(PersistentBackendTest, ItemRoundTrip) {
    PersistentBackend backend(config_);
    testing::AddCategory(backend, 1, "PPE");
    testing::AddItem(backend, 1, "Gloves", 1, Decimal::Parse("40.25"), Decimal(50));
    testing::AddItem(backend, 2, "Sheets");

    auto gloves = backend.FindItem(ItemID(1));
    ASSERT_TRUE(gloves.has_value());
    EXPECT_EQ("Gloves", gloves->name);
    EXPECT_EQ(CategoryID(1), gloves->category_id);
    EXPECT_EQ("PPE", gloves->category_name);
    EXPECT_EQ(Decimal::Parse("40.25"), gloves->current_quantity);
    ASSERT_TRUE(gloves->reorder_level.has_value());
    EXPECT_EQ(Decimal(50), *gloves->reorder_level);

    auto sheets = backend.FindItem(ItemID(2));
    ASSERT_TRUE(sheets.has_value());
    EXPECT_FALSE(sheets->category_id.IsValid());
    EXPECT_FALSE(sheets->reorder_level.has_value());

    EXPECT_FALSE(backend.FindItem(ItemID(3)).has_value());
}

TEST_F(PersistentBackendTest, ItemQueries) {
    PersistentBackend backend(config_);
    testing::AddCategory(backend, 1, "PPE");
    testing::AddCategory(backend, 2, "Linen");
    testing::AddItem(backend, 3, "Gowns", 1);
    testing::AddItem(backend, 1, "Gloves", 1);
    testing::AddItem(backend, 2, "Sheets", 2);

    auto all = backend.GetAllItems();
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ(ItemID(1), all[0].id);
    EXPECT_EQ(ItemID(3), all[2].id);

    auto by_ids = backend.GetItemsByIds({ItemID(3), ItemID(3), ItemID(1), ItemID(7)});
    ASSERT_EQ(2u, by_ids.size());
    EXPECT_EQ(ItemID(1), by_ids[0].id);

    EXPECT_EQ(2u, backend.GetItemsByCategory(CategoryID(1)).size());
    EXPECT_EQ(2u, backend.GetAllCategories().size());
    EXPECT_FALSE(backend.FindCategory(CategoryID(3)).has_value());
}

TEST_F(PersistentBackendTest, ReAddingItemKeepsItsRecords) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Gloves");
    testing::SeedSeries(backend, ItemID(1), {1, 2, 3});

    testing::AddItem(backend, 1, "Nitrile Gloves", 0, Decimal(10));

    EXPECT_EQ("Nitrile Gloves", backend.FindItem(ItemID(1))->name);
    EXPECT_EQ(3u, backend.GetConsumptionRecords(ItemID(1), TestToday().AddDays(-5), TestToday()).size());
}

TEST_F(PersistentBackendTest, UpdateItemQuantity) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Gloves");

    EXPECT_TRUE(backend.UpdateItemQuantity(ItemID(1), Decimal::Parse("7.5")));
    EXPECT_EQ(Decimal::Parse("7.5"), backend.FindItem(ItemID(1))->current_quantity);
    EXPECT_FALSE(backend.UpdateItemQuantity(ItemID(2), Decimal(1)));
}

// ============================================================================
// Consumption Record Tests
// ============================================================================

TEST_F(PersistentBackendTest, RecordsKeepDecimalPrecision) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Saline");

    auto record = MakeRecord(ItemID(1), TestToday(), Decimal::Parse("0.1234567891"), Decimal(4));
    record.closing_stock = Decimal::Parse("99.5");
    EXPECT_TRUE(backend.AddConsumptionRecord(record));

    auto records = backend.GetConsumptionRecords(ItemID(1), TestToday(), TestToday());
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(Decimal::Parse("0.1234567891"), records[0].ConsumedOrZero());
    EXPECT_EQ(Decimal(4), records[0].received_quantity);
    EXPECT_FALSE(records[0].opening_stock.has_value());
    ASSERT_TRUE(records[0].closing_stock.has_value());
    EXPECT_EQ(Decimal::Parse("99.5"), *records[0].closing_stock);
}

TEST_F(PersistentBackendTest, AbsentConsumptionStaysAbsent) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Gloves");

    ConsumptionObservation record;
    record.item_id = ItemID(1);
    record.date = TestToday();
    backend.AddConsumptionRecord(record);

    auto records = backend.GetConsumptionRecords(ItemID(1), TestToday(), TestToday());
    ASSERT_EQ(1u, records.size());
    EXPECT_FALSE(records[0].consumed_quantity.has_value());
    EXPECT_TRUE(records[0].ConsumedOrZero().IsZero());
}

TEST_F(PersistentBackendTest, RecordsForUnknownItemsAreSkipped) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Gloves");

    EXPECT_FALSE(backend.AddConsumptionRecord(MakeRecord(ItemID(2), TestToday(), Decimal(1))));

    std::vector<ConsumptionObservation> batch = {
        MakeRecord(ItemID(1), TestToday(), Decimal(1)),
        MakeRecord(ItemID(2), TestToday(), Decimal(1)),
        MakeRecord(ItemID(1), TestToday().AddDays(-1), Decimal(2)),
    };
    EXPECT_EQ(2u, backend.AddConsumptionRecords(batch));
}

TEST_F(PersistentBackendTest, RecordsAreOrderedAndWindowed) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Gloves");
    testing::AddItem(backend, 2, "Masks");
    testing::SeedSeries(backend, ItemID(2), {5, 6, 7});
    testing::SeedSeries(backend, ItemID(1), {1, 2, 3, 4});

    Date end = TestToday();
    auto window = backend.GetConsumptionRecords(ItemID(1), end.AddDays(-2), end);
    ASSERT_EQ(3u, window.size());
    EXPECT_EQ(Decimal(2), window.front().ConsumedOrZero());
    EXPECT_EQ(end, window.back().date);

    auto all = backend.GetConsumptionRecords(end.AddDays(-1), end);
    ASSERT_EQ(4u, all.size());
    EXPECT_EQ(ItemID(1), all[0].item_id);
    EXPECT_LT(all[0].date, all[1].date);
    EXPECT_EQ(ItemID(2), all[2].item_id);
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST_F(PersistentBackendTest, StatisticsRoundTrip) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Gloves");

    ItemStatisticsSnapshot snapshot;
    snapshot.mean_daily_consumption = Decimal::Parse("11.6");
    snapshot.standard_deviation = Decimal::Parse("1.1402");
    snapshot.coefficient_of_variation = Decimal::Parse("0.0983");
    snapshot.volatility = VolatilityClass::VERY_LOW;
    snapshot.trend = TrendDirection::STABLE;
    snapshot.pattern = ConsumptionPattern::REGULAR;
    snapshot.forecast_next_period = Decimal(348);
    snapshot.coverage_days = 9;
    snapshot.expected_stockout_date = Date::FromYMD(2024, 4, 9);
    snapshot.last_updated = Timestamp::FromMicros(1711843200000000);

    EXPECT_TRUE(backend.SaveItemStatistics(ItemID(1), snapshot));

    auto stored = backend.GetItemStatistics(ItemID(1));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(snapshot.mean_daily_consumption, stored->mean_daily_consumption);
    EXPECT_EQ(snapshot.standard_deviation, stored->standard_deviation);
    EXPECT_EQ(snapshot.coefficient_of_variation, stored->coefficient_of_variation);
    EXPECT_EQ(VolatilityClass::VERY_LOW, stored->volatility);
    EXPECT_EQ(TrendDirection::STABLE, stored->trend);
    EXPECT_EQ(ConsumptionPattern::REGULAR, stored->pattern);
    EXPECT_EQ(Decimal(348), stored->forecast_next_period);
    EXPECT_EQ(9, stored->coverage_days);
    ASSERT_TRUE(stored->expected_stockout_date.has_value());
    EXPECT_EQ(Date::FromYMD(2024, 4, 9), *stored->expected_stockout_date);
    EXPECT_EQ(snapshot.last_updated, stored->last_updated);
}

TEST_F(PersistentBackendTest, StatisticsForUnknownItemAreRejected) {
    PersistentBackend backend(config_);
    EXPECT_FALSE(backend.SaveItemStatistics(ItemID(1), ItemStatisticsSnapshot{}));
    EXPECT_FALSE(backend.GetItemStatistics(ItemID(1)).has_value());
}

TEST_F(PersistentBackendTest, BatchStatisticsReplaceExisting) {
    PersistentBackend backend(config_);
    testing::AddItem(backend, 1, "Gloves");
    testing::AddItem(backend, 2, "Masks");

    ItemStatisticsSnapshot first;
    first.coverage_days = 3;
    ItemStatisticsSnapshot second;
    second.coverage_days = 8;

    EXPECT_EQ(2u, backend.SaveItemsStatistics({{ItemID(1), first}, {ItemID(2), first}, {ItemID(9), first}}));
    EXPECT_EQ(1u, backend.SaveItemsStatistics({{ItemID(1), second}}));

    EXPECT_EQ(8, backend.GetItemStatistics(ItemID(1))->coverage_days);
    EXPECT_EQ(3, backend.GetItemStatistics(ItemID(2))->coverage_days);
    EXPECT_EQ(0u, backend.SaveItemsStatistics({}));
}

// ============================================================================
// Correlation Edge Tests
// ============================================================================

TEST_F(PersistentBackendTest, EdgeRoundTrip) {
    PersistentBackend backend(config_);

    CorrelationEdge edge(ItemID(4), ItemID(2), Decimal::Parse("-0.8123"), 30);
    edge.SetCategory(CategoryID(5));
    edge.SetConfidenceLevel(Decimal(95));
    EXPECT_TRUE(backend.SaveEdge(edge));

    auto found = backend.FindEdge(ItemID(2), ItemID(4));
    ASSERT_TRUE(found.has_value());
    EXPECT_GT(found->GetID(), 0);
    EXPECT_EQ(ItemID(4), found->GetItem1());
    EXPECT_EQ(ItemID(2), found->GetItem2());
    EXPECT_EQ(Decimal::Parse("-0.8123"), found->GetCoefficient());
    EXPECT_EQ(CorrelationType::STRONG_NEGATIVE, found->GetType());
    EXPECT_EQ(30, found->GetDataPoints());
    EXPECT_EQ(Decimal(95), found->GetConfidenceLevel());
    EXPECT_EQ(CategoryID(5), found->GetCategory());
    EXPECT_EQ(edge.GetCreatedAt().ToMicros(), found->GetCreatedAt().ToMicros());
}

TEST_F(PersistentBackendTest, EdgeUpsertKeepsIdentity) {
    PersistentBackend backend(config_);

    backend.SaveEdge(CorrelationEdge(ItemID(1), ItemID(2), Decimal::Parse("0.5"), 10));
    auto original = backend.FindEdge(ItemID(1), ItemID(2));
    ASSERT_TRUE(original.has_value());

    CorrelationEdge reversed(ItemID(2), ItemID(1), Decimal::Parse("0.9"), 20);
    EXPECT_TRUE(backend.SaveEdge(reversed));
    EXPECT_EQ(1u, backend.EdgeCount());

    auto updated = backend.FindEdge(ItemID(1), ItemID(2));
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(original->GetID(), updated->GetID());
    EXPECT_EQ(ItemID(1), updated->GetItem1());
    EXPECT_EQ(original->GetCreatedAt(), updated->GetCreatedAt());
    EXPECT_EQ(Decimal::Parse("0.9"), updated->GetCoefficient());
    EXPECT_EQ(20, updated->GetDataPoints());
}

TEST_F(PersistentBackendTest, EdgeQueriesAndDeletion) {
    PersistentBackend backend(config_);

    backend.SaveEdge(CorrelationEdge(ItemID(1), ItemID(2), Decimal::Parse("0.5"), 10));
    backend.SaveEdge(CorrelationEdge(ItemID(3), ItemID(1), Decimal::Parse("0.4"), 10));
    CorrelationEdge inactive(ItemID(2), ItemID(3), Decimal::Parse("0.9"), 10);
    inactive.SetActive(false);
    backend.SaveEdge(inactive);

    EXPECT_FALSE(backend.SaveEdge(CorrelationEdge(ItemID(5), ItemID(5), Decimal(1), 10)));

    EXPECT_EQ(3u, backend.EdgeCount());
    EXPECT_EQ(2u, backend.GetActiveEdges().size());
    EXPECT_EQ(2u, backend.GetEdgesForItem(ItemID(1)).size());
    EXPECT_EQ(1u, backend.GetEdgesForItem(ItemID(3)).size());

    EXPECT_EQ(3u, backend.DeleteAllEdges());
    EXPECT_EQ(0u, backend.EdgeCount());
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST_F(PersistentBackendTest, DataSurvivesReopen) {
    {
        PersistentBackend backend(config_);
        testing::AddCategory(backend, 1, "PPE");
        testing::AddItem(backend, 1, "Gloves", 1);
        testing::AddItem(backend, 2, "Masks", 1);
        testing::SeedSeries(backend, ItemID(1), {10, 12, 11, 13, 12});
        backend.SaveEdge(CorrelationEdge(ItemID(1), ItemID(2), Decimal::Parse("0.75"), 5));
    }

    {
        PersistentBackend backend(config_);
        EXPECT_EQ(2u, backend.GetAllItems().size());
        EXPECT_EQ(5u, backend.GetConsumptionRecords(ItemID(1), TestToday().AddDays(-30), TestToday()).size());

        auto edge = backend.FindEdge(ItemID(2), ItemID(1));
        ASSERT_TRUE(edge.has_value());
        EXPECT_EQ(Decimal::Parse("0.75"), edge->GetCoefficient());
    }
}

} // namespace
} // namespace stocklens

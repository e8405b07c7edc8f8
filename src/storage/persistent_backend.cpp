// File: src/storage/persistent_backend.cpp
#include "storage/persistent_backend.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>

namespace stocklens {

namespace {

constexpr const char* kComponent = "PersistentBackend";

// Column layouts shared by the SELECT statements below
constexpr const char* kItemColumns =
    "SELECT i.id, i.name, i.category_id, COALESCE(c.name, ''), i.current_quantity, "
    "i.reorder_level, i.active FROM items i LEFT JOIN categories c ON c.id = i.category_id";

constexpr const char* kRecordColumns =
    "SELECT item_id, consumption_date, consumed_quantity, received_quantity, "
    "opening_stock, closing_stock FROM consumption_records";

constexpr const char* kEdgeColumns =
    "SELECT id, item1_id, item2_id, coefficient, data_points, confidence_level, "
    "category_id, active, created_at, last_calculated FROM item_correlations";

void BindDecimal(sqlite3_stmt* stmt, int index, const Decimal& value) {
    std::string text = value.ToString();
    sqlite3_bind_text(stmt, index, text.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalDecimal(sqlite3_stmt* stmt, int index, const std::optional<Decimal>& value) {
    if (value) {
        BindDecimal(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

Decimal ColumnDecimal(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return Decimal();
    }
    return Decimal::Parse(ColumnText(stmt, index));
}

std::optional<Decimal> ColumnOptionalDecimal(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return Decimal::Parse(ColumnText(stmt, index));
}

ItemRef ReadItem(sqlite3_stmt* stmt) {
    ItemRef item;
    item.id = ItemID(sqlite3_column_int64(stmt, 0));
    item.name = ColumnText(stmt, 1);
    if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
        item.category_id = CategoryID(sqlite3_column_int64(stmt, 2));
    }
    item.category_name = ColumnText(stmt, 3);
    item.current_quantity = ColumnDecimal(stmt, 4);
    item.reorder_level = ColumnOptionalDecimal(stmt, 5);
    item.active = sqlite3_column_int(stmt, 6) != 0;
    return item;
}

ConsumptionObservation ReadRecord(sqlite3_stmt* stmt) {
    ConsumptionObservation record;
    record.item_id = ItemID(sqlite3_column_int64(stmt, 0));
    record.date = Date::FromDays(sqlite3_column_int64(stmt, 1));
    record.consumed_quantity = ColumnOptionalDecimal(stmt, 2);
    record.received_quantity = ColumnDecimal(stmt, 3);
    record.opening_stock = ColumnOptionalDecimal(stmt, 4);
    record.closing_stock = ColumnOptionalDecimal(stmt, 5);
    return record;
}

CorrelationEdge ReadEdge(sqlite3_stmt* stmt) {
    CorrelationEdge edge(
        ItemID(sqlite3_column_int64(stmt, 1)),
        ItemID(sqlite3_column_int64(stmt, 2)),
        ColumnDecimal(stmt, 3),
        sqlite3_column_int(stmt, 4));
    edge.SetID(sqlite3_column_int64(stmt, 0));
    edge.SetConfidenceLevel(ColumnDecimal(stmt, 5));
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        edge.SetCategory(CategoryID(sqlite3_column_int64(stmt, 6)));
    }
    edge.SetActive(sqlite3_column_int(stmt, 7) != 0);
    edge.SetCreatedAt(Timestamp::FromMicros(sqlite3_column_int64(stmt, 8)));
    edge.SetLastCalculated(Timestamp::FromMicros(sqlite3_column_int64(stmt, 9)));
    return edge;
}

int64_t PairLow(ItemID a, ItemID b) {
    return static_cast<int64_t>(std::min(a, b).value());
}

int64_t PairHigh(ItemID a, ItemID b) {
    return static_cast<int64_t>(std::max(a, b).value());
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

PersistentBackend::PersistentBackend(const Config& config)
    : config_(config) {

    // Open SQLite database
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (...) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

PersistentBackend::~PersistentBackend() {
    if (db_) {
        // sqlite3_close_v2() defers the close until outstanding statements
        // are finalized and handles WAL checkpointing
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            LogWarn(kComponent, "Database did not close cleanly: " + config_.db_path);
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void PersistentBackend::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Busy timeout keeps concurrent connections from waiting forever (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA foreign_keys=ON;");

    CreateTables();
    CreateIndices();
}

void PersistentBackend::CreateTables() {
    const char* statements[] = {
        R"(
            CREATE TABLE IF NOT EXISTS categories (
                id INTEGER PRIMARY KEY,
                name TEXT NOT NULL
            );
        )",
        R"(
            CREATE TABLE IF NOT EXISTS items (
                id INTEGER PRIMARY KEY,
                name TEXT NOT NULL,
                category_id INTEGER,
                current_quantity TEXT NOT NULL,
                reorder_level TEXT,
                active INTEGER NOT NULL DEFAULT 1
            );
        )",
        R"(
            CREATE TABLE IF NOT EXISTS consumption_records (
                item_id INTEGER NOT NULL REFERENCES items(id) ON DELETE CASCADE,
                consumption_date INTEGER NOT NULL,
                consumed_quantity TEXT,
                received_quantity TEXT NOT NULL,
                opening_stock TEXT,
                closing_stock TEXT,
                PRIMARY KEY (item_id, consumption_date)
            );
        )",
        R"(
            CREATE TABLE IF NOT EXISTS item_statistics (
                item_id INTEGER PRIMARY KEY REFERENCES items(id) ON DELETE CASCADE,
                mean_daily_consumption TEXT NOT NULL,
                standard_deviation TEXT NOT NULL,
                coefficient_of_variation TEXT NOT NULL,
                volatility TEXT NOT NULL,
                trend TEXT NOT NULL,
                pattern TEXT NOT NULL,
                forecast_next_period TEXT NOT NULL,
                coverage_days INTEGER NOT NULL,
                expected_stockout_date INTEGER,
                last_updated INTEGER NOT NULL
            );
        )",
        R"(
            CREATE TABLE IF NOT EXISTS item_correlations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                item1_id INTEGER NOT NULL,
                item2_id INTEGER NOT NULL,
                pair_low INTEGER NOT NULL,
                pair_high INTEGER NOT NULL,
                coefficient TEXT NOT NULL,
                correlation_type TEXT NOT NULL,
                data_points INTEGER NOT NULL,
                confidence_level TEXT NOT NULL,
                category_id INTEGER,
                active INTEGER NOT NULL DEFAULT 1,
                created_at INTEGER NOT NULL,
                last_calculated INTEGER NOT NULL
            );
        )",
    };

    for (const char* sql : statements) {
        if (!ExecuteSQL(sql)) {
            throw StorageError(std::string("Failed to create schema: ") + sqlite3_errmsg(db_));
        }
    }
}

void PersistentBackend::CreateIndices() {
    // One edge per unordered pair
    if (!ExecuteSQL("CREATE UNIQUE INDEX IF NOT EXISTS idx_correlation_pair "
                    "ON item_correlations(pair_low, pair_high);")) {
        throw StorageError("Failed to create correlation pair index");
    }

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_consumption_date ON consumption_records(consumption_date);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_items_category ON items(category_id);");
}

bool PersistentBackend::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            LogError(kComponent, std::string("SQL error: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void PersistentBackend::BeginTransaction() {
    ExecuteSQL("BEGIN TRANSACTION;");
}

void PersistentBackend::CommitTransaction() {
    ExecuteSQL("COMMIT;");
}

void PersistentBackend::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

bool PersistentBackend::ItemExistsLocked(ItemID id) const {
    const char* sql = "SELECT 1 FROM items WHERE id = ? LIMIT 1;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(id.value()));
    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return exists;
}

// ============================================================================
// ConsumptionRepository
// ============================================================================

std::vector<ConsumptionObservation> PersistentBackend::GetConsumptionRecords(
    ItemID item, const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ConsumptionObservation> results;
    std::string sql = std::string(kRecordColumns) +
        " WHERE item_id = ? AND consumption_date BETWEEN ? AND ? ORDER BY consumption_date;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(item.value()));
    sqlite3_bind_int64(stmt, 2, start.DaysSinceEpoch());
    sqlite3_bind_int64(stmt, 3, end.DaysSinceEpoch());

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(ReadRecord(stmt));
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<ConsumptionObservation> PersistentBackend::GetConsumptionRecords(
    const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ConsumptionObservation> results;
    std::string sql = std::string(kRecordColumns) +
        " WHERE consumption_date BETWEEN ? AND ? ORDER BY item_id, consumption_date;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    sqlite3_bind_int64(stmt, 1, start.DaysSinceEpoch());
    sqlite3_bind_int64(stmt, 2, end.DaysSinceEpoch());

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(ReadRecord(stmt));
    }

    sqlite3_finalize(stmt);
    return results;
}

// ============================================================================
// ItemRepository
// ============================================================================

std::vector<ItemRef> PersistentBackend::QueryItems(const std::string& where, int64_t param, bool bind_param) {
    std::vector<ItemRef> results;
    std::string sql = std::string(kItemColumns) + where + " ORDER BY i.id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    if (bind_param) {
        sqlite3_bind_int64(stmt, 1, param);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(ReadItem(stmt));
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<ItemRef> PersistentBackend::GetAllItems() {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryItems("", 0, false);
}

std::vector<ItemRef> PersistentBackend::GetItemsByIds(const std::vector<ItemID>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ItemID> unique_ids(ids);
    std::sort(unique_ids.begin(), unique_ids.end());
    unique_ids.erase(std::unique(unique_ids.begin(), unique_ids.end()), unique_ids.end());

    std::vector<ItemRef> results;
    results.reserve(unique_ids.size());

    for (const auto& id : unique_ids) {
        auto rows = QueryItems(" WHERE i.id = ?", static_cast<int64_t>(id.value()), true);
        results.insert(results.end(), rows.begin(), rows.end());
    }

    return results;
}

std::vector<ItemRef> PersistentBackend::GetItemsByCategory(CategoryID category) {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryItems(" WHERE i.category_id = ?", static_cast<int64_t>(category.value()), true);
}

std::optional<ItemRef> PersistentBackend::FindItem(ItemID id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto rows = QueryItems(" WHERE i.id = ?", static_cast<int64_t>(id.value()), true);
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.front();
}

std::optional<CategoryRef> PersistentBackend::FindCategory(CategoryID id) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT id, name FROM categories WHERE id = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(id.value()));

    std::optional<CategoryRef> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        CategoryRef category;
        category.id = CategoryID(sqlite3_column_int64(stmt, 0));
        category.name = ColumnText(stmt, 1);
        result = category;
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<CategoryRef> PersistentBackend::GetAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CategoryRef> results;
    const char* sql = "SELECT id, name FROM categories ORDER BY id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CategoryRef category;
        category.id = CategoryID(sqlite3_column_int64(stmt, 0));
        category.name = ColumnText(stmt, 1);
        results.push_back(category);
    }

    sqlite3_finalize(stmt);
    return results;
}

bool PersistentBackend::WriteStatistics(
    sqlite3_stmt* stmt, ItemID id, const ItemStatisticsSnapshot& snapshot) {

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(id.value()));
    BindDecimal(stmt, 2, snapshot.mean_daily_consumption);
    BindDecimal(stmt, 3, snapshot.standard_deviation);
    BindDecimal(stmt, 4, snapshot.coefficient_of_variation);
    BindText(stmt, 5, ToString(snapshot.volatility));
    BindText(stmt, 6, ToString(snapshot.trend));
    BindText(stmt, 7, ToString(snapshot.pattern));
    BindDecimal(stmt, 8, snapshot.forecast_next_period);
    sqlite3_bind_int64(stmt, 9, snapshot.coverage_days);
    if (snapshot.expected_stockout_date) {
        sqlite3_bind_int64(stmt, 10, snapshot.expected_stockout_date->DaysSinceEpoch());
    } else {
        sqlite3_bind_null(stmt, 10);
    }
    sqlite3_bind_int64(stmt, 11, snapshot.last_updated.ToMicros());

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

namespace {
constexpr const char* kUpsertStatistics =
    "INSERT OR REPLACE INTO item_statistics (item_id, mean_daily_consumption, standard_deviation, "
    "coefficient_of_variation, volatility, trend, pattern, forecast_next_period, coverage_days, "
    "expected_stockout_date, last_updated) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
}

bool PersistentBackend::SaveItemStatistics(ItemID id, const ItemStatisticsSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ItemExistsLocked(id)) {
        return false;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, kUpsertStatistics, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = WriteStatistics(stmt, id, snapshot);
    sqlite3_finalize(stmt);
    return ok;
}

size_t PersistentBackend::SaveItemsStatistics(const std::vector<ItemStatisticsUpdate>& batch) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (batch.empty()) {
        return 0;
    }

    BeginTransaction();

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, kUpsertStatistics, -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return 0;
    }

    size_t saved = 0;
    for (const auto& [id, snapshot] : batch) {
        if (!ItemExistsLocked(id)) {
            continue;
        }
        if (WriteStatistics(stmt, id, snapshot)) {
            ++saved;
        }
    }

    sqlite3_finalize(stmt);
    CommitTransaction();

    return saved;
}

std::optional<ItemStatisticsSnapshot> PersistentBackend::GetItemStatistics(ItemID id) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT mean_daily_consumption, standard_deviation, coefficient_of_variation, volatility, "
        "trend, pattern, forecast_next_period, coverage_days, expected_stockout_date, last_updated "
        "FROM item_statistics WHERE item_id = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(id.value()));

    std::optional<ItemStatisticsSnapshot> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ItemStatisticsSnapshot snapshot;
        snapshot.mean_daily_consumption = ColumnDecimal(stmt, 0);
        snapshot.standard_deviation = ColumnDecimal(stmt, 1);
        snapshot.coefficient_of_variation = ColumnDecimal(stmt, 2);
        snapshot.volatility = ParseVolatilityClass(ColumnText(stmt, 3));
        snapshot.trend = ParseTrendDirection(ColumnText(stmt, 4));
        snapshot.pattern = ParseConsumptionPattern(ColumnText(stmt, 5));
        snapshot.forecast_next_period = ColumnDecimal(stmt, 6);
        snapshot.coverage_days = sqlite3_column_int64(stmt, 7);
        if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
            snapshot.expected_stockout_date = Date::FromDays(sqlite3_column_int64(stmt, 8));
        }
        snapshot.last_updated = Timestamp::FromMicros(sqlite3_column_int64(stmt, 9));
        result = snapshot;
    }

    sqlite3_finalize(stmt);
    return result;
}

// ============================================================================
// CorrelationRepository
// ============================================================================

std::optional<CorrelationEdge> PersistentBackend::FindEdge(ItemID a, ItemID b) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string(kEdgeColumns) + " WHERE pair_low = ? AND pair_high = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, PairLow(a, b));
    sqlite3_bind_int64(stmt, 2, PairHigh(a, b));

    std::optional<CorrelationEdge> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = ReadEdge(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

bool PersistentBackend::SaveEdge(const CorrelationEdge& edge) {
    ItemID a = edge.GetItem1();
    ItemID b = edge.GetItem2();
    if (!a.IsValid() || !b.IsValid() || a == b) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Existing pair: update in place, keeping id, order and creation time
    const char* update_sql =
        "UPDATE item_correlations SET coefficient = ?, correlation_type = ?, data_points = ?, "
        "confidence_level = ?, active = ?, last_calculated = ? WHERE pair_low = ? AND pair_high = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    BindDecimal(stmt, 1, edge.GetCoefficient());
    BindText(stmt, 2, ToString(edge.GetType()));
    sqlite3_bind_int(stmt, 3, edge.GetDataPoints());
    BindDecimal(stmt, 4, edge.GetConfidenceLevel());
    sqlite3_bind_int(stmt, 5, edge.IsActive() ? 1 : 0);
    sqlite3_bind_int64(stmt, 6, edge.GetLastCalculated().ToMicros());
    sqlite3_bind_int64(stmt, 7, PairLow(a, b));
    sqlite3_bind_int64(stmt, 8, PairHigh(a, b));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return false;
    }
    if (sqlite3_changes(db_) > 0) {
        return true;
    }

    const char* insert_sql =
        "INSERT INTO item_correlations (item1_id, item2_id, pair_low, pair_high, coefficient, "
        "correlation_type, data_points, confidence_level, category_id, active, created_at, "
        "last_calculated) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(a.value()));
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(b.value()));
    sqlite3_bind_int64(stmt, 3, PairLow(a, b));
    sqlite3_bind_int64(stmt, 4, PairHigh(a, b));
    BindDecimal(stmt, 5, edge.GetCoefficient());
    BindText(stmt, 6, ToString(edge.GetType()));
    sqlite3_bind_int(stmt, 7, edge.GetDataPoints());
    BindDecimal(stmt, 8, edge.GetConfidenceLevel());
    if (edge.GetCategory().IsValid()) {
        sqlite3_bind_int64(stmt, 9, static_cast<int64_t>(edge.GetCategory().value()));
    } else {
        sqlite3_bind_null(stmt, 9);
    }
    sqlite3_bind_int(stmt, 10, edge.IsActive() ? 1 : 0);
    sqlite3_bind_int64(stmt, 11, edge.GetCreatedAt().ToMicros());
    sqlite3_bind_int64(stmt, 12, edge.GetLastCalculated().ToMicros());

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

size_t PersistentBackend::DeleteAllEdges() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("DELETE FROM item_correlations;")) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

std::vector<CorrelationEdge> PersistentBackend::GetEdgesForItem(ItemID id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CorrelationEdge> results;
    std::string sql = std::string(kEdgeColumns) +
        " WHERE active = 1 AND (item1_id = ? OR item2_id = ?) ORDER BY id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(id.value()));
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(id.value()));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(ReadEdge(stmt));
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<CorrelationEdge> PersistentBackend::GetActiveEdges() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CorrelationEdge> results;
    std::string sql = std::string(kEdgeColumns) + " WHERE active = 1 ORDER BY id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(ReadEdge(stmt));
    }

    sqlite3_finalize(stmt);
    return results;
}

size_t PersistentBackend::EdgeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(*) FROM item_correlations;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

// ============================================================================
// Seeding
// ============================================================================

bool PersistentBackend::AddCategory(const CategoryRef& category) {
    if (!category.id.IsValid()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "INSERT OR REPLACE INTO categories (id, name) VALUES (?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(category.id.value()));
    BindText(stmt, 2, category.name);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

bool PersistentBackend::AddItem(const ItemRef& item) {
    if (!item.id.IsValid()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Upsert rather than REPLACE so dependent rows are not cascaded away
    const char* sql =
        "INSERT INTO items (id, name, category_id, current_quantity, reorder_level, active) "
        "VALUES (?, ?, ?, ?, ?, ?) ON CONFLICT(id) DO UPDATE SET name = excluded.name, "
        "category_id = excluded.category_id, current_quantity = excluded.current_quantity, "
        "reorder_level = excluded.reorder_level, active = excluded.active;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(item.id.value()));
    BindText(stmt, 2, item.name);
    if (item.category_id.IsValid()) {
        sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(item.category_id.value()));
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    BindDecimal(stmt, 4, item.current_quantity);
    BindOptionalDecimal(stmt, 5, item.reorder_level);
    sqlite3_bind_int(stmt, 6, item.active ? 1 : 0);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

bool PersistentBackend::InsertRecord(sqlite3_stmt* stmt, const ConsumptionObservation& record) {
    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(record.item_id.value()));
    sqlite3_bind_int64(stmt, 2, record.date.DaysSinceEpoch());
    BindOptionalDecimal(stmt, 3, record.consumed_quantity);
    BindDecimal(stmt, 4, record.received_quantity);
    BindOptionalDecimal(stmt, 5, record.opening_stock);
    BindOptionalDecimal(stmt, 6, record.closing_stock);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

namespace {
constexpr const char* kInsertRecord =
    "INSERT OR REPLACE INTO consumption_records (item_id, consumption_date, consumed_quantity, "
    "received_quantity, opening_stock, closing_stock) VALUES (?, ?, ?, ?, ?, ?);";
}

bool PersistentBackend::AddConsumptionRecord(const ConsumptionObservation& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!record.item_id.IsValid() || !ItemExistsLocked(record.item_id)) {
        return false;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, kInsertRecord, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = InsertRecord(stmt, record);
    sqlite3_finalize(stmt);
    return ok;
}

size_t PersistentBackend::AddConsumptionRecords(const std::vector<ConsumptionObservation>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (records.empty()) {
        return 0;
    }

    BeginTransaction();

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, kInsertRecord, -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return 0;
    }

    size_t stored = 0;
    for (const auto& record : records) {
        if (!record.item_id.IsValid() || !ItemExistsLocked(record.item_id)) {
            continue;
        }
        if (InsertRecord(stmt, record)) {
            ++stored;
        }
    }

    sqlite3_finalize(stmt);
    CommitTransaction();

    return stored;
}

bool PersistentBackend::UpdateItemQuantity(ItemID id, const Decimal& quantity) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "UPDATE items SET current_quantity = ? WHERE id = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    BindDecimal(stmt, 1, quantity);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(id.value()));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

} // namespace stocklens

// File: src/storage/inventory_repository.hpp
#pragma once

#include "core/records.hpp"
#include "correlation/correlation_edge.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace stocklens {

/// One entry of a batch statistics write
using ItemStatisticsUpdate = std::pair<ItemID, ItemStatisticsSnapshot>;

/// Read access to daily consumption observations
///
/// Records are written by the transaction-recording side of the system. The
/// analytics engine never modifies them.
///
/// Thread Safety: All methods must be thread-safe.
class ConsumptionRepository {
public:
    virtual ~ConsumptionRepository() = default;

    /// Observations of one item with start <= date <= end, ordered by date
    virtual std::vector<ConsumptionObservation> GetConsumptionRecords(
        ItemID item, const Date& start, const Date& end) = 0;

    /// Observations of every item with start <= date <= end,
    /// ordered by item then date
    virtual std::vector<ConsumptionObservation> GetConsumptionRecords(
        const Date& start, const Date& end) = 0;
};

/// Item and category lookup plus the derived-statistics fields
///
/// Thread Safety: All methods must be thread-safe.
class ItemRepository {
public:
    virtual ~ItemRepository() = default;

    // ========================================================================
    // Lookup
    // ========================================================================

    /// All items, ordered by id
    virtual std::vector<ItemRef> GetAllItems() = 0;

    /// Items whose id is in `ids`; unknown ids are skipped
    virtual std::vector<ItemRef> GetItemsByIds(const std::vector<ItemID>& ids) = 0;

    /// Items belonging to a category, ordered by id
    virtual std::vector<ItemRef> GetItemsByCategory(CategoryID category) = 0;

    /// @return The item if found, std::nullopt otherwise
    virtual std::optional<ItemRef> FindItem(ItemID id) = 0;

    /// @return The category if found, std::nullopt otherwise
    virtual std::optional<CategoryRef> FindCategory(CategoryID id) = 0;

    virtual std::vector<CategoryRef> GetAllCategories() = 0;

    // ========================================================================
    // Derived Statistics
    // ========================================================================

    /// Replace the statistics stored on an item
    /// @return true if saved, false if the item does not exist
    virtual bool SaveItemStatistics(ItemID id, const ItemStatisticsSnapshot& snapshot) = 0;

    /// Replace the statistics of many items in a single operation
    /// @return Number of items successfully updated
    virtual size_t SaveItemsStatistics(const std::vector<ItemStatisticsUpdate>& batch) = 0;

    /// @return The stored statistics, std::nullopt if never computed
    virtual std::optional<ItemStatisticsSnapshot> GetItemStatistics(ItemID id) = 0;
};

/// Persistence of the correlation graph
///
/// Thread Safety: All methods must be thread-safe.
class CorrelationRepository {
public:
    virtual ~CorrelationRepository() = default;

    /// Find the edge of an unordered pair: FindEdge(a, b) == FindEdge(b, a)
    virtual std::optional<CorrelationEdge> FindEdge(ItemID a, ItemID b) = 0;

    /// Insert or update an edge
    ///
    /// If an edge for the same unordered pair already exists it is updated
    /// in place (its id and creation time are kept); otherwise a new edge
    /// is inserted and assigned an id.
    /// @return true if stored successfully
    virtual bool SaveEdge(const CorrelationEdge& edge) = 0;

    /// Remove every edge
    /// WARNING: This operation cannot be undone
    /// @return Number of edges removed
    virtual size_t DeleteAllEdges() = 0;

    /// Active edges that have `id` as either endpoint
    virtual std::vector<CorrelationEdge> GetEdgesForItem(ItemID id) = 0;

    virtual std::vector<CorrelationEdge> GetActiveEdges() = 0;
};

/// Complete inventory store: every repository the engine consumes plus the
/// seeding operations used by data import and tests
class InventoryStore : public ConsumptionRepository,
                       public ItemRepository,
                       public CorrelationRepository {
public:
    ~InventoryStore() override = default;

    /// Insert or replace a category
    virtual bool AddCategory(const CategoryRef& category) = 0;

    /// Insert or replace an item (statistics are left untouched)
    virtual bool AddItem(const ItemRef& item) = 0;

    /// Insert an observation, replacing any existing one for the same
    /// item and date
    virtual bool AddConsumptionRecord(const ConsumptionObservation& record) = 0;

    /// Insert many observations in a single operation
    /// @return Number of observations stored
    virtual size_t AddConsumptionRecords(const std::vector<ConsumptionObservation>& records) = 0;

    /// Update the current quantity of an item
    /// @return false if the item does not exist
    virtual bool UpdateItemQuantity(ItemID id, const Decimal& quantity) = 0;
};

} // namespace stocklens

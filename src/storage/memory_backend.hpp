// File: src/storage/memory_backend.hpp
#pragma once

#include "storage/inventory_repository.hpp"
#include <map>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace stocklens {

/// In-memory inventory store
///
/// Keeps categories, items, observations, statistics and correlation edges
/// in ordered maps so every listing comes back sorted by id (and by date
/// for observations). Thread-safe with shared_mutex: many readers, one
/// writer.
///
/// Used by the test suite and by the CLI when no database is configured.
class MemoryBackend : public InventoryStore {
public:
    MemoryBackend() = default;
    ~MemoryBackend() override = default;

    MemoryBackend(const MemoryBackend&) = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;

    // ========================================================================
    // ConsumptionRepository
    // ========================================================================

    std::vector<ConsumptionObservation> GetConsumptionRecords(
        ItemID item, const Date& start, const Date& end) override;
    std::vector<ConsumptionObservation> GetConsumptionRecords(
        const Date& start, const Date& end) override;

    // ========================================================================
    // ItemRepository
    // ========================================================================

    std::vector<ItemRef> GetAllItems() override;
    std::vector<ItemRef> GetItemsByIds(const std::vector<ItemID>& ids) override;
    std::vector<ItemRef> GetItemsByCategory(CategoryID category) override;
    std::optional<ItemRef> FindItem(ItemID id) override;
    std::optional<CategoryRef> FindCategory(CategoryID id) override;
    std::vector<CategoryRef> GetAllCategories() override;

    bool SaveItemStatistics(ItemID id, const ItemStatisticsSnapshot& snapshot) override;
    size_t SaveItemsStatistics(const std::vector<ItemStatisticsUpdate>& batch) override;
    std::optional<ItemStatisticsSnapshot> GetItemStatistics(ItemID id) override;

    // ========================================================================
    // CorrelationRepository
    // ========================================================================

    std::optional<CorrelationEdge> FindEdge(ItemID a, ItemID b) override;
    bool SaveEdge(const CorrelationEdge& edge) override;
    size_t DeleteAllEdges() override;
    std::vector<CorrelationEdge> GetEdgesForItem(ItemID id) override;
    std::vector<CorrelationEdge> GetActiveEdges() override;

    // ========================================================================
    // Seeding
    // ========================================================================

    bool AddCategory(const CategoryRef& category) override;
    bool AddItem(const ItemRef& item) override;
    bool AddConsumptionRecord(const ConsumptionObservation& record) override;
    size_t AddConsumptionRecords(const std::vector<ConsumptionObservation>& records) override;
    bool UpdateItemQuantity(ItemID id, const Decimal& quantity) override;

    /// Number of stored correlation edges (active or not)
    size_t EdgeCount() const;

    /// Remove everything
    void Clear();

private:
    using PairKey = std::pair<ItemID, ItemID>;

    mutable std::shared_mutex mutex_;

    std::map<CategoryID, CategoryRef> categories_;
    std::map<ItemID, ItemRef> items_;
    std::map<ItemID, std::map<Date, ConsumptionObservation>> records_;
    std::unordered_map<ItemID, ItemStatisticsSnapshot> statistics_;

    std::map<int64_t, CorrelationEdge> edges_;
    std::map<PairKey, int64_t> edge_index_;
    int64_t next_edge_id_{1};

    /// Unordered pair normalized to (smaller, larger)
    static PairKey MakeKey(ItemID a, ItemID b) {
        return a < b ? PairKey(a, b) : PairKey(b, a);
    }

    /// Caller must hold the lock
    ItemRef WithCategoryName(ItemRef item) const;

    /// Caller must hold the exclusive lock
    bool InsertRecordLocked(const ConsumptionObservation& record);
};

} // namespace stocklens

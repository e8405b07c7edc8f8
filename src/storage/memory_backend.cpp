// File: src/storage/memory_backend.cpp
#include "storage/memory_backend.hpp"
#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace stocklens {

ItemRef MemoryBackend::WithCategoryName(ItemRef item) const {
    auto it = categories_.find(item.category_id);
    if (it != categories_.end()) {
        item.category_name = it->second.name;
    }
    return item;
}

// ============================================================================
// ConsumptionRepository
// ============================================================================

std::vector<ConsumptionObservation> MemoryBackend::GetConsumptionRecords(
    ItemID item, const Date& start, const Date& end) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ConsumptionObservation> result;
    auto it = records_.find(item);
    if (it == records_.end()) {
        return result;
    }

    const auto& by_date = it->second;
    for (auto rec = by_date.lower_bound(start); rec != by_date.end() && rec->first <= end; ++rec) {
        result.push_back(rec->second);
    }
    return result;
}

std::vector<ConsumptionObservation> MemoryBackend::GetConsumptionRecords(
    const Date& start, const Date& end) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ConsumptionObservation> result;
    for (const auto& [item, by_date] : records_) {
        for (auto rec = by_date.lower_bound(start); rec != by_date.end() && rec->first <= end; ++rec) {
            result.push_back(rec->second);
        }
    }
    return result;
}

// ============================================================================
// ItemRepository
// ============================================================================

std::vector<ItemRef> MemoryBackend::GetAllItems() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ItemRef> result;
    result.reserve(items_.size());
    for (const auto& [id, item] : items_) {
        result.push_back(WithCategoryName(item));
    }
    return result;
}

std::vector<ItemRef> MemoryBackend::GetItemsByIds(const std::vector<ItemID>& ids) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::unordered_set<ItemID> wanted(ids.begin(), ids.end());
    std::vector<ItemRef> result;
    for (const auto& [id, item] : items_) {
        if (wanted.count(id) > 0) {
            result.push_back(WithCategoryName(item));
        }
    }
    return result;
}

std::vector<ItemRef> MemoryBackend::GetItemsByCategory(CategoryID category) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ItemRef> result;
    for (const auto& [id, item] : items_) {
        if (item.category_id == category) {
            result.push_back(WithCategoryName(item));
        }
    }
    return result;
}

std::optional<ItemRef> MemoryBackend::FindItem(ItemID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return WithCategoryName(it->second);
}

std::optional<CategoryRef> MemoryBackend::FindCategory(CategoryID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = categories_.find(id);
    if (it == categories_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CategoryRef> MemoryBackend::GetAllCategories() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<CategoryRef> result;
    result.reserve(categories_.size());
    for (const auto& [id, category] : categories_) {
        result.push_back(category);
    }
    return result;
}

bool MemoryBackend::SaveItemStatistics(ItemID id, const ItemStatisticsSnapshot& snapshot) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (items_.find(id) == items_.end()) {
        return false;
    }
    statistics_[id] = snapshot;
    return true;
}

size_t MemoryBackend::SaveItemsStatistics(const std::vector<ItemStatisticsUpdate>& batch) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t saved = 0;
    for (const auto& [id, snapshot] : batch) {
        if (items_.find(id) == items_.end()) {
            continue;
        }
        statistics_[id] = snapshot;
        saved++;
    }
    return saved;
}

std::optional<ItemStatisticsSnapshot> MemoryBackend::GetItemStatistics(ItemID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = statistics_.find(id);
    if (it == statistics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// CorrelationRepository
// ============================================================================

std::optional<CorrelationEdge> MemoryBackend::FindEdge(ItemID a, ItemID b) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = edge_index_.find(MakeKey(a, b));
    if (it == edge_index_.end()) {
        return std::nullopt;
    }
    return edges_.at(it->second);
}

bool MemoryBackend::SaveEdge(const CorrelationEdge& edge) {
    if (!edge.GetItem1().IsValid() || !edge.GetItem2().IsValid() ||
        edge.GetItem1() == edge.GetItem2()) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    PairKey key = MakeKey(edge.GetItem1(), edge.GetItem2());
    auto it = edge_index_.find(key);

    if (it != edge_index_.end()) {
        // Update in place; identity and creation time stay
        CorrelationEdge& stored = edges_.at(it->second);
        stored.SetCoefficient(edge.GetCoefficient());
        stored.SetDataPoints(edge.GetDataPoints());
        stored.SetConfidenceLevel(edge.GetConfidenceLevel());
        stored.SetActive(edge.IsActive());
        stored.SetLastCalculated(edge.GetLastCalculated());
        return true;
    }

    CorrelationEdge stored = edge;
    stored.SetID(next_edge_id_++);
    edge_index_.emplace(key, stored.GetID());
    edges_.emplace(stored.GetID(), stored);
    return true;
}

size_t MemoryBackend::DeleteAllEdges() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t removed = edges_.size();
    edges_.clear();
    edge_index_.clear();
    return removed;
}

std::vector<CorrelationEdge> MemoryBackend::GetEdgesForItem(ItemID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<CorrelationEdge> result;
    for (const auto& [edge_id, edge] : edges_) {
        if (edge.IsActive() && edge.Involves(id)) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<CorrelationEdge> MemoryBackend::GetActiveEdges() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<CorrelationEdge> result;
    for (const auto& [edge_id, edge] : edges_) {
        if (edge.IsActive()) {
            result.push_back(edge);
        }
    }
    return result;
}

size_t MemoryBackend::EdgeCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return edges_.size();
}

// ============================================================================
// Seeding
// ============================================================================

bool MemoryBackend::AddCategory(const CategoryRef& category) {
    if (!category.id.IsValid()) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    categories_[category.id] = category;
    return true;
}

bool MemoryBackend::AddItem(const ItemRef& item) {
    if (!item.id.IsValid()) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    items_[item.id] = item;
    return true;
}

bool MemoryBackend::InsertRecordLocked(const ConsumptionObservation& record) {
    if (!record.item_id.IsValid() || items_.find(record.item_id) == items_.end()) {
        return false;
    }
    records_[record.item_id][record.date] = record;
    return true;
}

bool MemoryBackend::AddConsumptionRecord(const ConsumptionObservation& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return InsertRecordLocked(record);
}

size_t MemoryBackend::AddConsumptionRecords(const std::vector<ConsumptionObservation>& records) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t stored = 0;
    for (const auto& record : records) {
        if (InsertRecordLocked(record)) {
            stored++;
        }
    }
    return stored;
}

bool MemoryBackend::UpdateItemQuantity(ItemID id, const Decimal& quantity) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return false;
    }
    it->second.current_quantity = quantity;
    return true;
}

void MemoryBackend::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    categories_.clear();
    items_.clear();
    records_.clear();
    statistics_.clear();
    edges_.clear();
    edge_index_.clear();
    next_edge_id_ = 1;
}

} // namespace stocklens

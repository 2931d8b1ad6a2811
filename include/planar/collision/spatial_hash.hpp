#pragma once

/// @file spatial_hash.hpp
/// @brief Uniform-grid broad phase for planar_collision
///
/// Entities are bucketed into every grid cell their world AABB covers.
/// Queries gather the ids in the cells covered by a query box, drop
/// duplicates, then filter by collision groups and by a closed AABB
/// overlap test. The grid is not thread-safe: the dedup scratch sets are
/// owned by the instance and reused across queries.

#include "fwd.hpp"
#include "types.hpp"
#include "aabb.hpp"
#include "shape.hpp"

#include <planar/core/log.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace planar_collision {

/// Broad-phase index keyed by caller-supplied ids
///
/// @tparam Id   Equality-comparable, hashable with Hash
/// @tparam T    Scalar type (float or Fix64)
template<typename Id, typename T, typename Hash>
class SpatialHash2D {
public:
    using Vec = TVec2<T>;

    /// One stored entity as returned from a query
    struct Entry {
        Id id;
        Shape<T> shape;
        Transform2D<T> transform;
        CollisionGroups groups;
    };

    /// @throws std::invalid_argument if cell_size is not positive
    explicit SpatialHash2D(T cell_size)
        : m_cell_size(cell_size) {
        if (!(cell_size > ScalarTraits<T>::zero())) {
            throw std::invalid_argument("SpatialHash2D cell size must be positive");
        }
        planar_core::collision_logger()->trace("SpatialHash2D created, cell size {}",
                                               ScalarTraits<T>::to_float(cell_size));
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert or replace an entity
    ///
    /// Re-inserting a known id first removes it from the cells it occupied,
    /// so an id is never stored twice.
    void insert(const Id& id, const Shape<T>& shape, const Transform2D<T>& transform,
                CollisionGroups groups = groups::All) {
        auto existing = m_records.find(id);
        if (existing != m_records.end()) {
            unlink(id, existing->second.cells);
            m_records.erase(existing);
        }

        const AABB2D<T> bounds = shape.transformed_bounds(transform);
        const CellRange range = cell_range(bounds);

        m_min_cell_x = std::min(m_min_cell_x, range.min_x);
        m_min_cell_y = std::min(m_min_cell_y, range.min_y);
        m_max_cell_x = std::max(m_max_cell_x, range.max_x);
        m_max_cell_y = std::max(m_max_cell_y, range.max_y);

        Record record{Entry{id, shape, transform, groups}, bounds, {}};
        for (std::int32_t x = range.min_x; x <= range.max_x; ++x) {
            for (std::int32_t y = range.min_y; y <= range.max_y; ++y) {
                const CellKey key = make_key(x, y);
                m_cells[key].push_back(id);
                record.cells.push_back(key);
            }
        }

        m_records.emplace(id, std::move(record));
    }

    /// Remove an entity from every cell it occupies
    /// @return false if the id was not present
    bool remove(const Id& id) {
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            planar_core::collision_logger()->debug("SpatialHash2D::remove ignored an unknown id");
            return false;
        }

        unlink(id, it->second.cells);
        m_records.erase(it);
        return true;
    }

    /// Drop every entity; the tracked cell bounds are kept
    void clear() {
        planar_core::collision_logger()->trace("SpatialHash2D cleared ({} entities)", m_records.size());
        m_cells.clear();
        m_records.clear();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Candidates near a placed shape, excluding id itself
    [[nodiscard]] std::vector<Entry> retrieve(const Id& id, const Shape<T>& shape, const Transform2D<T>& transform,
                                              CollisionGroups mask = groups::All) const {
        std::vector<Entry> results;
        retrieve(id, shape, transform, mask, results);
        return results;
    }

    /// Append candidates near a placed shape to out, excluding id itself
    void retrieve(const Id& id, const Shape<T>& shape, const Transform2D<T>& transform,
                  CollisionGroups mask, std::vector<Entry>& out) const {
        collect(shape.transformed_bounds(transform), mask, &id, out);
    }

    /// Candidates whose bounds overlap aabb
    [[nodiscard]] std::vector<Entry> retrieve(const AABB2D<T>& aabb, CollisionGroups mask = groups::All) const {
        std::vector<Entry> results;
        retrieve(aabb, mask, results);
        return results;
    }

    /// Append candidates whose bounds overlap aabb to out
    void retrieve(const AABB2D<T>& aabb, CollisionGroups mask, std::vector<Entry>& out) const {
        collect(aabb, mask, nullptr, out);
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] T cell_size() const noexcept { return m_cell_size; }
    [[nodiscard]] bool contains(const Id& id) const { return m_records.find(id) != m_records.end(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_records.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_records.empty(); }

private:
    using CellKey = std::uint64_t;
    using IdSet = std::unordered_set<Id, Hash>;

    struct Record {
        Entry entry;
        AABB2D<T> bounds;
        std::vector<CellKey> cells;
    };

    struct CellRange {
        std::int32_t min_x;
        std::int32_t min_y;
        std::int32_t max_x;
        std::int32_t max_y;
    };

    /// Borrowed scratch set, returned to the pool on scope exit
    class ScratchLease {
    public:
        explicit ScratchLease(std::vector<IdSet>& pool)
            : m_pool(pool) {
            if (m_pool.empty()) {
                m_set = IdSet();
            } else {
                m_set = std::move(m_pool.back());
                m_pool.pop_back();
            }
        }

        ~ScratchLease() {
            m_set.clear();
            if (m_pool.size() < k_scratch_pool_limit) {
                m_pool.push_back(std::move(m_set));
            }
        }

        ScratchLease(const ScratchLease&) = delete;
        ScratchLease& operator=(const ScratchLease&) = delete;

        IdSet& get() noexcept { return m_set; }

    private:
        std::vector<IdSet>& m_pool;
        IdSet m_set;
    };

    static constexpr std::size_t k_scratch_pool_limit = 4;

    [[nodiscard]] static CellKey make_key(std::int32_t x, std::int32_t y) noexcept {
        return (static_cast<CellKey>(static_cast<std::uint32_t>(x)) << 32) | static_cast<std::uint32_t>(y);
    }

    /// Cell index, clamped one short of the int32 limits so `x <= max; ++x` terminates
    [[nodiscard]] std::int32_t cell_coord(T value) const {
        constexpr std::int64_t limit = std::numeric_limits<std::int32_t>::max() - 1;
        const std::int64_t cell = ScalarTraits<T>::floor_to_int(value / m_cell_size);
        return static_cast<std::int32_t>(std::clamp(cell, -limit, limit));
    }

    [[nodiscard]] CellRange cell_range(const AABB2D<T>& bounds) const {
        return CellRange{cell_coord(bounds.min.x), cell_coord(bounds.min.y),
                         cell_coord(bounds.max.x), cell_coord(bounds.max.y)};
    }

    void unlink(const Id& id, const std::vector<CellKey>& cells) {
        for (CellKey key : cells) {
            auto cell = m_cells.find(key);
            if (cell == m_cells.end()) {
                continue;
            }
            auto& ids = cell->second;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
            if (ids.empty()) {
                m_cells.erase(cell);
            }
        }
    }

    void collect(const AABB2D<T>& query, CollisionGroups mask, const Id* exclude, std::vector<Entry>& out) const {
        if (m_records.empty()) {
            return;
        }

        const CellRange range = cell_range(query);
        const std::int32_t min_x = std::clamp(range.min_x, m_min_cell_x, m_max_cell_x);
        const std::int32_t min_y = std::clamp(range.min_y, m_min_cell_y, m_max_cell_y);
        const std::int32_t max_x = std::clamp(range.max_x, m_min_cell_x, m_max_cell_x);
        const std::int32_t max_y = std::clamp(range.max_y, m_min_cell_y, m_max_cell_y);

        ScratchLease lease(m_scratch_pool);
        IdSet& seen = lease.get();

        for (std::int32_t x = min_x; x <= max_x; ++x) {
            for (std::int32_t y = min_y; y <= max_y; ++y) {
                auto cell = m_cells.find(make_key(x, y));
                if (cell == m_cells.end()) {
                    continue;
                }

                for (const Id& candidate : cell->second) {
                    if (exclude && candidate == *exclude) {
                        continue;
                    }
                    if (!seen.insert(candidate).second) {
                        continue;
                    }

                    const Record& record = m_records.at(candidate);
                    if (!groups_intersect(record.entry.groups, mask)) {
                        continue;
                    }
                    if (!AABB2D<T>::test_overlap(record.bounds, query)) {
                        continue;
                    }
                    out.push_back(record.entry);
                }
            }
        }
    }

    T m_cell_size;
    std::unordered_map<CellKey, std::vector<Id>> m_cells;
    std::unordered_map<Id, Record, Hash> m_records;

    std::int32_t m_min_cell_x = 0;
    std::int32_t m_min_cell_y = 0;
    std::int32_t m_max_cell_x = 0;
    std::int32_t m_max_cell_y = 0;

    mutable std::vector<IdSet> m_scratch_pool;
};

} // namespace planar_collision

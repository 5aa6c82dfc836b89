#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include "BaselineTypes.h"

namespace stratvalidator
{
namespace baseline
{

/**
 * @brief Get-or-compute store of baseline records for one validation run.
 *
 * Lookups take a shared lock. A miss computes outside the lock and inserts
 * under an exclusive lock; when two threads race on the same key both
 * compute, the first insert wins and both callers receive that record.
 * A computation that throws leaves the cache unchanged.
 */
class BaselineCache
{
public:
    using ComputeFunction = std::function<BaselineRecord()>;

    BaselineCache() = default;
    BaselineCache(const BaselineCache&) = delete;
    BaselineCache& operator=(const BaselineCache&) = delete;

    BaselineRecord getOrCompute(BaselineId id, const PeriodBounds& bounds, const ComputeFunction& compute);

    std::optional<BaselineRecord> find(BaselineId id, const PeriodBounds& bounds) const;

    std::size_t size() const;

    void clear();

private:
    struct Key
    {
        BaselineId id;
        PeriodBounds bounds;

        bool operator==(const Key& rhs) const
        {
            return id == rhs.id && bounds == rhs.bounds;
        }
    };

    struct KeyHash
    {
        std::size_t operator()(const Key& key) const
        {
            return makeBaselineCacheKey(key.id, key.bounds);
        }
    };

    mutable std::shared_mutex mMutex;
    std::unordered_map<Key, BaselineRecord, KeyHash> mRecords;
};

} // namespace baseline
} // namespace stratvalidator

#include "BaselineCache.h"
#include <mutex>

namespace stratvalidator
{
namespace baseline
{

BaselineRecord BaselineCache::getOrCompute(BaselineId id,
                                           const PeriodBounds& bounds,
                                           const ComputeFunction& compute)
{
    const Key key{id, bounds};

    {
        std::shared_lock<std::shared_mutex> lock(mMutex);
        auto it = mRecords.find(key);
        if (it != mRecords.end())
            return it->second;
    }

    BaselineRecord record = compute();

    std::unique_lock<std::shared_mutex> lock(mMutex);
    auto inserted = mRecords.emplace(key, record);
    return inserted.first->second;
}

std::optional<BaselineRecord> BaselineCache::find(BaselineId id, const PeriodBounds& bounds) const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);
    auto it = mRecords.find(Key{id, bounds});
    if (it == mRecords.end())
        return std::nullopt;

    return it->second;
}

std::size_t BaselineCache::size() const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);
    return mRecords.size();
}

void BaselineCache::clear()
{
    std::unique_lock<std::shared_mutex> lock(mMutex);
    mRecords.clear();
}

} // namespace baseline
} // namespace stratvalidator

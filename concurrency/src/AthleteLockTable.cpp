/**
 * @file AthleteLockTable.cpp
 * @brief Per-athlete lock table.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/concurrency/AthleteLockTable.hpp>

namespace tpo::concurrency {

AthleteLockTable::Guard::Guard(core::AthleteId athleteId, std::shared_ptr<std::mutex> mutex,
                               std::unique_lock<std::mutex> lock)
    : _athleteId{std::move(athleteId)}, _mutex{std::move(mutex)}, _lock{std::move(lock)}
{
}

std::shared_ptr<std::mutex> AthleteLockTable::mutexFor(const core::AthleteId &athleteId)
{
    std::lock_guard<std::mutex> lock{_tableMutex};
    auto &slot = _locks[athleteId];
    if (!slot)
        slot = std::make_shared<std::mutex>();
    return slot;
}

AthleteLockTable::Guard AthleteLockTable::lock(const core::AthleteId &athleteId)
{
    auto mutex = mutexFor(athleteId);
    std::unique_lock<std::mutex> held{*mutex};
    return Guard{athleteId, std::move(mutex), std::move(held)};
}

std::optional<AthleteLockTable::Guard> AthleteLockTable::tryLock(const core::AthleteId &athleteId)
{
    auto mutex = mutexFor(athleteId);
    std::unique_lock<std::mutex> held{*mutex, std::try_to_lock};
    if (!held.owns_lock())
        return std::nullopt;
    return Guard{athleteId, std::move(mutex), std::move(held)};
}

core::usize AthleteLockTable::prune()
{
    std::lock_guard<std::mutex> lock{_tableMutex};
    return std::erase_if(_locks, [](const auto &entry) { return entry.second.use_count() == 1; });
}

core::usize AthleteLockTable::size() const
{
    std::lock_guard<std::mutex> lock{_tableMutex};
    return _locks.size();
}

} // namespace tpo::concurrency

/**
 * @file AthleteLockTable.hpp
 * @brief Per-athlete mutual exclusion for analytical operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_CONCURRENCY_ATHLETE_LOCK_TABLE_HPP
    #define TPO_CONCURRENCY_ATHLETE_LOCK_TABLE_HPP

    #include <tpo/core/NonCopyable.hpp>
    #include <tpo/core/Types.hpp>

    #include <memory>
    #include <mutex>
    #include <optional>
    #include <unordered_map>

namespace tpo::concurrency {

/**
 * @class AthleteLockTable
 * @brief One mutex per athlete id, created on first use.
 *
 * Operations on the same athlete serialise; different athletes never
 * contend beyond the short table lookup. Entries nobody holds can be
 * dropped with @ref prune.
 */
class AthleteLockTable final : public core::NonCopyable<AthleteLockTable>
{
public:
    /**
     * @brief Holds one athlete's lock until destroyed. Movable.
     */
    class Guard
    {
    public:
        Guard(Guard &&) noexcept            = default;
        Guard &operator=(Guard &&) noexcept = default;
        Guard(const Guard &)                = delete;
        Guard &operator=(const Guard &)     = delete;
        ~Guard()                            = default;

        [[nodiscard]] const core::AthleteId &athleteId() const noexcept { return _athleteId; }
        [[nodiscard]] bool ownsLock() const noexcept { return _lock.owns_lock(); }

    private:
        friend class AthleteLockTable;
        Guard(core::AthleteId athleteId, std::shared_ptr<std::mutex> mutex, std::unique_lock<std::mutex> lock);

        core::AthleteId              _athleteId;
        std::shared_ptr<std::mutex>  _mutex;   // keeps the mutex alive across prune()
        std::unique_lock<std::mutex> _lock;
    };

    AthleteLockTable()  = default;
    ~AthleteLockTable() = default;

    /** @brief Blocks until @p athleteId is free. */
    [[nodiscard]] Guard lock(const core::AthleteId &athleteId);

    /** @brief Empty when another operation holds @p athleteId. */
    [[nodiscard]] std::optional<Guard> tryLock(const core::AthleteId &athleteId);

    /** @brief Drops entries no guard refers to; returns how many. */
    core::usize prune();

    [[nodiscard]] core::usize size() const;

private:
    [[nodiscard]] std::shared_ptr<std::mutex> mutexFor(const core::AthleteId &athleteId);

    mutable std::mutex                                            _tableMutex;
    std::unordered_map<core::AthleteId, std::shared_ptr<std::mutex>> _locks;
};

} // namespace tpo::concurrency

#endif // TPO_CONCURRENCY_ATHLETE_LOCK_TABLE_HPP

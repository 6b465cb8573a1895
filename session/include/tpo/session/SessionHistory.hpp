/**
 * @file SessionHistory.hpp
 * @brief Append-only session log with supersede-by-id corrections.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_SESSION_SESSION_HISTORY_HPP
    #define TPO_SESSION_SESSION_HISTORY_HPP

    #include "Session.hpp"

    #include <tpo/core/Expected.hpp>

    #include <unordered_map>
    #include <unordered_set>
    #include <vector>

namespace tpo::session {

/**
 * @class SessionHistory
 * @brief Keeps every record ever appended and derives the effective,
 *        chronological view on demand.
 */
class SessionHistory final {
public:
    SessionHistory() = default;

    /**
     * @brief Appends @p session.
     * @return kInvalidArgument for a record without id or with a
     *         non-positive duration, kAlreadyExists for a reused id,
     *         kNotFound when it supersedes an unknown id and kInvalidState
     *         when that record was already superseded.
     */
    [[nodiscard]] core::ExpectedVoid append(Session session);

    /// @brief Effective sessions (superseded records removed), by date.
    [[nodiscard]] std::vector<Session> resolved() const;

    /// @brief Every record in insertion order.
    [[nodiscard]] const std::vector<Session> &records() const noexcept { return _records; }

    [[nodiscard]] bool isSuperseded(const core::SessionId &id) const;

private:
    std::vector<Session>                         _records;
    std::unordered_map<core::SessionId, core::usize> _index;
    std::unordered_set<core::SessionId>          _superseded;
};

} // namespace tpo::session

#endif // TPO_SESSION_SESSION_HISTORY_HPP

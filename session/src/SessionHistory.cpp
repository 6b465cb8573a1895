/**
 * @file SessionHistory.cpp
 * @brief Append-only session log.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/session/SessionHistory.hpp>

#include <algorithm>
#include <format>

namespace tpo::session {

core::ExpectedVoid SessionHistory::append(Session session)
{
    if (session.id.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "session id must not be empty");
    if (session.durationS <= 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("session '{}' has non-positive duration", session.id));
    if (_index.contains(session.id))
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               std::format("session '{}' already recorded", session.id));

    if (session.supersedes)
    {
        const core::SessionId &target = *session.supersedes;
        if (!_index.contains(target))
            return core::makeError(core::ErrorCode::kNotFound,
                                   std::format("session '{}' supersedes unknown '{}'", session.id, target));
        if (_superseded.contains(target))
            return core::makeError(core::ErrorCode::kInvalidState,
                                   std::format("session '{}' was already superseded", target));
        _superseded.insert(target);
    }

    _index.emplace(session.id, _records.size());
    _records.push_back(std::move(session));
    return {};
}

bool SessionHistory::isSuperseded(const core::SessionId &id) const
{
    return _superseded.contains(id);
}

std::vector<Session> SessionHistory::resolved() const
{
    std::vector<Session> out;
    out.reserve(_records.size() - _superseded.size());

    for (const auto &record : _records)
    {
        if (!_superseded.contains(record.id))
            out.push_back(record);
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const Session &a, const Session &b) { return a.date < b.date; });
    return out;
}

} // namespace tpo::session

/**
 * @file FeedbackLog.cpp
 * @brief Insight feedback store.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/insight/FeedbackLog.hpp>

#include <tpo/core/Log.hpp>

#include <format>

namespace tpo::insight {

std::string_view feedbackActionName(FeedbackAction action) noexcept
{
    switch (action)
    {
    case FeedbackAction::kDismiss: return "dismiss";
    case FeedbackAction::kSave: return "save";
    }
    return "unknown";
}

core::ExpectedVoid FeedbackLog::record(FeedbackEvent event)
{
    if (event.athleteId.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "feedback needs an athlete id");
    if (event.signature.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "feedback needs an insight signature");

    core::Log::debug("FeedbackLog", std::format("{} {} for {}", feedbackActionName(event.action), event.signature,
                                                event.athleteId));

    std::lock_guard lock(_mutex);
    _events.push_back(std::move(event));
    return {};
}

std::vector<FeedbackEvent> FeedbackLog::events(const core::AthleteId &athleteId) const
{
    std::lock_guard lock(_mutex);
    std::vector<FeedbackEvent> out;
    for (const auto &e : _events)
    {
        if (e.athleteId == athleteId)
            out.push_back(e);
    }
    return out;
}

const FeedbackEvent *FeedbackLog::latest(const core::AthleteId &athleteId, std::string_view signature) const
{
    const FeedbackEvent *found = nullptr;
    for (const auto &e : _events)
    {
        if (e.athleteId == athleteId && e.signature == signature && (found == nullptr || e.at >= found->at))
            found = &e;
    }
    return found;
}

bool FeedbackLog::isSuppressed(const core::AthleteId &athleteId, std::string_view signature, core::Date today,
                               core::i32 cooldownDays) const
{
    std::lock_guard lock(_mutex);
    const FeedbackEvent *e = latest(athleteId, signature);
    if (e == nullptr || e->action != FeedbackAction::kDismiss)
        return false;
    return core::daysBetween(e->at, today) < cooldownDays;
}

bool FeedbackLog::isSaved(const core::AthleteId &athleteId, std::string_view signature) const
{
    std::lock_guard lock(_mutex);
    const FeedbackEvent *e = latest(athleteId, signature);
    return e != nullptr && e->action == FeedbackAction::kSave;
}

} // namespace tpo::insight

/**
 * @file FeedbackLog.hpp
 * @brief Per-athlete dismiss/save history for insights.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_INSIGHT_FEEDBACK_LOG_HPP
    #define TPO_INSIGHT_FEEDBACK_LOG_HPP

    #include <tpo/core/Date.hpp>
    #include <tpo/core/Expected.hpp>
    #include <tpo/core/NonCopyable.hpp>
    #include <tpo/core/Types.hpp>

    #include <mutex>
    #include <string>
    #include <string_view>
    #include <vector>

namespace tpo::insight {

enum class FeedbackAction : core::u8 {
    kDismiss = 0,
    kSave
};

[[nodiscard]] std::string_view feedbackActionName(FeedbackAction action) noexcept;

struct FeedbackEvent {
    core::AthleteId athleteId;
    std::string     signature;
    FeedbackAction  action{FeedbackAction::kDismiss};
    core::Date      at{};

    [[nodiscard]] bool operator==(const FeedbackEvent &) const = default;
};

/**
 * @brief Append-only feedback store.
 *
 * A dismissal suppresses the same signature for a cooldown; a save keeps
 * the insight visible and marks it as already seen. The latest event for a
 * signature wins.
 */
class FeedbackLog final : public core::NonCopyable<FeedbackLog> {
public:
    FeedbackLog()  = default;
    ~FeedbackLog() = default;

    /// @return kInvalidArgument for an empty athlete id or signature.
    [[nodiscard]] core::ExpectedVoid record(FeedbackEvent event);

    [[nodiscard]] std::vector<FeedbackEvent> events(const core::AthleteId &athleteId) const;

    /**
     * @brief True when the latest event for @p signature is a dismissal
     *        less than @p cooldownDays old on @p today.
     */
    [[nodiscard]] bool isSuppressed(const core::AthleteId &athleteId, std::string_view signature, core::Date today,
                                    core::i32 cooldownDays) const;

    /// @brief True when the latest event for @p signature is a save.
    [[nodiscard]] bool isSaved(const core::AthleteId &athleteId, std::string_view signature) const;

private:
    [[nodiscard]] const FeedbackEvent *latest(const core::AthleteId &athleteId, std::string_view signature) const;

    mutable std::mutex         _mutex;
    std::vector<FeedbackEvent> _events;
};

} // namespace tpo::insight

#endif // TPO_INSIGHT_FEEDBACK_LOG_HPP

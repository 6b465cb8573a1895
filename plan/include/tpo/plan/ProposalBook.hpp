/**
 * @file ProposalBook.hpp
 * @brief Thread-safe proposal store with atomic status transitions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TPO_PLAN_PROPOSAL_BOOK_HPP
    #define TPO_PLAN_PROPOSAL_BOOK_HPP

    #include "Proposal.hpp"

    #include <tpo/core/NonCopyable.hpp>

    #include <mutex>
    #include <optional>
    #include <string>
    #include <string_view>
    #include <unordered_map>
    #include <vector>

namespace tpo::plan {

struct ApplyReceipt {
    core::ProposalId           proposalId;
    std::string                idempotencyKey;
    core::u32                  actionsApplied{0};
    std::vector<WorkoutChange> changes;
    core::Date                 appliedAt{};

    [[nodiscard]] bool operator==(const ApplyReceipt &) const = default;
};

/**
 * @brief Result of a confirm or reject call.
 *
 * @c conflict is set when the proposal had already reached another
 * terminal status (or was applied under another key); @c status is then
 * the status it actually holds and @c diagnostics carries a
 * kProposalConflict entry. A failed apply records the apply error there.
 */
struct ProposalOutcome {
    ProposalStatus              status{ProposalStatus::kProposed};
    bool                        conflict{false};
    std::optional<ApplyReceipt> receipt;
    std::string                 message;
    core::Diagnostics           diagnostics;
};

/**
 * @brief Owns proposals and drives proposed → {confirmed → applied | failed,
 *        rejected}.
 *
 * Every transition happens under one lock, so concurrent confirm/reject
 * calls on the same proposal settle on exactly one terminal status. A
 * confirm retried with the same idempotency key returns the stored receipt
 * and applies nothing.
 */
class ProposalBook final : public core::NonCopyable<ProposalBook> {
public:
    ProposalBook()  = default;
    ~ProposalBook() = default;

    /// @brief Stores a freshly computed proposal. kAlreadyExists on id reuse.
    [[nodiscard]] core::ExpectedVoid add(PlanProposal proposal);

    [[nodiscard]] core::Expected<PlanProposal> find(const core::ProposalId &id) const;

    /**
     * @brief Confirms and applies a proposal to @p plan.
     *
     * A plan whose revision moved on marks the proposal failed; that is
     * reported through the outcome, not as an error.
     *
     * @return kNotFound for an unknown id, kInvalidArgument for an empty key.
     */
    [[nodiscard]] core::Expected<ProposalOutcome> confirm(const core::ProposalId &id, std::string_view idempotencyKey,
                                                          Plan &plan, core::Date appliedAt);

    /// @return kNotFound for an unknown id.
    [[nodiscard]] core::Expected<ProposalOutcome> reject(const core::ProposalId &id, std::string reason);

    /// @brief Proposals of @p athleteId, in no particular order.
    [[nodiscard]] std::vector<PlanProposal> proposalsFor(const core::AthleteId &athleteId) const;

    [[nodiscard]] core::usize size() const;

private:
    mutable std::mutex                                   _mutex;
    std::unordered_map<core::ProposalId, PlanProposal>   _proposals;
    std::unordered_map<core::ProposalId, ApplyReceipt>   _receipts;
};

} // namespace tpo::plan

#endif // TPO_PLAN_PROPOSAL_BOOK_HPP

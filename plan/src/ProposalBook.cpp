/**
 * @file ProposalBook.cpp
 * @brief Proposal status machine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <tpo/plan/ProposalBook.hpp>

#include <tpo/core/Log.hpp>

#include <format>

namespace tpo::plan {

core::ExpectedVoid ProposalBook::add(PlanProposal proposal)
{
    std::scoped_lock lock{_mutex};
    if (_proposals.contains(proposal.id))
        return core::makeError(core::ErrorCode::kAlreadyExists, std::format("proposal {} already exists", proposal.id));
    if (proposal.status != ProposalStatus::kProposed)
        return core::makeError(core::ErrorCode::kInvalidState,
                               std::format("proposal {} is {}", proposal.id, proposalStatusName(proposal.status)));
    core::ProposalId id = proposal.id;
    _proposals.emplace(std::move(id), std::move(proposal));
    return {};
}

core::Expected<PlanProposal> ProposalBook::find(const core::ProposalId &id) const
{
    std::scoped_lock lock{_mutex};
    const auto it = _proposals.find(id);
    if (it == _proposals.end())
        return core::makeError(core::ErrorCode::kNotFound, std::format("proposal {} not found", id));
    return it->second;
}

core::Expected<ProposalOutcome> ProposalBook::confirm(const core::ProposalId &id, std::string_view idempotencyKey,
                                                      Plan &plan, core::Date appliedAt)
{
    if (idempotencyKey.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "confirm needs an idempotency key");

    std::scoped_lock lock{_mutex};
    const auto it = _proposals.find(id);
    if (it == _proposals.end())
        return core::makeError(core::ErrorCode::kNotFound, std::format("proposal {} not found", id));
    PlanProposal &proposal = it->second;

    ProposalOutcome outcome;
    if (proposal.status == ProposalStatus::kApplied)
    {
        const ApplyReceipt &receipt = _receipts.at(id);
        outcome.status   = ProposalStatus::kApplied;
        outcome.receipt  = receipt;
        outcome.conflict = receipt.idempotencyKey != idempotencyKey;
        outcome.message  = outcome.conflict ? "already applied under another idempotency key" : "already applied";
        if (outcome.conflict)
            outcome.diagnostics.push_back({core::ErrorCode::kProposalConflict, outcome.message});
        return outcome;
    }
    if (isTerminal(proposal.status))
    {
        outcome.status   = proposal.status;
        outcome.conflict = true;
        outcome.message  = std::format("proposal is already {}", proposalStatusName(proposal.status));
        outcome.diagnostics.push_back({core::ErrorCode::kProposalConflict, outcome.message});
        core::Log::info("ProposalBook", std::format("confirm {} conflicts: {}", id, outcome.message));
        return outcome;
    }

    proposal.status = ProposalStatus::kConfirmed;
    auto applied    = applyProposal(plan, proposal);
    if (!applied)
    {
        proposal.status       = ProposalStatus::kFailed;
        proposal.statusReason = applied.error().message();
        outcome.status        = ProposalStatus::kFailed;
        outcome.message       = proposal.statusReason;
        outcome.diagnostics.push_back({applied.error().code(), proposal.statusReason});
        core::Log::warn("ProposalBook", std::format("proposal {} failed: {}", id, proposal.statusReason));
        return outcome;
    }

    ApplyReceipt receipt;
    receipt.proposalId     = id;
    receipt.idempotencyKey = std::string{idempotencyKey};
    receipt.actionsApplied = *applied;
    receipt.changes        = proposal.diff;
    receipt.appliedAt      = appliedAt;

    proposal.status = ProposalStatus::kApplied;
    _receipts.insert_or_assign(id, receipt);

    outcome.status  = ProposalStatus::kApplied;
    outcome.receipt = std::move(receipt);
    outcome.message = std::format("plan revision {}", plan.revision);
    core::Log::info("ProposalBook", std::format("proposal {} applied: {} actions, plan revision {}", id, *applied,
                                                plan.revision));
    return outcome;
}

core::Expected<ProposalOutcome> ProposalBook::reject(const core::ProposalId &id, std::string reason)
{
    std::scoped_lock lock{_mutex};
    const auto it = _proposals.find(id);
    if (it == _proposals.end())
        return core::makeError(core::ErrorCode::kNotFound, std::format("proposal {} not found", id));
    PlanProposal &proposal = it->second;

    ProposalOutcome outcome;
    if (proposal.status != ProposalStatus::kProposed)
    {
        outcome.status   = proposal.status;
        outcome.conflict = true;
        outcome.message  = std::format("proposal is already {}", proposalStatusName(proposal.status));
        outcome.diagnostics.push_back({core::ErrorCode::kProposalConflict, outcome.message});
        if (const auto receipt = _receipts.find(id); receipt != _receipts.end())
            outcome.receipt = receipt->second;
        return outcome;
    }

    proposal.status       = ProposalStatus::kRejected;
    proposal.statusReason = std::move(reason);
    outcome.status        = ProposalStatus::kRejected;
    outcome.message       = proposal.statusReason;
    core::Log::info("ProposalBook", std::format("proposal {} rejected: {}", id, proposal.statusReason));
    return outcome;
}

std::vector<PlanProposal> ProposalBook::proposalsFor(const core::AthleteId &athleteId) const
{
    std::scoped_lock lock{_mutex};
    std::vector<PlanProposal> out;
    for (const auto &[id, proposal] : _proposals)
        if (proposal.athleteId == athleteId)
            out.push_back(proposal);
    return out;
}

core::usize ProposalBook::size() const
{
    std::scoped_lock lock{_mutex};
    return _proposals.size();
}

} // namespace tpo::plan

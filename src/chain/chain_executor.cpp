/// @file src/chain/chain_executor.cpp
/// @brief Atomic execution of a leverage chain against a StepCollaborator.

#include "flash/chain.hpp"
#include "flash/log.hpp"
#include "flash/tau.hpp"

#include "../core/deadline.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <mutex>
#include <optional>
#include <utility>

namespace flash::chain {

namespace {

constexpr std::string_view COMPONENT = "chain";

/// Hand-off between a step worker and the caller that may stop waiting for it.
/// Whichever side arrives second owns the receipt: a worker finishing after the
/// caller gave up reverts it itself, a caller giving up after the worker
/// finished takes the receipt into its unwind journal.
struct StepHandoff {
    std::mutex                 mutex;
    bool                       abandoned{false};
    std::optional<StepReceipt> delivered;
};

} // namespace

ChainExecutor::ChainExecutor(ChainConfig config,
                             std::shared_ptr<StepCollaborator> collaborator)
    : config_(config)
    , collaborator_(std::move(collaborator))
{}

// ─── ChainExecutor::unwind ────────────────────────────────────────────────────

std::size_t ChainExecutor::unwind(const std::vector<StepReceipt>& journal) const {
    std::size_t failed = 0;
    for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
        auto collaborator = collaborator_;
        StepReceipt receipt = *it;
        auto reverted = detail::run_with_deadline(
            [collaborator, receipt] { return collaborator->revert(receipt); },
            config_.step_timeout, "chain revert");
        if (!reverted.value_or(false)) {
            ++failed;
            log::error(COMPONENT, "revert of step {} ('{}') failed",
                       receipt.index, receipt.reference);
        }
    }
    return failed;
}

// ─── ChainExecutor::execute ───────────────────────────────────────────────────

Result<ChainOutcome>
ChainExecutor::execute(const ChainContext& ctx, std::span<const ChainStep> steps,
                       const RiskGate& gate) const {
    // Reject malformed chains before touching the outside world.
    auto target = evaluate_chain(ctx.base_leverage, steps, ctx.tau, config_);
    if (!target) {
        log::debug(COMPONENT, "position {} chain rejected: {}",
                   ctx.position, target.error().to_string());
        return target.error();
    }
    if (!collaborator_ && !steps.empty()) {
        return make_error(ErrorCode::ChainStepFailed, "no step collaborator configured");
    }

    const double bonus = tau::ConcentrationCalculator::bonus(ctx.tau, config_.tau_bonus);

    auto consult = [&gate](double leverage) -> Status {
        return gate ? gate(leverage) : ok();
    };

    std::vector<StepReceipt> applied;
    applied.reserve(steps.size());

    auto abort_with = [&](Error err) -> Result<ChainOutcome> {
        const std::size_t failed_reverts = unwind(applied);
        log::warn(COMPONENT, "position {} chain unwound after {} of {} steps: {}",
                  ctx.position, applied.size(), steps.size(), err.to_string());
        if (failed_reverts > 0) {
            err.detail += fmt::format(" ({} revert(s) failed)", failed_reverts);
        }
        return err;
    };

    double running = ctx.base_leverage;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        double next = running * steps[i].multiplier();
        if (config_.bonus_mode == BonusMode::PerStep) next *= bonus;
        next = std::min(next, config_.global_cap);

        if (auto verdict = consult(next); !verdict) {
            return abort_with(verdict.error());
        }

        const StepRequest request{
            .market          = ctx.market,
            .position        = ctx.position,
            .index           = i,
            .action          = steps[i].action(),
            .multiplier      = steps[i].multiplier(),
            .leverage_before = running,
            .leverage_after  = next,
        };

        auto collaborator = collaborator_;
        auto handoff      = std::make_shared<StepHandoff>();
        auto answer = detail::run_with_deadline(
            [collaborator, request, handoff] {
                auto receipt = collaborator->apply(request);
                if (!receipt) return receipt;
                std::lock_guard lock(handoff->mutex);
                if (!handoff->abandoned) {
                    handoff->delivered = receipt;
                    return receipt;
                }
                if (collaborator->revert(*receipt)) {
                    log::warn(COMPONENT, "position {} step {} applied after timeout; reverted",
                              request.position, request.index);
                } else {
                    log::error(COMPONENT, "position {} step {} applied after timeout; revert failed",
                               request.position, request.index);
                }
                return std::optional<StepReceipt>{};
            },
            config_.step_timeout, "chain step");

        if (!answer) {
            {
                std::lock_guard lock(handoff->mutex);
                handoff->abandoned = true;
                // The worker finished between the deadline and now: unwind it too.
                if (handoff->delivered) applied.push_back(std::move(*handoff->delivered));
            }
            collaborator_->cancel(request);
            return abort_with(make_error(ErrorCode::ChainStepFailed,
                                         fmt::format("step {} ({}) timed out",
                                                     i, to_string(request.action))));
        }
        if (!answer->has_value()) {
            return abort_with(make_error(ErrorCode::ChainStepFailed,
                                         fmt::format("step {} ({}) refused",
                                                     i, to_string(request.action))));
        }

        applied.push_back(std::move(**answer));
        running = next;
    }

    if (auto verdict = consult(*target); !verdict) {
        return abort_with(verdict.error());
    }

    log::info(COMPONENT, "position {} leverage {:.4f}x -> {:.4f}x over {} step(s)",
              ctx.position, ctx.base_leverage, *target, steps.size());
    return ChainOutcome{
        .effective_leverage = *target,
        .receipts           = std::move(applied),
    };
}

} // namespace flash::chain

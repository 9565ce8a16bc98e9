/// @file src/risk/risk_controller.cpp
/// @brief Risk gate and GlobalRiskState.

#include "flash/risk.hpp"
#include "flash/log.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <mutex>

namespace flash::risk {

namespace {

constexpr std::string_view COMPONENT = "risk";

} // namespace

bool RiskConfig::is_admin(std::string_view actor) const noexcept {
    return std::find(admins.begin(), admins.end(), actor) != admins.end();
}

double collateral_ratio(double collateral, double stake) noexcept {
    if (!std::isfinite(stake) || stake <= 0.0 || !std::isfinite(collateral)) return 0.0;
    return collateral / stake;
}

// ─── check ────────────────────────────────────────────────────────────────────

Status check(const RiskConfig& cfg, const RiskRequest& req) {
    if (cfg.paused) {
        return make_error(ErrorCode::EmergencyPause, "emergency halt engaged");
    }
    if (!std::isfinite(req.leverage) || req.leverage < 1.0) {
        return make_error(ErrorCode::InvalidAmount,
                          fmt::format("leverage {}", req.leverage));
    }
    if (!std::isfinite(req.stake) || req.stake <= 0.0) {
        return make_error(ErrorCode::InvalidAmount, fmt::format("stake {}", req.stake));
    }
    if (req.leverage > req.market_ceiling) {
        return make_error(ErrorCode::LeverageExceedsCeiling,
                          fmt::format("{}x > market ceiling {}x",
                                      req.leverage, req.market_ceiling));
    }
    if (req.leverage > cfg.global_leverage_cap) {
        return make_error(ErrorCode::LeverageExceedsGlobalCap,
                          fmt::format("{}x > global cap {}x",
                                      req.leverage, cfg.global_leverage_cap));
    }
    const double ratio = collateral_ratio(req.collateral, req.stake);
    if (ratio < cfg.liquidation_threshold) {
        return make_error(ErrorCode::UndercollateralizedPosition,
                          fmt::format("collateral ratio {:.4f} < {:.4f}",
                                      ratio, cfg.liquidation_threshold));
    }
    return ok();
}

// ─── GlobalRiskState ──────────────────────────────────────────────────────────

GlobalRiskState::GlobalRiskState(RiskConfig initial, const Clock& clock)
    : current_(std::make_shared<const RiskConfig>(std::move(initial)))
    , clock_(clock)
{}

RiskSnapshot GlobalRiskState::snapshot() const {
    std::shared_lock lock(mutex_);
    return current_;
}

bool GlobalRiskState::paused() const {
    return snapshot()->paused;
}

Status GlobalRiskState::pause(std::string_view actor, std::string reason) {
    return set_paused(true, actor, std::move(reason));
}

Status GlobalRiskState::unpause(std::string_view actor, std::string reason) {
    return set_paused(false, actor, std::move(reason));
}

Status GlobalRiskState::set_paused(bool paused, std::string_view actor,
                                   std::string reason) {
    std::unique_lock lock(mutex_);
    if (!current_->is_admin(actor)) {
        log::warn(COMPONENT, "rejected {} by '{}': not an admin",
                  paused ? "pause" : "unpause", actor);
        return make_error(ErrorCode::Unauthorized, fmt::format("actor '{}'", actor));
    }

    // Copy-on-write: readers holding the old snapshot keep a consistent view.
    auto next    = std::make_shared<RiskConfig>(*current_);
    next->paused = paused;
    current_     = std::move(next);

    audit_.push_back(AuditEntry{
        .at     = clock_.now(),
        .actor  = std::string(actor),
        .paused = paused,
        .reason = reason,
    });
    log::info(COMPONENT, "emergency halt {} by '{}': {}",
              paused ? "ENGAGED" : "lifted", actor, reason);
    return ok();
}

std::vector<AuditEntry> GlobalRiskState::audit_trail() const {
    std::shared_lock lock(mutex_);
    return audit_;
}

} // namespace flash::risk

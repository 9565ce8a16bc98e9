#include <gtest/gtest.h>
#include "flash/chain.hpp"
#include "flash/tau.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace flash;
using namespace flash::chain;
using namespace std::chrono_literals;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Scriptable step collaborator. Every call is journalled.
class ScriptedSteps final : public StepCollaborator {
public:
    std::optional<std::size_t> refuse_at;
    std::optional<std::size_t> stall_at;
    std::optional<std::size_t> throw_at;
    bool                       revert_ok{true};
    std::chrono::milliseconds  stall{300ms};

    std::optional<StepReceipt> apply(const StepRequest& req) override {
        if (stall_at && req.index == *stall_at) {
            std::this_thread::sleep_for(stall);
        }
        if (throw_at && req.index == *throw_at) {
            throw std::runtime_error("venue unavailable");
        }
        std::lock_guard lock(mutex_);
        requests_.push_back(req);
        if (refuse_at && req.index == *refuse_at) return std::nullopt;
        applied_.push_back(req.index);
        return StepReceipt{.index = req.index, .reference = "r" + std::to_string(req.index)};
    }

    bool revert(const StepReceipt& receipt) override {
        std::lock_guard lock(mutex_);
        reverted_.push_back(receipt.index);
        return revert_ok;
    }

    void cancel(const StepRequest& req) noexcept override {
        std::lock_guard lock(mutex_);
        cancelled_.push_back(req.index);
    }

    std::vector<std::size_t> applied() const   { std::lock_guard l(mutex_); return applied_; }
    std::vector<std::size_t> reverted() const  { std::lock_guard l(mutex_); return reverted_; }
    std::vector<std::size_t> cancelled() const { std::lock_guard l(mutex_); return cancelled_; }
    std::vector<StepRequest> requests() const  { std::lock_guard l(mutex_); return requests_; }

private:
    mutable std::mutex       mutex_;
    std::vector<std::size_t> applied_;
    std::vector<std::size_t> reverted_;
    std::vector<std::size_t> cancelled_;
    std::vector<StepRequest> requests_;
};

std::vector<ChainStep> abc() {
    std::vector<ChainStep> out;
    for (auto a : {ChainAction::AmplifyA, ChainAction::AmplifyB, ChainAction::AmplifyC}) {
        out.push_back(*ChainStep::make(a));
    }
    return out;
}

ChainContext context(double base = 100.0) {
    return ChainContext{
        .market        = 1,
        .position      = 42,
        .base_leverage = base,
        .tau           = tau::ConcentrationCalculator::compute(30.0),
    };
}

ChainConfig fast_config() {
    ChainConfig cfg;
    cfg.step_timeout = 50ms;
    return cfg;
}

} // namespace

// ─── Success ─────────────────────────────────────────────────────────────────

TEST(ChainExecutor_Execute, AllStepsApplied) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    auto r = exec.execute(context(), steps, {});
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->effective_leverage, 212.85, 1e-9);
    ASSERT_EQ(r->receipts.size(), 3u);
    EXPECT_EQ(r->receipts[2].reference, "r2");
    EXPECT_TRUE(steps_impl->reverted().empty());
}

TEST(ChainExecutor_Execute, RequestsCarryRunningLeverage) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    ASSERT_TRUE(exec.execute(context(), steps, {}).has_value());
    const auto reqs = steps_impl->requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_DOUBLE_EQ(reqs[0].leverage_before, 100.0);
    EXPECT_DOUBLE_EQ(reqs[0].leverage_after, 150.0);
    EXPECT_DOUBLE_EQ(reqs[1].leverage_after, 180.0);
    EXPECT_NEAR(reqs[2].leverage_after, 198.0, 1e-9);
    EXPECT_EQ(reqs[1].action, ChainAction::AmplifyB);
    EXPECT_EQ(reqs[0].position, 42u);
}

TEST(ChainExecutor_Execute, EmptyChainNeedsNoCollaborator) {
    ChainExecutor exec(ChainConfig{}, nullptr);
    auto r = exec.execute(context(), {}, {});
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->effective_leverage, 107.5, 1e-9);
}

// ─── Rejection before any call ───────────────────────────────────────────────

TEST(ChainExecutor_Reject, TooLongTouchesNothing) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const std::vector<ChainStep> steps(6, *ChainStep::make(ChainAction::AmplifyC));

    auto r = exec.execute(context(), steps, {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.code(), ErrorCode::ChainTooLong);
    EXPECT_TRUE(steps_impl->requests().empty());
}

TEST(ChainExecutor_Reject, MissingCollaborator) {
    ChainExecutor exec(ChainConfig{}, nullptr);
    const auto steps = abc();
    EXPECT_EQ(exec.execute(context(), steps, {}).code(), ErrorCode::ChainStepFailed);
}

// ─── Unwind ──────────────────────────────────────────────────────────────────

TEST(ChainExecutor_Unwind, RefusedStepRevertsInReverse) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    steps_impl->refuse_at = 2;
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    auto r = exec.execute(context(), steps, {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.code(), ErrorCode::ChainStepFailed);
    EXPECT_EQ(steps_impl->applied(), (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(steps_impl->reverted(), (std::vector<std::size_t>{1, 0}));
}

TEST(ChainExecutor_Unwind, FirstStepRefusedNothingToRevert) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    steps_impl->refuse_at = 0;
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    EXPECT_EQ(exec.execute(context(), steps, {}).code(), ErrorCode::ChainStepFailed);
    EXPECT_TRUE(steps_impl->reverted().empty());
}

TEST(ChainExecutor_Unwind, ThrowingStepTreatedAsFailure) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    steps_impl->throw_at = 1;
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    EXPECT_EQ(exec.execute(context(), steps, {}).code(), ErrorCode::ChainStepFailed);
    EXPECT_EQ(steps_impl->reverted(), (std::vector<std::size_t>{0}));
}

TEST(ChainExecutor_Unwind, TimeoutCancelsAndReverts) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    steps_impl->stall_at = 1;
    ChainExecutor exec(fast_config(), steps_impl);
    const auto steps = abc();

    auto r = exec.execute(context(), steps, {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.code(), ErrorCode::ChainStepFailed);
    EXPECT_EQ(steps_impl->cancelled(), (std::vector<std::size_t>{1}));
    EXPECT_EQ(steps_impl->reverted(), (std::vector<std::size_t>{0}));

    // The stalled step still lands once its worker wakes up; it must be undone.
    std::this_thread::sleep_for(steps_impl->stall + 100ms);
    EXPECT_EQ(steps_impl->applied(), (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(steps_impl->reverted(), (std::vector<std::size_t>{0, 1}));
}

TEST(ChainExecutor_Unwind, LateApplyLeavesNoNetEffect) {
    // Counts live applications: +1 per apply, -1 per revert.
    class CountingSteps final : public StepCollaborator {
    public:
        std::optional<StepReceipt> apply(const StepRequest& req) override {
            if (req.index == 1) std::this_thread::sleep_for(200ms);
            std::lock_guard lock(mutex_);
            ++live_;
            return StepReceipt{.index = req.index, .reference = "c" + std::to_string(req.index)};
        }
        bool revert(const StepReceipt&) override {
            std::lock_guard lock(mutex_);
            --live_;
            return true;
        }
        int live() const { std::lock_guard l(mutex_); return live_; }

    private:
        mutable std::mutex mutex_;
        int                live_{0};
    };

    auto steps_impl = std::make_shared<CountingSteps>();
    ChainExecutor exec(fast_config(), steps_impl);
    const auto steps = abc();

    EXPECT_EQ(exec.execute(context(), steps, {}).code(), ErrorCode::ChainStepFailed);
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(steps_impl->live(), 0);
}

TEST(ChainExecutor_Unwind, FailedRevertReported) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    steps_impl->refuse_at = 2;
    steps_impl->revert_ok = false;
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    auto r = exec.execute(context(), steps, {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.code(), ErrorCode::ChainStepFailed);
    EXPECT_NE(r.error().detail.find("2 revert(s) failed"), std::string::npos);
}

// ─── Risk gate ───────────────────────────────────────────────────────────────

TEST(ChainExecutor_Gate, VetoMidChainUnwinds) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    const RiskGate gate = [](double leverage) -> Status {
        if (leverage > 160.0) return make_error(ErrorCode::LeverageExceedsCeiling, "test ceiling");
        return ok();
    };
    auto r = exec.execute(context(), steps, gate);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.code(), ErrorCode::LeverageExceedsCeiling);
    EXPECT_EQ(steps_impl->applied(), (std::vector<std::size_t>{0}));
    EXPECT_EQ(steps_impl->reverted(), (std::vector<std::size_t>{0}));
}

TEST(ChainExecutor_Gate, FinalValueChecked) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    // Every step stays under 200x but the bonus lifts the result to 212.85x.
    const RiskGate gate = [](double leverage) -> Status {
        if (leverage > 200.0) return make_error(ErrorCode::LeverageExceedsGlobalCap, "test cap");
        return ok();
    };
    auto r = exec.execute(context(), steps, gate);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.code(), ErrorCode::LeverageExceedsGlobalCap);
    EXPECT_EQ(steps_impl->reverted(), (std::vector<std::size_t>{2, 1, 0}));
}

TEST(ChainExecutor_Gate, PausedGateStopsBeforeFirstCall) {
    auto steps_impl = std::make_shared<ScriptedSteps>();
    ChainExecutor exec(ChainConfig{}, steps_impl);
    const auto steps = abc();

    const RiskGate gate = [](double) -> Status {
        return make_error(ErrorCode::EmergencyPause, "halt");
    };
    EXPECT_EQ(exec.execute(context(), steps, gate).code(), ErrorCode::EmergencyPause);
    EXPECT_TRUE(steps_impl->requests().empty());
}

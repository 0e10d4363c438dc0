#include "engine/trading_engine.hpp"
#include "common/logging.hpp"

#include <iomanip>
#include <ostream>

namespace ramm {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr Regime kAllRegimes[] = {
    Regime::Calibrating, Regime::Normal, Regime::Stressed,
    Regime::Crash, Regime::Hft, Regime::Recovery,
};

} // anonymous namespace

TradingEngine::TradingEngine(const EngineConfig& config,
                             std::string client_name,
                             IExecutionGateway& gateway,
                             StepLogger* step_log)
    : router_(config),
      orders_(config.orders, std::move(client_name), gateway),
      gateway_(gateway),
      step_log_(step_log),
      log_(get_logger("engine")) {}

bool TradingEngine::dispatch(const EngineEvent& event) {
    return std::visit(overloaded{
        [this](const SnapshotEvent& ev)      { on_snapshot(ev); return true; },
        [this](const FillEvent& ev)          { on_fill(ev); return true; },
        [this](const ErrorEvent& ev)         { on_error(ev); return true; },
        [this](const AuthenticatedEvent& ev) { on_authenticated(ev); return true; },
        [this](const DisconnectedEvent& ev) {
            if (ev.error) {
                log_->error("disconnected: {}", ev.reason);
            } else {
                log_->info("disconnected: {}", ev.reason);
            }
            return false;
        },
    }, event);
}

void TradingEngine::run(EngineEventQueue& queue) {
    while (dispatch(queue.wait_and_pop())) {
    }
}

bool TradingEngine::drain(EngineEventQueue& queue) {
    EngineEvent ev;
    while (queue.try_pop(ev)) {
        if (!dispatch(ev)) return false;
    }
    return true;
}

void TradingEngine::on_snapshot(const SnapshotEvent& ev) {
    const MarketSnapshot& snap = ev.snapshot;

    if (last_done_) {
        auto dt = std::chrono::duration<double, std::milli>(ev.received - *last_done_);
        step_latency_.record(dt.count());
    }

    if (snap.mid > 0.0) {
        last_mid_ = snap.mid;
        orders_.mark(last_mid_);
    }

    last_decision_ = router_.decide(snap, orders_.position().inventory, orders_.resting_exposure());
    if (!last_decision_) ++bad_quotes_;

    const Regime regime = router_.regime_state().current;
    orders_.expire_stale(snap.step, regime);

    std::optional<OrderRecord> action;
    if (last_decision_ && last_decision_->order) {
        const OrderIntent& intent = *last_decision_->order;
        auto result = orders_.submit(intent, snap.step, regime);
        if (result.status == SubmitStatus::Accepted) {
            action = OrderRecord{
                .id             = result.order_id,
                .side           = intent.side,
                .price          = intent.price,
                .qty            = intent.qty,
                .submitted_step = snap.step,
            };
        } else if (result.status == SubmitStatus::Deferred) {
            ++orders_deferred_;
        }
    }

    ++steps_;
    ++regime_steps_[static_cast<size_t>(regime)];

    if (step_log_) {
        StepRecord rec;
        rec.snapshot = &snap;
        rec.position = orders_.position();
        rec.regime   = regime;
        rec.action   = action;
        rec.fills    = std::move(fills_since_step_);
        step_log_->log_step(rec);
    }
    fills_since_step_.clear();

    gateway_.signal_done();
    last_done_ = std::chrono::steady_clock::now();

    if (snap.step > 0 && snap.step % kProgressInterval == 0) {
        log_progress(snap.step);
    }
}

void TradingEngine::on_fill(const FillEvent& ev) {
    auto result = orders_.on_fill(ev.fill, last_mid_);
    fills_since_step_.push_back(LoggedFill{ev.fill, result.latency_ms});
}

void TradingEngine::on_error(const ErrorEvent& ev) {
    ++errors_;
    log_->error("exchange error: {}", ev.message);
}

void TradingEngine::on_authenticated(const AuthenticatedEvent& /*ev*/) {
    log_->info("order channel authenticated");
}

void TradingEngine::log_progress(int64_t step) const {
    const auto& pos = orders_.position();
    log_->info("step {} | orders {} | inventory {} | pnl {:.2f} | regime {} | avg step latency {:.2f} ms",
               step, pos.orders_sent, pos.inventory, pos.pnl,
               to_string(router_.regime_state().current), step_latency_.avg_ms());
}

EngineStats TradingEngine::stats() const {
    const auto& pos = orders_.position();
    EngineStats s;
    s.steps           = steps_;
    s.orders_sent     = pos.orders_sent;
    s.orders_deferred = orders_deferred_;
    s.cancels_sent    = orders_.cancels_sent();
    s.fills           = orders_.fills_received();
    s.errors          = errors_;
    s.bad_quotes      = bad_quotes_;
    s.inventory       = pos.inventory;
    s.cash_flow       = pos.cash_flow;
    s.pnl             = pos.pnl;
    s.regime_steps    = regime_steps_;
    s.step_latency    = step_latency_;
    s.fill_latency    = orders_.fill_latency();
    return s;
}

void TradingEngine::print_final_results(std::ostream& os) const {
    auto s = stats();
    os << std::fixed << std::setprecision(2);
    os << "\n=== Final Results ===\n";
    os << "  Steps:           " << s.steps << "\n";
    os << "  Orders sent:     " << s.orders_sent << "\n";
    os << "  Orders deferred: " << s.orders_deferred << "\n";
    os << "  Cancels sent:    " << s.cancels_sent << "\n";
    os << "  Fills:           " << s.fills << "\n";
    os << "  Inventory:       " << s.inventory << "\n";
    os << "  Cash flow:       " << s.cash_flow << "\n";
    os << "  PnL:             " << s.pnl << "\n";

    os << "\n  Regime steps:\n";
    for (Regime r : kAllRegimes) {
        os << "    " << std::left << std::setw(12) << to_string(r) << std::right
           << s.regime_steps[static_cast<size_t>(r)] << "\n";
    }

    os << "\n  Step latency (ms): avg " << s.step_latency.avg_ms()
       << " min " << s.step_latency.min_or_zero()
       << " max " << s.step_latency.max_ms
       << " (" << s.step_latency.count << " samples)\n";
    os << "  Fill latency (ms): avg " << s.fill_latency.avg_ms()
       << " min " << s.fill_latency.min_or_zero()
       << " max " << s.fill_latency.max_ms
       << " (" << s.fill_latency.count << " samples)\n";
}

} // namespace ramm

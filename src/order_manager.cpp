#include "execution/order_manager.hpp"
#include "common/logging.hpp"

#include <algorithm>

namespace ramm {

OrderLifecycleManager::OrderLifecycleManager(const OrderManagerParams& params,
                                             std::string client_name,
                                             IExecutionGateway& gateway)
    : params_(params),
      client_name_(std::move(client_name)),
      gateway_(gateway),
      log_(get_logger("orders")) {}

bool OrderLifecycleManager::is_resting(const std::string& order_id) const {
    return buys_.count(order_id) > 0 || sells_.count(order_id) > 0;
}

RestingExposure OrderLifecycleManager::resting_exposure() const {
    RestingExposure e;
    for (const auto& [id, order] : buys_) e.buy_qty += order.qty;
    for (const auto& [id, order] : sells_) e.sell_qty += order.qty;
    return e;
}

std::string OrderLifecycleManager::next_order_id(int64_t step) const {
    return "ORD_" + client_name_ + "_" + std::to_string(step) + "_" +
           std::to_string(position_.orders_sent);
}

void OrderLifecycleManager::cancel(const std::string& order_id) {
    buys_.erase(order_id);
    sells_.erase(order_id);
    send_times_.erase(order_id);
    gateway_.cancel_order(order_id);
    ++cancels_sent_;
}

std::vector<std::string> OrderLifecycleManager::cancel_crossing(const OrderIntent& intent) {
    std::vector<std::string> ids;
    if (intent.side == OrderSide::Buy) {
        for (const auto& [id, rec] : sells_) {
            if (rec.price <= intent.price) ids.push_back(id);
        }
    } else {
        for (const auto& [id, rec] : buys_) {
            if (rec.price >= intent.price) ids.push_back(id);
        }
    }
    for (const auto& id : ids) cancel(id);
    return ids;
}

std::vector<std::string> OrderLifecycleManager::cancel_oldest(size_t n) {
    std::vector<const OrderRecord*> all;
    all.reserve(open_order_count());
    for (const auto& [id, rec] : buys_)  all.push_back(&rec);
    for (const auto& [id, rec] : sells_) all.push_back(&rec);

    std::sort(all.begin(), all.end(), [](const OrderRecord* a, const OrderRecord* b) {
        if (a->submitted_step != b->submitted_step) return a->submitted_step < b->submitted_step;
        return a->id < b->id;
    });

    std::vector<std::string> ids;
    for (size_t i = 0; i < std::min(n, all.size()); ++i) {
        ids.push_back(all[i]->id);
    }
    for (const auto& id : ids) cancel(id);
    return ids;
}

SubmitResult OrderLifecycleManager::submit(const OrderIntent& intent, int64_t step, Regime regime) {
    SubmitResult result;
    if (intent.price <= 0.0 || intent.qty <= 0) {
        log_->warn("step {}: rejected {} {}@{:.2f} in {}", step, to_string(intent.side),
                   intent.qty, intent.price, to_string(regime));
        return result;
    }

    result.cancelled = cancel_crossing(intent);
    if (!result.cancelled.empty()) {
        log_->debug("step {}: cancelled {} self-crossing orders", step, result.cancelled.size());
    }

    if (open_order_count() >= params_.max_open_orders) {
        auto freed = cancel_oldest(params_.cancel_batch);
        log_->debug("step {}: {} resting orders at cap, cancelled {} oldest",
                    step, open_order_count() + freed.size(), freed.size());
        result.cancelled.insert(result.cancelled.end(), freed.begin(), freed.end());
        result.status = SubmitStatus::Deferred;
        return result;
    }

    OrderRecord rec{
        .id             = next_order_id(step),
        .side           = intent.side,
        .price          = intent.price,
        .qty            = intent.qty,
        .submitted_step = step,
    };

    auto& book = (rec.side == OrderSide::Buy) ? buys_ : sells_;
    book[rec.id] = rec;
    gateway_.send_order(rec);
    send_times_[rec.id] = Clock::now();
    ++position_.orders_sent;

    log_->debug("step {}: sent {} {} {}@{:.2f} ({})", step, rec.id, to_string(rec.side),
                rec.qty, rec.price, to_string(regime));

    result.status   = SubmitStatus::Accepted;
    result.order_id = rec.id;
    return result;
}

std::vector<std::string> OrderLifecycleManager::expire_stale(int64_t step, Regime regime) {
    if (params_.stale_check_interval <= 0 || step % params_.stale_check_interval != 0) {
        return {};
    }

    const int64_t max_age = (regime == Regime::Hft) ? params_.stale_after_steps_hft
                                                    : params_.stale_after_steps;
    std::vector<std::string> ids;
    for (const auto* book : {&buys_, &sells_}) {
        for (const auto& [id, rec] : *book) {
            if (step - rec.submitted_step > max_age) ids.push_back(id);
        }
    }
    for (const auto& id : ids) cancel(id);

    if (!ids.empty()) {
        log_->debug("step {}: expired {} stale orders (max age {})", step, ids.size(), max_age);
    }
    return ids;
}

FillResult OrderLifecycleManager::on_fill(const Fill& fill, double last_mid) {
    FillResult result;
    result.known = buys_.erase(fill.order_id) > 0;
    result.known = (sells_.erase(fill.order_id) > 0) || result.known;

    auto sent = send_times_.find(fill.order_id);
    if (sent != send_times_.end()) {
        auto elapsed = std::chrono::duration<double, std::milli>(Clock::now() - sent->second);
        result.latency_ms = elapsed.count();
        fill_latency_.record(elapsed.count());
        send_times_.erase(sent);
    }

    position_.apply_fill(fill.side, fill.price, fill.qty, last_mid);
    ++fills_received_;

    log_->info("fill {} {} {}@{:.2f} -> inventory {} pnl {:.2f}{}",
               fill.order_id, to_string(fill.side), fill.qty, fill.price,
               position_.inventory, position_.pnl, result.known ? "" : " (unknown id)");
    return result;
}

} // namespace ramm

#include "stockline/inventory_client.hpp"
#include "stockline/client.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/logging.hpp"

#include <set>

namespace stockline {

namespace {

constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

LogOptions log_options(const Config& config) {
    LogOptions options;
    options.max_pending_ops = config.max_pending_ops;
    return options;
}

} // anonymous namespace

InventoryClient::InventoryClient(Config config, NotificationSink* sink)
    : InventoryClient(config,
                      std::make_unique<FileStore>(config.data_dir, config.storage_capacity_bytes),
                      RemoteStoreClient::connect(config.remote_endpoint, config.remote_timeout),
                      sink) {}

InventoryClient::InventoryClient(Config config, std::unique_ptr<DurableStore> store,
                                 std::unique_ptr<RemoteStore> remote, NotificationSink* sink)
    : config_(std::move(config)),
      store_(std::move(store)),
      remote_(std::move(remote)),
      monitor_(*store_, config_.warning_ttl),
      cache_(*store_, &monitor_),
      log_(*store_, log_options(config_), &monitor_),
      connectivity_(true),
      writer_(cache_, log_, remote_.get(), connectivity_),
      processor_(log_, *remote_,
                 SyncOptions{config_.retry_budget,
                             [this](const PendingOperation& op) { on_synced(op); }}),
      resolver_(log_),
      orchestrator_(cache_, writer_, sink),
      guard_(*store_, cache_),
      realtime_(cache_, config_.realtime_window),
      scheduler_(processor_, connectivity_, &monitor_,
                 SchedulerOptions{config_.sync_interval, config_.health_check_interval}) {
    monitor_.set_cleanup_hook([this](double percent_used) { prune_for(percent_used); });
    scheduler_.attach_realtime(&realtime_);
}

InventoryClient::~InventoryClient() {
    stop();
}

GuardDecision InventoryClient::open() {
    log_.load();
    cache_.load();
    monitor_.check();

    GuardDecision decision;
    if (connectivity_.online()) {
        decision = guard_.evaluate(*remote_);
    }
    if (decision.blocked) {
        guard_reason_ = decision.reason;
        guard_blocked_ = true;
        writer_.hold(decision.reason);
    } else {
        guard_blocked_ = false;
        writer_.release();
        refresh();
    }
    log_info("client", "opened", {
        {"pending", log_.summary().pending},
        {"conflicts", log_.summary().conflicts},
        {"guard_blocked", decision.blocked}
    });
    return decision;
}

void InventoryClient::acknowledge_guard() {
    guard_.acknowledge();
    guard_blocked_ = false;
    writer_.release();
    refresh();
}

void InventoryClient::refresh() {
    if (!connectivity_.online()) return;

    std::set<Entity> busy;
    for (const auto& op : log_.all()) {
        busy.insert(op.entity);
    }

    for (auto entity : {Entity::Items, Entity::Transactions, Entity::Categories,
                        Entity::Contractors, Entity::Users}) {
        if (busy.count(entity)) continue;
        try {
            cache_.replace_all(entity, remote_->list(entity));
        } catch (const ClientError& e) {
            if (!is_transient(e)) throw;
            log_warn("client", "refresh_interrupted",
                     {{"entity", to_string(entity)}, {"error", e.what()}});
            return;
        }
    }
    cache_.mark_synced(helpers::now_millis());
}

void InventoryClient::start() {
    if (guard_blocked_) {
        log_warn("client", "start_refused", {{"reason", guard_reason_}});
        throw GuardBlockedError(guard_reason_);
    }
    scheduler_.start();
}

void InventoryClient::stop() {
    scheduler_.stop();
}

void InventoryClient::prune_for(double percent_used) {
    auto days = retention_days_for(percent_used);
    auto cutoff = helpers::now_millis() - days * kMillisPerDay;
    try {
        cache_.prune_transactions(cutoff);
    } catch (const StorageError& e) {
        log_error("client", "cleanup_failed", {{"error", e.what()}, {"retention_days", days}});
    }
}

void InventoryClient::on_synced(const PendingOperation& op) {
    try {
        writer_.adopt_remote_stamp(op);
    } catch (const ClientError& e) {
        log_warn("client", "stamp_refresh_failed", {{"op_id", op.id}, {"error", e.what()}});
    }
    try {
        cache_.mark_synced(helpers::now_millis());
    } catch (const StorageError& e) {
        log_warn("client", "last_sync_not_saved", {{"op_id", op.id}, {"error", e.what()}});
    }
}

} // namespace stockline

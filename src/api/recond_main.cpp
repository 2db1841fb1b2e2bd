#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <Aeron.h>

#include "api/daemon_config.hpp"
#include "api/recon_service.hpp"
#include "ingest/aeron_feed_client.hpp"
#include "ingest/feed_subscriber.hpp"
#include "ingest/feed_worker.hpp"
#include "persist/journaled_transaction_store.hpp"
#include "util/async_log.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace {

unsigned long long load(const std::atomic<std::uint64_t>& c) {
    return static_cast<unsigned long long>(c.load(std::memory_order_relaxed));
}

struct Feed {
    core::Provider provider;
    std::unique_ptr<ingest::FeedRing> ring{std::make_unique<ingest::FeedRing>()};
    ingest::FeedStats stats{};
    ingest::FeedWorkerStats worker_stats{};
};

void report_feed(const Feed& feed) {
    LOG_SLOW_INFO("%s feed produced=%llu decode_failures=%llu backpressure=%llu dropped_on_stop=%llu disconnects=%llu",
                  core::provider_name(feed.provider),
                  load(feed.stats.produced),
                  load(feed.stats.decode_failures),
                  load(feed.stats.backpressure_waits),
                  load(feed.stats.dropped_on_stop),
                  load(feed.stats.disconnects));
    LOG_SLOW_INFO("%s worker consumed=%llu matched=%llu retries=%llu failed=%llu",
                  core::provider_name(feed.provider),
                  load(feed.worker_stats.consumed),
                  load(feed.worker_stats.matched),
                  load(feed.worker_stats.retries),
                  load(feed.worker_stats.failed));
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }

    api::DaemonConfig cfg{};
    if (argc == 2) {
        std::string error;
        if (!api::load_daemon_config(argv[1], cfg, error)) {
            LOG_SLOW_FATAL("config %s: %s", argv[1], error.c_str());
            return 1;
        }
    }
    util::set_log_threshold(cfg.log_level);

    util::AsyncLogger::Config log_cfg{};
    log_cfg.capacity_pow2 = cfg.log_capacity;
    log_cfg.min_level = cfg.log_level;
    log_cfg.category_mask = cfg.log_categories;
    log_cfg.file_path = cfg.log_file;
    if (!util::init_worker_logger(log_cfg)) {
        LOG_SLOW_ERROR("Failed to start async logger for ic_recond");
    }

    persist::JournaledTransactionStore store(persist::JournalOptions{cfg.journal_path, cfg.sync_each_write});
    persist::RecoveryStats recovery{};
    const persist::JournalReadStatus recovered = store.recover(recovery);
    if (recovered != persist::JournalReadStatus::Ok) {
        LOG_SLOW_FATAL("journal %s unusable: %s", cfg.journal_path.c_str(), persist::journal_read_status_name(recovered));
        util::shutdown_worker_logger();
        return 2;
    }

    util::WallClock clock;
    api::ReconService service(store, cfg.recon, clock);
    const api::StartReport started = service.start();
    if (started.status != persist::StoreStatus::Ok) {
        LOG_SLOW_FATAL("startup sweep failed: %s", persist::store_status_name(started.status));
        util::shutdown_worker_logger();
        return 2;
    }

    aeron::Context context;
    std::shared_ptr<aeron::Aeron> client;
    try {
        client = aeron::Aeron::connect(context);
    } catch (const std::exception& e) {
        LOG_SLOW_FATAL("Aeron connect failed: %s", e.what());
        util::shutdown_worker_logger();
        return 3;
    }

    const auto feed_client = ingest::make_aeron_feed_client(client);
    std::atomic<bool> stop_flag{false};
    Feed xero_feed{core::Provider::Xero};
    Feed qb_feed{core::Provider::QuickBooks};

    ingest::FeedSubscriber xero_sub(cfg.xero.channel, cfg.xero.stream_id, core::Provider::Xero, *xero_feed.ring,
                                    xero_feed.stats, feed_client, stop_flag);
    ingest::FeedSubscriber qb_sub(cfg.quickbooks.channel, cfg.quickbooks.stream_id, core::Provider::QuickBooks,
                                  *qb_feed.ring, qb_feed.stats, feed_client, stop_flag);
    ingest::FeedWorker xero_worker(stop_flag, *xero_feed.ring, service.gateway(), xero_feed.worker_stats);
    ingest::FeedWorker qb_worker(stop_flag, *qb_feed.ring, service.gateway(), qb_feed.worker_stats);

    LOG_SLOW_INFO("Starting ic_recond journal=%s xero=%s stream=%d quickbooks=%s stream=%d",
                  cfg.journal_path.c_str(), cfg.xero.channel.c_str(), cfg.xero.stream_id,
                  cfg.quickbooks.channel.c_str(), cfg.quickbooks.stream_id);

    std::thread xero_sub_thread([&] { xero_sub.run(); });
    std::thread qb_sub_thread([&] { qb_sub.run(); });
    std::thread xero_worker_thread([&] { xero_worker.run(); });
    std::thread qb_worker_thread([&] { qb_worker.run(); });

    const char* duration_env = std::getenv("ICRECON_RUN_MS");
    if (duration_env) {
        const auto duration_ms = std::chrono::milliseconds{std::strtoul(duration_env, nullptr, 10)};
        LOG_SLOW_INFO("ic_recond running for %llu ms before shutdown.",
                      static_cast<unsigned long long>(duration_ms.count()));
        std::this_thread::sleep_for(duration_ms);
    } else {
        LOG_SLOW_INFO("ic_recond running. Press Enter to exit.");
        std::cin.get();
    }
    stop_flag.store(true, std::memory_order_release);

    xero_sub_thread.join();
    qb_sub_thread.join();
    xero_worker_thread.join();
    qb_worker_thread.join();

    report_feed(xero_feed);
    report_feed(qb_feed);
    const auto& rc = service.recon_counters();
    LOG_SLOW_INFO("Reconciler calls=%llu matched=%llu no_match=%llu already_matched=%llu races_lost=%llu "
                  "stale=%llu violations=%llu unavailable=%llu",
                  load(rc.reconcile_calls), load(rc.matched), load(rc.no_match), load(rc.already_matched),
                  load(rc.races_lost), load(rc.stale_candidates), load(rc.constraint_violations),
                  load(rc.store_unavailable));
    const auto& ic = service.ingest_counters();
    LOG_SLOW_INFO("Ingest accepted=%llu duplicates=%llu rejected=%llu unavailable=%llu",
                  load(ic.accepted), load(ic.duplicates), load(ic.rejected), load(ic.unavailable));
    LOG_SLOW_INFO("Async log written=%llu dropped=%llu",
                  static_cast<unsigned long long>(util::worker_logger().written()),
                  static_cast<unsigned long long>(util::worker_logger().dropped()));

    util::shutdown_worker_logger();
    return 0;
}

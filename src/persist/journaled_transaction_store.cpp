#include "persist/journaled_transaction_store.hpp"

#include <cerrno>
#include <new>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "util/log.hpp"

namespace persist {

JournaledTransactionStore::JournaledTransactionStore(JournalOptions opts, std::unique_ptr<IFileSink> sink)
    : opts_(std::move(opts)), sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("JournaledTransactionStore requires a file sink");
    }
}

JournalReadStatus JournaledTransactionStore::recover(RecoveryStats& stats) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    writable_ = false;
    stats = RecoveryStats{};

    JournalReader reader(opts_.path);
    const JournalReadStatus opened = reader.open();
    if (opened == JournalReadStatus::HeaderInvalid || opened == JournalReadStatus::IoError) {
        LOG_SLOW_ERROR("journal %s: open failed (%s)", opts_.path.c_str(), journal_read_status_name(opened));
        return opened;
    }

    bool torn_tail = false;
    if (opened == JournalReadStatus::Ok) {
        JournalRecord rec{};
        for (;;) {
            const JournalReadStatus st = reader.next(rec);
            if (st == JournalReadStatus::EndOfStream) {
                break;
            }
            if (st == JournalReadStatus::Truncated) {
                torn_tail = true;
                break;
            }
            if (st != JournalReadStatus::Ok) {
                // Damaged durable records are reported, never skipped or cut.
                stats.reader = reader.stats();
                LOG_SLOW_ERROR("journal %s: corrupt record (%s) ending at offset %llu; refusing to recover",
                               opts_.path.c_str(),
                               journal_read_status_name(st),
                               static_cast<unsigned long long>(reader.valid_bytes()));
                return st;
            }
            replay(rec, stats);
        }
    }
    stats.reader = reader.stats();

    if (torn_tail) {
        std::error_code ec;
        const auto on_disk = std::filesystem::file_size(opts_.path, ec);
        if (!ec && on_disk > reader.valid_bytes()) {
            std::filesystem::resize_file(opts_.path, reader.valid_bytes(), ec);
            stats.bytes_discarded = on_disk - reader.valid_bytes();
        }
        if (ec) {
            LOG_SLOW_ERROR("journal %s: cannot cut torn tail: %s", opts_.path.c_str(), ec.message().c_str());
            return JournalReadStatus::IoError;
        }
        LOG_SLOW_WARN("journal %s: discarded %llu bytes of torn tail",
                      opts_.path.c_str(),
                      static_cast<unsigned long long>(stats.bytes_discarded));
    }

    const IoResult open_res = sink_->open(opts_.path.string());
    if (!open_res.ok) {
        LOG_SLOW_ERROR("journal %s: open for append failed errno=%d", opts_.path.c_str(), open_res.error_code);
        return JournalReadStatus::IoError;
    }
    if (sink_->current_size() == 0) {
        const auto header = make_journal_header();
        IoResult res = sink_->append(header);
        if (res.ok && opts_.sync_each_write) {
            res = sink_->sync();
        }
        if (!res.ok) {
            LOG_SLOW_ERROR("journal %s: header write failed errno=%d", opts_.path.c_str(), res.error_code);
            return JournalReadStatus::IoError;
        }
    }

    writable_ = true;
    LOG_SLOW_INFO("journal %s: recovered %llu transactions, %llu pairs, %llu conflicts, %llu corrupt",
                  opts_.path.c_str(),
                  static_cast<unsigned long long>(stats.transactions_restored),
                  static_cast<unsigned long long>(stats.pairs_restored),
                  static_cast<unsigned long long>(stats.replay_conflicts),
                  static_cast<unsigned long long>(stats.reader.records_corrupt));
    return JournalReadStatus::Ok;
}

void JournaledTransactionStore::replay(const JournalRecord& rec, RecoveryStats& stats) noexcept {
    if (rec.kind == JournalRecordKind::TxCreated) {
        if (memory_.restore(rec.tx) == StoreStatus::Ok) {
            ++stats.transactions_restored;
        } else {
            ++stats.replay_conflicts;
        }
        return;
    }

    core::Transaction a{};
    core::Transaction b{};
    if (memory_.get(rec.first, a) != StoreStatus::Ok || memory_.get(rec.second, b) != StoreStatus::Ok) {
        ++stats.replay_conflicts;
        return;
    }
    a.status = core::TxStatus::Matched;
    a.matched_transaction_id = b.id;
    b.status = core::TxStatus::Matched;
    b.matched_transaction_id = a.id;
    const StoreStatus st =
        memory_.atomic_update_pair(a.id, b.id, core::TxStatus::Pending, core::TxStatus::Pending, a, b);
    if (st == StoreStatus::Ok) {
        ++stats.pairs_restored;
    } else {
        ++stats.replay_conflicts;
    }
}

IoResult JournaledTransactionStore::append_locked(const JournalRecord& rec) noexcept {
    std::vector<std::byte> frame;
    try {
        const std::vector<std::byte> payload = encode_record_payload(rec);
        frame.reserve(framed_size(payload.size()));
        append_frame(payload, frame);
    } catch (const std::bad_alloc&) {
        return {false, ENOMEM};
    }

    const std::uint64_t before = sink_->current_size();
    IoResult res = sink_->append(frame);
    if (res.ok && opts_.sync_each_write) {
        res = sink_->sync();
    }
    if (!res.ok) {
        // A half-written frame would hide every later record from recovery.
        const IoResult undo = sink_->truncate(before);
        if (!undo.ok) {
            writable_ = false;
            LOG_SLOW_ERROR("journal %s: rollback failed errno=%d; store is read-only",
                           opts_.path.c_str(),
                           undo.error_code);
        }
    }
    return res;
}

StoreStatus JournaledTransactionStore::get(core::TransactionId id, core::Transaction& out) const noexcept {
    return memory_.get(id, out);
}

StoreStatus JournaledTransactionStore::list(const TransactionFilter& filter,
                                            std::vector<core::Transaction>& out) const {
    return memory_.list(filter, out);
}

StoreStatus JournaledTransactionStore::create(const core::Transaction& draft,
                                              core::TransactionId& assigned_id,
                                              core::TransactionId& existing_id) noexcept {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!writable_) {
        return StoreStatus::Unavailable;
    }

    JournalRecord rec{};
    rec.kind = JournalRecordKind::TxCreated;
    rec.tx = draft;
    try {
        const core::TransactionId existing = memory_.find_external(draft.provider, draft.external_id_view());
        if (existing != core::no_transaction) {
            existing_id = existing;
            return StoreStatus::Duplicate;
        }
    } catch (const std::bad_alloc&) {
        return StoreStatus::Unavailable;
    }

    rec.tx.id = memory_.peek_next_id();
    rec.tx.status = core::TxStatus::Pending;
    rec.tx.matched_transaction_id = core::no_transaction;

    const IoResult res = append_locked(rec);
    if (!res.ok) {
        LOG_SLOW_ERROR("journal %s: create append failed errno=%d", opts_.path.c_str(), res.error_code);
        return StoreStatus::Unavailable;
    }
    const StoreStatus st = memory_.restore(rec.tx);
    if (st == StoreStatus::Ok) {
        assigned_id = rec.tx.id;
    }
    return st;
}

StoreStatus JournaledTransactionStore::atomic_update_pair(core::TransactionId a,
                                                          core::TransactionId b,
                                                          core::TxStatus expected_a,
                                                          core::TxStatus expected_b,
                                                          const core::Transaction& new_a,
                                                          const core::Transaction& new_b) noexcept {
    // The journal records only one kind of pair transition: two Pending records
    // becoming Matched to each other.
    const bool is_pairing = new_a.status == core::TxStatus::Matched && new_b.status == core::TxStatus::Matched &&
                            new_a.matched_transaction_id == b && new_b.matched_transaction_id == a;
    if (a == b || new_a.id != a || new_b.id != b || !is_pairing) {
        return StoreStatus::Invalid;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!writable_) {
        return StoreStatus::Unavailable;
    }

    core::Transaction cur_a{};
    core::Transaction cur_b{};
    if (memory_.get(a, cur_a) != StoreStatus::Ok || memory_.get(b, cur_b) != StoreStatus::Ok) {
        return StoreStatus::NotFound;
    }
    if (cur_a.status != expected_a || cur_b.status != expected_b) {
        return StoreStatus::Conflict;
    }
    if (!cur_a.is_pending() || !cur_b.is_pending()) {
        return StoreStatus::Invalid;
    }
    if (!same_immutable_fields(cur_a, new_a) || !same_immutable_fields(cur_b, new_b)) {
        return StoreStatus::Invalid;
    }

    JournalRecord rec{};
    rec.kind = JournalRecordKind::PairMatched;
    rec.first = a;
    rec.second = b;
    const IoResult res = append_locked(rec);
    if (!res.ok) {
        LOG_SLOW_ERROR("journal %s: pair append failed errno=%d", opts_.path.c_str(), res.error_code);
        return StoreStatus::Unavailable;
    }
    return memory_.atomic_update_pair(a, b, expected_a, expected_b, new_a, new_b);
}

} // namespace persist

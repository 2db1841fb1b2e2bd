#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "persist/file_sink.hpp"
#include "persist/journal_reader.hpp"
#include "persist/memory_transaction_store.hpp"
#include "persist/transaction_store.hpp"

namespace persist {

struct JournalOptions {
    std::filesystem::path path{};
    bool sync_each_write{true};
};

struct RecoveryStats {
    std::uint64_t transactions_restored{0};
    std::uint64_t pairs_restored{0};
    std::uint64_t replay_conflicts{0}; // records that contradict earlier ones; skipped
    std::uint64_t bytes_discarded{0};  // torn tail cut off before appending resumes
    JournalReaderStats reader{};
};

// TransactionStore whose every mutation is appended to a checksummed journal before
// it becomes visible. recover() replays the journal into memory and must succeed
// before any other call; until then writes report Unavailable.
class JournaledTransactionStore final : public TransactionStore {
public:
    explicit JournaledTransactionStore(JournalOptions opts,
                                       std::unique_ptr<IFileSink> sink = std::make_unique<PosixFileSink>());

    JournaledTransactionStore(const JournaledTransactionStore&) = delete;
    JournaledTransactionStore& operator=(const JournaledTransactionStore&) = delete;

    // Ok once the journal is replayed and open for append. Only a torn final write is
    // cut away; any other damage (ChecksumMismatch, InvalidPayload, Unframed) is
    // returned with the file untouched and the store left unwritable.
    JournalReadStatus recover(RecoveryStats& stats);

    StoreStatus get(core::TransactionId id, core::Transaction& out) const noexcept override;
    StoreStatus list(const TransactionFilter& filter, std::vector<core::Transaction>& out) const override;
    StoreStatus create(const core::Transaction& draft,
                       core::TransactionId& assigned_id,
                       core::TransactionId& existing_id) noexcept override;
    StoreStatus atomic_update_pair(core::TransactionId a,
                                   core::TransactionId b,
                                   core::TxStatus expected_a,
                                   core::TxStatus expected_b,
                                   const core::Transaction& new_a,
                                   const core::Transaction& new_b) noexcept override;
    std::size_t size() const noexcept override { return memory_.size(); }

    const std::filesystem::path& path() const noexcept { return opts_.path; }

private:
    void replay(const JournalRecord& rec, RecoveryStats& stats) noexcept;
    IoResult append_locked(const JournalRecord& rec) noexcept;

    JournalOptions opts_;
    std::unique_ptr<IFileSink> sink_;
    MemoryTransactionStore memory_;
    std::mutex write_mutex_;
    bool writable_{false};
};

} // namespace persist

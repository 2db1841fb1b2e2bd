#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "persist/journal_format.hpp"

namespace persist {

struct JournalReaderStats {
    std::uint64_t records_ok{0};
    std::uint64_t records_corrupt{0};
    std::uint64_t checksum_failures{0};
    std::uint64_t bad_payload{0};
    std::uint64_t truncated_tail{0};
    std::uint64_t unframed{0};
    std::uint64_t bytes_read{0};
    std::uint64_t io_errors{0};
};

enum class JournalReadStatus {
    Ok = 0,
    EndOfStream,
    ChecksumMismatch, // frame skipped; reading can continue
    InvalidPayload,   // frame intact but undecodable; reading can continue
    Truncated,        // torn final write; nothing intact follows it
    Unframed,         // damaged length prefix with data after it; reading stops
    HeaderInvalid,
    IoError,
};

const char* journal_read_status_name(JournalReadStatus s) noexcept;

// Sequential reader over one journal file. The file is loaded whole on open().
class JournalReader {
public:
    explicit JournalReader(std::filesystem::path path);

    // EndOfStream for a missing or empty file (a fresh journal), HeaderInvalid or
    // IoError otherwise on failure.
    JournalReadStatus open();

    JournalReadStatus next(JournalRecord& out) noexcept;

    // Offset just past the last intact frame; a writer resuming the file truncates to it.
    std::uint64_t valid_bytes() const noexcept { return valid_bytes_; }
    const JournalReaderStats& stats() const noexcept { return stats_; }

private:
    std::filesystem::path path_;
    JournalReaderStats stats_;
    std::vector<std::byte> buffer_;
    std::size_t offset_{0};
    std::uint64_t valid_bytes_{0};
    bool finished_{true};
};

} // namespace persist

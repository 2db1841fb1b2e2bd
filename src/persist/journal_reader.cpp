#include "persist/journal_reader.hpp"

#include <fstream>
#include <limits>
#include <system_error>

namespace persist {
namespace {

constexpr std::uint32_t created_payload_size = 1 + transaction_serialized_size;
constexpr std::uint32_t paired_payload_size = 1 + pair_matched_serialized_size;

// A writer that dies mid-append leaves a short frame, or zeros where the file grew
// ahead of its data. Anything else that fails to frame is damage to durable records.
bool is_torn_tail(std::span<const std::byte> rest) noexcept {
    if (rest.size() < framed_size(0)) {
        return true;
    }
    bool all_zero = true;
    for (const std::byte b : rest) {
        if (b != std::byte{0}) {
            all_zero = false;
            break;
        }
    }
    if (all_zero) {
        return true;
    }
    const std::uint32_t declared = load_le<std::uint32_t>(rest.data());
    if (declared == 0 || declared > max_journal_payload_size || framed_size(declared) <= rest.size()) {
        return false;
    }
    return !frame_intact_as(rest, created_payload_size) && !frame_intact_as(rest, paired_payload_size);
}

} // namespace

const char* journal_read_status_name(JournalReadStatus s) noexcept {
    switch (s) {
    case JournalReadStatus::Ok: return "ok";
    case JournalReadStatus::EndOfStream: return "end_of_stream";
    case JournalReadStatus::ChecksumMismatch: return "checksum_mismatch";
    case JournalReadStatus::InvalidPayload: return "invalid_payload";
    case JournalReadStatus::Truncated: return "truncated";
    case JournalReadStatus::Unframed: return "unframed";
    case JournalReadStatus::HeaderInvalid: return "header_invalid";
    case JournalReadStatus::IoError: return "io_error";
    }
    return "unknown";
}

JournalReader::JournalReader(std::filesystem::path path) : path_(std::move(path)) {}

JournalReadStatus JournalReader::open() {
    buffer_.clear();
    offset_ = 0;
    valid_bytes_ = 0;
    finished_ = true;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return ec ? JournalReadStatus::IoError : JournalReadStatus::EndOfStream;
    }
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        ++stats_.io_errors;
        return JournalReadStatus::IoError;
    }
    if (size == 0) {
        return JournalReadStatus::EndOfStream;
    }
    if (size > static_cast<std::uintmax_t>(std::numeric_limits<std::size_t>::max())) {
        ++stats_.io_errors;
        return JournalReadStatus::IoError;
    }

    buffer_.resize(static_cast<std::size_t>(size));
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        ++stats_.io_errors;
        return JournalReadStatus::IoError;
    }
    in.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
    if (!in) {
        ++stats_.io_errors;
        return JournalReadStatus::IoError;
    }
    stats_.bytes_read += buffer_.size();

    if (!parse_journal_header(buffer_)) {
        return JournalReadStatus::HeaderInvalid;
    }
    offset_ = journal_header_size;
    valid_bytes_ = journal_header_size;
    finished_ = false;
    return JournalReadStatus::Ok;
}

JournalReadStatus JournalReader::next(JournalRecord& out) noexcept {
    while (!finished_) {
        if (offset_ == buffer_.size()) {
            finished_ = true;
            break;
        }
        const std::span<const std::byte> rest(buffer_.data() + offset_, buffer_.size() - offset_);
        JournalFrameView frame{};
        if (!parse_frame(rest, frame)) {
            finished_ = true;
            ++stats_.records_corrupt;
            if (is_torn_tail(rest)) {
                ++stats_.truncated_tail;
                return JournalReadStatus::Truncated;
            }
            ++stats_.unframed;
            return JournalReadStatus::Unframed;
        }
        offset_ += framed_size(frame.payload_length);
        valid_bytes_ = offset_;

        if (!validate_frame(frame)) {
            ++stats_.checksum_failures;
            ++stats_.records_corrupt;
            return JournalReadStatus::ChecksumMismatch;
        }
        if (!decode_record_payload(frame.payload, out)) {
            ++stats_.bad_payload;
            ++stats_.records_corrupt;
            return JournalReadStatus::InvalidPayload;
        }
        ++stats_.records_ok;
        return JournalReadStatus::Ok;
    }
    return JournalReadStatus::EndOfStream;
}

} // namespace persist

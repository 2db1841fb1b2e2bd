#include "persist/journal_format.hpp"

namespace persist {

void serialize_transaction(const core::Transaction& tx, std::byte* out) noexcept {
    std::byte* p = out;
    store_le<std::uint64_t>(tx.id, p); p += 8;
    p[0] = static_cast<std::byte>(tx.provider);
    p[1] = static_cast<std::byte>(tx.status);
    p += 2;
    store_le<std::uint64_t>(static_cast<std::uint64_t>(tx.amount_cents), p); p += 8;
    std::memcpy(p, tx.currency.letters.data(), tx.currency.letters.size()); p += 3;
    store_le<std::uint32_t>(static_cast<std::uint32_t>(tx.transaction_date), p); p += 4;
    store_le<std::uint64_t>(tx.matched_transaction_id, p); p += 8;
    store_le<std::uint64_t>(tx.created_at_ns, p); p += 8;
    std::memcpy(p, tx.external_id, core::Transaction::external_id_capacity);
    p += core::Transaction::external_id_capacity;
    p[0] = static_cast<std::byte>(tx.external_id_len); p += 1;
    std::memcpy(p, tx.description, core::Transaction::description_capacity);
    p += core::Transaction::description_capacity;
    p[0] = static_cast<std::byte>(tx.description_len);
}

bool deserialize_transaction(std::span<const std::byte> data, core::Transaction& out) noexcept {
    if (data.size() != transaction_serialized_size) {
        return false;
    }
    const std::byte* p = data.data();
    out.id = load_le<std::uint64_t>(p); p += 8;
    const auto provider = static_cast<std::uint8_t>(p[0]);
    const auto status = static_cast<std::uint8_t>(p[1]);
    if (provider > static_cast<std::uint8_t>(core::Provider::QuickBooks) ||
        status > static_cast<std::uint8_t>(core::TxStatus::Matched)) {
        return false;
    }
    out.provider = static_cast<core::Provider>(provider);
    out.status = static_cast<core::TxStatus>(status);
    p += 2;
    out.amount_cents = static_cast<core::AmountCents>(load_le<std::uint64_t>(p)); p += 8;
    std::memcpy(out.currency.letters.data(), p, out.currency.letters.size()); p += 3;
    out.transaction_date = static_cast<core::DayNumber>(load_le<std::uint32_t>(p)); p += 4;
    out.matched_transaction_id = load_le<std::uint64_t>(p); p += 8;
    out.created_at_ns = load_le<std::uint64_t>(p); p += 8;
    std::memcpy(out.external_id, p, core::Transaction::external_id_capacity);
    p += core::Transaction::external_id_capacity;
    out.external_id_len = static_cast<std::uint8_t>(p[0]); p += 1;
    std::memcpy(out.description, p, core::Transaction::description_capacity);
    p += core::Transaction::description_capacity;
    out.description_len = static_cast<std::uint8_t>(p[0]);
    return out.external_id_len <= core::Transaction::external_id_capacity &&
           out.description_len <= core::Transaction::description_capacity;
}

std::vector<std::byte> encode_record_payload(const JournalRecord& rec) {
    std::vector<std::byte> payload;
    switch (rec.kind) {
    case JournalRecordKind::TxCreated:
        payload.resize(1 + transaction_serialized_size);
        serialize_transaction(rec.tx, payload.data() + 1);
        break;
    case JournalRecordKind::PairMatched:
        payload.resize(1 + pair_matched_serialized_size);
        store_le<std::uint64_t>(rec.first, payload.data() + 1);
        store_le<std::uint64_t>(rec.second, payload.data() + 9);
        break;
    }
    payload[0] = static_cast<std::byte>(rec.kind);
    return payload;
}

bool decode_record_payload(std::span<const std::byte> payload, JournalRecord& out) noexcept {
    if (payload.empty()) {
        return false;
    }
    const auto kind = static_cast<std::uint8_t>(payload[0]);
    const auto body = payload.subspan(1);
    switch (kind) {
    case static_cast<std::uint8_t>(JournalRecordKind::TxCreated):
        out.kind = JournalRecordKind::TxCreated;
        return deserialize_transaction(body, out.tx);
    case static_cast<std::uint8_t>(JournalRecordKind::PairMatched):
        if (body.size() != pair_matched_serialized_size) {
            return false;
        }
        out.kind = JournalRecordKind::PairMatched;
        out.first = load_le<std::uint64_t>(body.data());
        out.second = load_le<std::uint64_t>(body.data() + 8);
        return true;
    default:
        return false;
    }
}

} // namespace persist

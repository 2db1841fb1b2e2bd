#include <gtest/gtest.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "harness/tx_builder.hpp"
#include "persist/journal_format.hpp"
#include "persist/journal_reader.hpp"

namespace {

std::filesystem::path make_tmp_journal(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "icrecon_journal_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::filesystem::remove(path);
    return path;
}

persist::JournalRecord created(core::TransactionId id, core::Provider p) {
    persist::JournalRecord rec{};
    rec.kind = persist::JournalRecordKind::TxCreated;
    rec.tx = test::TxBuilder().provider(p).description("invoice 7").draft();
    rec.tx.id = id;
    rec.tx.created_at_ns = 1'000 + id;
    return rec;
}

persist::JournalRecord paired(core::TransactionId a, core::TransactionId b) {
    persist::JournalRecord rec{};
    rec.kind = persist::JournalRecordKind::PairMatched;
    rec.first = a;
    rec.second = b;
    return rec;
}

std::vector<std::byte> journal_bytes(const std::vector<persist::JournalRecord>& records) {
    const auto header = persist::make_journal_header();
    std::vector<std::byte> out(header.begin(), header.end());
    for (const auto& rec : records) {
        persist::append_frame(persist::encode_record_payload(rec), out);
    }
    return out;
}

void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

} // namespace

TEST(JournalFormat, TransactionLayoutIsFixedSize) {
    core::Transaction tx = test::TxBuilder().quickbooks().amount("-12.34").currency("GBP").date("2023-06-30").draft();
    tx.id = 77;
    tx.status = core::TxStatus::Matched;
    tx.matched_transaction_id = 78;
    tx.created_at_ns = 123'456;
    tx.set_description("rent");

    std::array<std::byte, persist::transaction_serialized_size> buf{};
    persist::serialize_transaction(tx, buf.data());

    core::Transaction back{};
    ASSERT_TRUE(persist::deserialize_transaction(buf, back));
    EXPECT_EQ(back.id, 77u);
    EXPECT_EQ(back.provider, core::Provider::QuickBooks);
    EXPECT_EQ(back.status, core::TxStatus::Matched);
    EXPECT_EQ(back.amount_cents, -1234);
    EXPECT_EQ(back.currency.view(), "GBP");
    EXPECT_EQ(back.transaction_date, test::day("2023-06-30"));
    EXPECT_EQ(back.matched_transaction_id, 78u);
    EXPECT_EQ(back.created_at_ns, 123'456u);
    EXPECT_EQ(back.external_id_view(), tx.external_id_view());
    EXPECT_EQ(back.description_view(), "rent");
}

TEST(JournalFormat, RejectsOutOfRangeEnums) {
    core::Transaction tx = test::TxBuilder().draft();
    std::array<std::byte, persist::transaction_serialized_size> buf{};
    persist::serialize_transaction(tx, buf.data());
    buf[8] = std::byte{7}; // provider
    core::Transaction back{};
    EXPECT_FALSE(persist::deserialize_transaction(buf, back));
}

TEST(JournalFormat, RejectsUnknownKindAndShortBodies) {
    persist::JournalRecord out{};
    const std::array<std::byte, 1> unknown{std::byte{9}};
    EXPECT_FALSE(persist::decode_record_payload(unknown, out));

    auto payload = persist::encode_record_payload(paired(1, 2));
    payload.pop_back();
    EXPECT_FALSE(persist::decode_record_payload(payload, out));
}

TEST(JournalFormat, FrameChecksumDetectsFlippedByte) {
    std::vector<std::byte> bytes;
    persist::append_frame(persist::encode_record_payload(paired(3, 4)), bytes);

    persist::JournalFrameView frame{};
    ASSERT_TRUE(persist::parse_frame(bytes, frame));
    EXPECT_TRUE(persist::validate_frame(frame));

    bytes[6] ^= std::byte{0x01};
    ASSERT_TRUE(persist::parse_frame(bytes, frame));
    EXPECT_FALSE(persist::validate_frame(frame));
}

TEST(JournalFormat, HeaderCarriesMagicAndVersion) {
    auto header = persist::make_journal_header();
    EXPECT_TRUE(persist::parse_journal_header(header));
    header[0] = std::byte{'X'};
    EXPECT_FALSE(persist::parse_journal_header(header));
}

TEST(JournalReader, MissingFileIsAnEmptyJournal) {
    persist::JournalReader reader(make_tmp_journal("missing.jrnl"));
    EXPECT_EQ(reader.open(), persist::JournalReadStatus::EndOfStream);
}

TEST(JournalReader, ReadsRecordsInOrder) {
    const auto path = make_tmp_journal("in_order.jrnl");
    write_file(path, journal_bytes({created(1, core::Provider::Xero), created(2, core::Provider::QuickBooks), paired(1, 2)}));

    persist::JournalReader reader(path);
    ASSERT_EQ(reader.open(), persist::JournalReadStatus::Ok);

    persist::JournalRecord rec{};
    ASSERT_EQ(reader.next(rec), persist::JournalReadStatus::Ok);
    EXPECT_EQ(rec.kind, persist::JournalRecordKind::TxCreated);
    EXPECT_EQ(rec.tx.id, 1u);
    ASSERT_EQ(reader.next(rec), persist::JournalReadStatus::Ok);
    EXPECT_EQ(rec.tx.provider, core::Provider::QuickBooks);
    ASSERT_EQ(reader.next(rec), persist::JournalReadStatus::Ok);
    EXPECT_EQ(rec.kind, persist::JournalRecordKind::PairMatched);
    EXPECT_EQ(rec.first, 1u);
    EXPECT_EQ(rec.second, 2u);
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::EndOfStream);

    EXPECT_EQ(reader.stats().records_ok, 3u);
    EXPECT_EQ(reader.valid_bytes(), std::filesystem::file_size(path));
}

TEST(JournalReader, SkipsChecksumFailureAndContinues) {
    const auto path = make_tmp_journal("checksum.jrnl");
    auto bytes = journal_bytes({created(1, core::Provider::Xero), created(2, core::Provider::QuickBooks)});
    // Corrupt a payload byte of the first frame (header + length prefix + kind).
    bytes[persist::journal_header_size + 4 + 3] ^= std::byte{0xFF};
    write_file(path, bytes);

    persist::JournalReader reader(path);
    ASSERT_EQ(reader.open(), persist::JournalReadStatus::Ok);
    persist::JournalRecord rec{};
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::ChecksumMismatch);
    ASSERT_EQ(reader.next(rec), persist::JournalReadStatus::Ok);
    EXPECT_EQ(rec.tx.id, 2u);
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::EndOfStream);
    EXPECT_EQ(reader.stats().checksum_failures, 1u);
}

TEST(JournalReader, TruncatedTailStopsAtLastIntactFrame) {
    const auto path = make_tmp_journal("torn.jrnl");
    auto bytes = journal_bytes({created(1, core::Provider::Xero), created(2, core::Provider::QuickBooks)});
    const std::size_t intact = persist::journal_header_size +
                               persist::framed_size(1 + persist::transaction_serialized_size);
    bytes.resize(bytes.size() - 10);
    write_file(path, bytes);

    persist::JournalReader reader(path);
    ASSERT_EQ(reader.open(), persist::JournalReadStatus::Ok);
    persist::JournalRecord rec{};
    ASSERT_EQ(reader.next(rec), persist::JournalReadStatus::Ok);
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::Truncated);
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::EndOfStream);
    EXPECT_EQ(reader.valid_bytes(), intact);
    EXPECT_EQ(reader.stats().truncated_tail, 1u);
}

TEST(JournalReader, DamagedLengthWithRecordsAfterItIsUnframed) {
    const auto path = make_tmp_journal("bad_length.jrnl");
    auto bytes = journal_bytes({created(1, core::Provider::Xero), created(2, core::Provider::QuickBooks), paired(1, 2)});
    const std::size_t second = persist::journal_header_size +
                               persist::framed_size(1 + persist::transaction_serialized_size);
    // Declared length now runs past EOF, yet a whole record sits behind the prefix.
    bytes[second + 1] ^= std::byte{0x01};
    write_file(path, bytes);

    persist::JournalReader reader(path);
    ASSERT_EQ(reader.open(), persist::JournalReadStatus::Ok);
    persist::JournalRecord rec{};
    ASSERT_EQ(reader.next(rec), persist::JournalReadStatus::Ok);
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::Unframed);
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::EndOfStream);
    EXPECT_EQ(reader.valid_bytes(), second);
    EXPECT_EQ(reader.stats().unframed, 1u);
    EXPECT_EQ(reader.stats().truncated_tail, 0u);
}

TEST(JournalReader, OutOfRangeLengthIsUnframed) {
    const auto path = make_tmp_journal("huge_length.jrnl");
    auto bytes = journal_bytes({created(1, core::Provider::Xero), paired(1, 2)});
    bytes[persist::journal_header_size + 3] = std::byte{0x80};
    write_file(path, bytes);

    persist::JournalReader reader(path);
    ASSERT_EQ(reader.open(), persist::JournalReadStatus::Ok);
    persist::JournalRecord rec{};
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::Unframed);
    EXPECT_EQ(reader.valid_bytes(), persist::journal_header_size);
}

TEST(JournalReader, ZeroFilledTailIsTorn) {
    const auto path = make_tmp_journal("zero_tail.jrnl");
    auto bytes = journal_bytes({created(1, core::Provider::Xero)});
    const std::size_t intact = bytes.size();
    bytes.resize(intact + 64, std::byte{0});
    write_file(path, bytes);

    persist::JournalReader reader(path);
    ASSERT_EQ(reader.open(), persist::JournalReadStatus::Ok);
    persist::JournalRecord rec{};
    ASSERT_EQ(reader.next(rec), persist::JournalReadStatus::Ok);
    EXPECT_EQ(reader.next(rec), persist::JournalReadStatus::Truncated);
    EXPECT_EQ(reader.valid_bytes(), intact);
}

TEST(JournalReader, BadHeaderIsReported) {
    const auto path = make_tmp_journal("bad_header.jrnl");
    std::vector<std::byte> bytes(persist::journal_header_size, std::byte{0});
    write_file(path, bytes);

    persist::JournalReader reader(path);
    EXPECT_EQ(reader.open(), persist::JournalReadStatus::HeaderInvalid);
}

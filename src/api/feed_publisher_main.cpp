#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <Aeron.h>

#include "core/transaction.hpp"
#include "core/wire_transaction.hpp"

namespace {

// Sample record n. Two publishers, one per provider, run with the same arguments
// produce counterpart records that pair up one to one.
core::WireTransaction make_sample(std::size_t n, const core::CurrencyCode& currency, core::DayNumber first_day) {
    core::Transaction tx{};
    tx.amount_cents = 10'000 + static_cast<core::AmountCents>(n) * 137;
    tx.currency = currency;
    tx.transaction_date = first_day + static_cast<core::DayNumber>(n % 28);
    tx.set_external_id("TX-" + std::to_string(n));
    tx.set_description("intercompany transfer " + std::to_string(n));
    return core::to_wire(tx);
}

bool publish(aeron::Publication& pub, const core::WireTransaction& wire) {
    return pub.offer(reinterpret_cast<const std::uint8_t*>(&wire), sizeof(core::WireTransaction)) > 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 5) {
        std::cerr << "Usage: " << argv[0] << " <channel> <stream_id> <count> <sleep_ms> [currency] [first_date]"
                  << std::endl;
        return 1;
    }

    const std::string channel = argv[1];
    const std::int32_t stream_id = static_cast<std::int32_t>(std::stoi(argv[2]));
    const std::size_t count = static_cast<std::size_t>(std::stoul(argv[3]));
    const auto sleep_ms = std::chrono::milliseconds{std::stoul(argv[4])};

    const auto currency = core::make_currency(argc > 5 ? argv[5] : "USD");
    if (!currency) {
        std::cerr << "currency must be three upper-case letters" << std::endl;
        return 1;
    }
    const auto first_day = core::parse_date(argc > 6 ? argv[6] : "2024-01-01");
    if (!first_day) {
        std::cerr << "first_date must be YYYY-MM-DD" << std::endl;
        return 1;
    }

    aeron::Context ctx;
    auto client = aeron::Aeron::connect(ctx);
    const std::int64_t registration_id = client->addPublication(channel, stream_id);
    std::shared_ptr<aeron::Publication> pub = client->findPublication(registration_id);
    while (!pub) {
        std::this_thread::yield();
        pub = client->findPublication(registration_id);
    }

    std::size_t sent = 0;
    while (sent < count) {
        const auto wire = make_sample(sent + 1, *currency, *first_day);
        if (publish(*pub, wire)) {
            ++sent;
            std::this_thread::sleep_for(sleep_ms);
        } else {
            std::this_thread::yield();
        }
    }

    std::cout << "Published " << sent << " transactions to " << channel << " stream " << stream_id << std::endl;
    return 0;
}

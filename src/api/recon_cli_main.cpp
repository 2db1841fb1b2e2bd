#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/recon_service.hpp"
#include "ingest/ingestion_gateway.hpp"
#include "persist/journaled_transaction_store.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace {

constexpr int exit_ok = 0;
constexpr int exit_usage = 1;
constexpr int exit_store = 2;
constexpr int exit_rejected = 3;
constexpr int exit_not_found = 4;
constexpr int exit_violation = 5;

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --journal <path> <command> [args]\n"
              << "Commands:\n"
              << "  ingest --provider <xero|quickbooks> --amount <100.00> --currency <USD>\n"
              << "         --date <YYYY-MM-DD> --external-id <id> [--description <text>]\n"
              << "  reconcile <id>\n"
              << "  list [--status <pending|matched>] [--provider <xero|quickbooks>]\n"
              << "  show <id>\n"
              << "  summary\n"
              << "  verify\n";
}

void print_transaction(const core::Transaction& tx) {
    std::cout << tx.id << ' ' << core::provider_name(tx.provider) << ' ' << core::format_amount(tx.amount_cents)
              << ' ' << tx.currency.view() << ' ' << core::format_date(tx.transaction_date) << ' '
              << core::status_name(tx.status);
    if (tx.is_matched()) {
        std::cout << " matched=" << tx.matched_transaction_id;
    }
    std::cout << " external_id=" << tx.external_id_view();
    if (tx.description_len != 0) {
        std::cout << " description=\"" << tx.description_view() << '"';
    }
    std::cout << '\n';
}

void print_reconcile(core::TransactionId id, const core::ReconcileResult& res) {
    std::cout << "reconcile " << id << ": " << core::reconcile_status_name(res.status) << ' '
              << core::status_name(res.tx_status);
    if (res.matched_transaction_id != core::no_transaction) {
        std::cout << " matched=" << res.matched_transaction_id;
    }
    std::cout << '\n';
}

std::optional<core::TransactionId> parse_id(std::string_view s) {
    core::TransactionId id = 0;
    const auto conv = std::from_chars(s.data(), s.data() + s.size(), id);
    if (conv.ec != std::errc() || conv.ptr != s.data() + s.size() || id == core::no_transaction) {
        return std::nullopt;
    }
    return id;
}

// Collects "--name value" pairs; false on a dangling flag or a bare word.
bool parse_flags(const std::vector<std::string_view>& args, std::map<std::string_view, std::string_view>& out) {
    for (std::size_t i = 0; i < args.size(); i += 2) {
        if (args[i].substr(0, 2) != "--" || i + 1 >= args.size()) {
            return false;
        }
        out[args[i].substr(2)] = args[i + 1];
    }
    return true;
}

int exit_for(core::ReconcileStatus s) {
    switch (s) {
    case core::ReconcileStatus::Ok: return exit_ok;
    case core::ReconcileStatus::NotFound: return exit_not_found;
    case core::ReconcileStatus::ConstraintViolation: return exit_violation;
    case core::ReconcileStatus::StoreUnavailable: return exit_store;
    }
    return exit_store;
}

int cmd_ingest(api::ReconService& service, const std::vector<std::string_view>& args) {
    std::map<std::string_view, std::string_view> flags;
    if (!parse_flags(args, flags)) {
        return exit_usage;
    }
    ingest::IngestRequest req{};
    for (const auto& [name, value] : flags) {
        if (name == "provider") req.provider = value;
        else if (name == "amount") req.amount = value;
        else if (name == "currency") req.currency = value;
        else if (name == "date") req.date = value;
        else if (name == "external-id") req.external_id = value;
        else if (name == "description") req.description = value;
        else {
            std::cerr << "unknown flag --" << name << '\n';
            return exit_usage;
        }
    }
    const ingest::IngestResult res = service.ingest(req);
    std::cout << "ingest: " << ingest::ingest_status_name(res.status);
    if (res.id != core::no_transaction) {
        std::cout << " id=" << res.id;
    }
    std::cout << '\n';
    switch (res.status) {
    case ingest::IngestStatus::Accepted:
        print_reconcile(res.id, res.reconcile);
        return exit_for(res.reconcile.status);
    case ingest::IngestStatus::Duplicate:
        return exit_ok;
    case ingest::IngestStatus::Unavailable:
        return exit_store;
    default:
        return exit_rejected;
    }
}

int cmd_list(api::ReconService& service, const std::vector<std::string_view>& args) {
    std::map<std::string_view, std::string_view> flags;
    if (!parse_flags(args, flags)) {
        return exit_usage;
    }
    persist::TransactionFilter filter{};
    for (const auto& [name, value] : flags) {
        if (name == "status") {
            filter.status = core::parse_status(value);
            if (!filter.status) {
                std::cerr << "unknown status " << value << '\n';
                return exit_usage;
            }
        } else if (name == "provider") {
            filter.provider = core::parse_provider(value);
            if (!filter.provider) {
                std::cerr << "unknown provider " << value << '\n';
                return exit_usage;
            }
        } else {
            std::cerr << "unknown flag --" << name << '\n';
            return exit_usage;
        }
    }
    std::vector<core::Transaction> txs;
    if (service.store().list(filter, txs) != persist::StoreStatus::Ok) {
        return exit_store;
    }
    for (const auto& tx : txs) {
        print_transaction(tx);
    }
    return exit_ok;
}

int cmd_show(api::ReconService& service, std::string_view arg) {
    const auto id = parse_id(arg);
    if (!id) {
        return exit_usage;
    }
    core::Transaction tx{};
    const persist::StoreStatus st = service.store().get(*id, tx);
    if (st == persist::StoreStatus::NotFound) {
        std::cerr << "transaction " << *id << " not found\n";
        return exit_not_found;
    }
    if (st != persist::StoreStatus::Ok) {
        return exit_store;
    }
    print_transaction(tx);
    return exit_ok;
}

int cmd_summary(api::ReconService& service) {
    api::Summary summary{};
    if (service.summarize(summary) != persist::StoreStatus::Ok) {
        return exit_store;
    }
    std::cout << "total " << summary.total << " pending " << summary.pending << " matched " << summary.matched
              << '\n';
    for (const auto p : {core::Provider::Xero, core::Provider::QuickBooks}) {
        std::cout << core::provider_name(p) << " pending " << summary.count(p, core::TxStatus::Pending)
                  << " matched " << summary.count(p, core::TxStatus::Matched) << '\n';
    }
    return exit_ok;
}

int cmd_verify(api::ReconService& service) {
    core::InvariantReport report{};
    if (service.verify(report) != persist::StoreStatus::Ok) {
        return exit_store;
    }
    std::cout << "checked " << report.transactions_checked << " transactions, " << report.matched_pairs
              << " matched pairs, " << report.violations.size() << " violations\n";
    for (const auto& v : report.violations) {
        std::cout << core::violation_kind_name(v.kind) << " tx=" << v.id << " counterpart=" << v.counterpart_id
                  << '\n';
    }
    return report.clean() ? exit_ok : exit_violation;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);
    if (args.size() < 3 || args[0] != "--journal") {
        usage(argv[0]);
        return exit_usage;
    }
    const std::string journal_path(args[1]);
    const std::string_view command = args[2];
    const std::vector<std::string_view> rest(args.begin() + 3, args.end());

    util::set_log_threshold(util::LogLevel::Warn);

    persist::JournaledTransactionStore store(persist::JournalOptions{journal_path, true});
    persist::RecoveryStats recovery{};
    const persist::JournalReadStatus recovered = store.recover(recovery);
    if (recovered != persist::JournalReadStatus::Ok) {
        std::cerr << "journal " << journal_path << ": " << persist::journal_read_status_name(recovered) << '\n';
        return exit_store;
    }

    util::WallClock clock;
    api::ReconService service(store, core::default_recon_config(), clock);

    int rc = exit_usage;
    if (command == "ingest") {
        if (service.start().status != persist::StoreStatus::Ok) {
            return exit_store;
        }
        rc = cmd_ingest(service, rest);
    } else if (command == "reconcile" && rest.size() == 1) {
        const auto id = parse_id(rest[0]);
        if (id) {
            if (service.start(false).status != persist::StoreStatus::Ok) {
                return exit_store;
            }
            const core::ReconcileResult res = service.reconcile(*id);
            print_reconcile(*id, res);
            rc = exit_for(res.status);
        }
    } else if (command == "list") {
        rc = cmd_list(service, rest);
    } else if (command == "show" && rest.size() == 1) {
        rc = cmd_show(service, rest[0]);
    } else if (command == "summary" && rest.empty()) {
        rc = cmd_summary(service);
    } else if (command == "verify" && rest.empty()) {
        rc = cmd_verify(service);
    }
    if (rc == exit_usage) {
        usage(argv[0]);
    }
    return rc;
}

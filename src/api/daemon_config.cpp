#include "api/daemon_config.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <limits>
#include <new>
#include <optional>

namespace api {
namespace {

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::optional<std::string> parse_string(std::string& err) {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "Expected string";
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= src_.size()) {
                break;
            }
            switch (src_[pos_++]) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            default:
                err = "Unsupported escape sequence";
                return std::nullopt;
            }
        }
        err = "Unterminated string";
        return std::nullopt;
    }

    std::optional<std::int64_t> parse_int64(std::string& err) {
        skip_ws();
        const std::size_t start = pos_;
        if (pos_ < src_.size() && src_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        std::int64_t value = 0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (start == pos_ || conv.ec != std::errc() || conv.ptr != src_.data() + pos_) {
            err = "Expected integer";
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_bool(std::string& err) {
        skip_ws();
        if (src_.substr(pos_).compare(0, 4, "true") == 0) {
            pos_ += 4;
            return true;
        }
        if (src_.substr(pos_).compare(0, 5, "false") == 0) {
            pos_ += 5;
            return false;
        }
        err = "Expected true or false";
        return std::nullopt;
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

private:
    mutable std::size_t pos_{0};
    std::string_view src_;
};

// Walks the members of one object, handing each key to on_member with the cursor
// positioned at its value.
template <typename OnMember>
bool parse_object(JsonCursor& cur, std::string& error, OnMember&& on_member) {
    if (!cur.consume('{')) {
        error = "Expected object";
        return false;
    }
    if (cur.consume('}')) {
        return true;
    }
    while (true) {
        auto key = cur.parse_string(error);
        if (!key) {
            return false;
        }
        if (!cur.consume(':')) {
            error = "Expected ':' after " + *key;
            return false;
        }
        if (!on_member(*key)) {
            return false;
        }
        if (cur.consume('}')) {
            return true;
        }
        if (!cur.consume(',')) {
            error = "Expected ','";
            return false;
        }
    }
}

template <typename OnElement>
bool parse_array(JsonCursor& cur, std::string& error, OnElement&& on_element) {
    if (!cur.consume('[')) {
        error = "Expected array";
        return false;
    }
    if (cur.consume(']')) {
        return true;
    }
    while (true) {
        if (!on_element()) {
            return false;
        }
        if (cur.consume(']')) {
            return true;
        }
        if (!cur.consume(',')) {
            error = "Expected ','";
            return false;
        }
    }
}

bool read_bounded(JsonCursor& cur,
                  std::string_view key,
                  std::int64_t lo,
                  std::int64_t hi,
                  std::int64_t& out,
                  std::string& error) {
    const auto v = cur.parse_int64(error);
    if (!v) {
        return false;
    }
    if (*v < lo || *v > hi) {
        error = std::string(key) + " out of range";
        return false;
    }
    out = *v;
    return true;
}

bool parse_feed(JsonCursor& cur, FeedConfig& feed, std::string& error) {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "channel") {
            auto v = cur.parse_string(error);
            if (!v) return false;
            if (v->empty()) {
                error = "feed channel must not be empty";
                return false;
            }
            feed.channel = std::move(*v);
            return true;
        }
        if (key == "stream_id") {
            std::int64_t v = 0;
            if (!read_bounded(cur, key, 1, std::numeric_limits<std::int32_t>::max(), v, error)) return false;
            feed.stream_id = static_cast<std::int32_t>(v);
            return true;
        }
        error = "Unknown feed field: " + key;
        return false;
    });
}

bool parse_document(JsonCursor& cur, DaemonConfig& cfg, std::string& error) {
    const bool ok = parse_object(cur, error, [&](const std::string& key) {
        if (key == "journal_path") {
            auto v = cur.parse_string(error);
            if (!v) return false;
            if (v->empty()) {
                error = "journal_path must not be empty";
                return false;
            }
            cfg.journal_path = *v;
            return true;
        }
        if (key == "sync_each_write") {
            auto v = cur.parse_bool(error);
            if (!v) return false;
            cfg.sync_each_write = *v;
            return true;
        }
        if (key == "log") {
            return parse_object(cur, error, [&](const std::string& lkey) {
                if (lkey == "file") {
                    auto v = cur.parse_string(error);
                    if (!v) return false;
                    cfg.log_file = std::move(*v);
                    return true;
                }
                if (lkey == "capacity") {
                    std::int64_t v = 0;
                    if (!read_bounded(cur, lkey, 2, 1 << 24, v, error)) return false;
                    if ((v & (v - 1)) != 0) {
                        error = "log capacity must be a power of two";
                        return false;
                    }
                    cfg.log_capacity = static_cast<std::size_t>(v);
                    return true;
                }
                if (lkey == "level") {
                    auto v = cur.parse_string(error);
                    if (!v) return false;
                    const auto lvl = util::parse_log_level(*v);
                    if (!lvl) {
                        error = "Unknown log level: " + *v;
                        return false;
                    }
                    cfg.log_level = *lvl;
                    return true;
                }
                if (lkey == "categories") {
                    std::uint32_t mask = 0;
                    const bool parsed = parse_array(cur, error, [&] {
                        auto v = cur.parse_string(error);
                        if (!v) return false;
                        const auto cat = util::parse_log_category(*v);
                        if (!cat) {
                            error = "Unknown log category: " + *v;
                            return false;
                        }
                        mask |= util::category_bit(*cat);
                        return true;
                    });
                    if (!parsed) return false;
                    cfg.log_categories = mask;
                    return true;
                }
                error = "Unknown log field: " + lkey;
                return false;
            });
        }
        if (key == "feeds") {
            return parse_object(cur, error, [&](const std::string& fkey) {
                const auto provider = core::parse_provider(fkey);
                if (!provider) {
                    error = "Unknown provider: " + fkey;
                    return false;
                }
                return parse_feed(cur, *provider == core::Provider::Xero ? cfg.xero : cfg.quickbooks, error);
            });
        }
        if (key == "matching") {
            return parse_object(cur, error, [&](const std::string& mkey) {
                std::int64_t v = 0;
                if (mkey == "amount_tolerance_cents") {
                    if (!read_bounded(cur, mkey, 0, core::max_amount_tolerance_cents, v, error)) return false;
                    cfg.recon.amount_tolerance_cents = v;
                    return true;
                }
                if (mkey == "date_window_days") {
                    if (!read_bounded(cur, mkey, 0, core::max_date_window_days, v, error)) return false;
                    cfg.recon.date_window_days = static_cast<std::int32_t>(v);
                    return true;
                }
                if (mkey == "verify_counterpart_on_idempotent") {
                    auto flag = cur.parse_bool(error);
                    if (!flag) return false;
                    cfg.recon.verify_counterpart_on_idempotent = *flag;
                    return true;
                }
                if (mkey == "prune_stale_candidates") {
                    auto flag = cur.parse_bool(error);
                    if (!flag) return false;
                    cfg.recon.prune_stale_candidates = *flag;
                    return true;
                }
                error = "Unknown matching field: " + mkey;
                return false;
            });
        }
        error = "Unknown field: " + key;
        return false;
    });
    if (!ok) {
        return false;
    }
    if (!cur.eof()) {
        error = "Trailing characters after config object";
        return false;
    }
    if (cfg.xero.stream_id == cfg.quickbooks.stream_id && cfg.xero.channel == cfg.quickbooks.channel) {
        error = "xero and quickbooks feeds must not share channel and stream";
        return false;
    }
    return true;
}

} // namespace

bool parse_daemon_config_text(std::string_view text, DaemonConfig& out, std::string& error) noexcept {
    try {
        JsonCursor cur(text);
        DaemonConfig cfg{};
        if (!parse_document(cur, cfg, error)) {
            return false;
        }
        out = std::move(cfg);
        return true;
    } catch (const std::bad_alloc&) {
        error = "Out of memory while parsing config";
        return false;
    }
}

bool load_daemon_config(const std::filesystem::path& path, DaemonConfig& out, std::string& error) noexcept {
    try {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            error = "Failed to open file: " + path.string();
            return false;
        }
        std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            error = "Failed to read file: " + path.string();
            return false;
        }
        return parse_daemon_config_text(contents, out, error);
    } catch (const std::bad_alloc&) {
        error = "Out of memory while reading config";
        return false;
    }
}

} // namespace api

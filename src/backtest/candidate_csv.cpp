#include "calibet/backtest/candidate_csv.hpp"
#include "calibet/backtest/coercion.hpp"
#include "calibet/backtest/staking.hpp"
#include "calibet/core/atomic_file.hpp"
#include "calibet/core/log.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <optional>

namespace calibet::backtest {

namespace {

constexpr const char* kComponent = "backtest.csv";

auto lower(std::string s) -> std::string {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

/** \brief Column index of the first alias present in the header. */
auto find_column(const std::vector<std::string>& header, std::initializer_list<std::string_view> aliases)
    -> std::optional<std::size_t> {
    for (auto alias : aliases) {
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (header[i] == alias) return i;
        }
    }
    return std::nullopt;
}

auto field_at(const std::vector<std::string>& row, const std::optional<std::size_t>& col) -> std::string_view {
    if (!col || *col >= row.size()) return {};
    return row[*col];
}

auto row_error(std::size_t line_no, const std::string& what) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::data_integrity,
                            "line " + std::to_string(line_no) + ": " + what, kComponent);
}

} // anonymous namespace

auto split_csv_line(std::string_view line) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(std::move(cur));
    return out;
}

auto parse_candidates_csv(std::string_view text) -> std::expected<std::vector<BetCandidate>, core::error> {
    std::vector<std::string> header;
    std::optional<std::size_t> c_date, c_label, c_prob, c_odds, c_under, c_conf, c_line, c_pred, c_actual;
    std::vector<BetCandidate> out;

    std::size_t pos = 0;
    std::size_t line_no = 0;
    while (pos < text.size()) {
        auto nl = text.find('\n', pos);
        if (nl == std::string_view::npos) nl = text.size();
        auto line = text.substr(pos, nl - pos);
        pos = nl + 1;
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (trim(line).empty()) continue;

        auto fields = split_csv_line(line);
        if (header.empty()) {
            for (auto& f : fields) header.push_back(lower(std::string(trim(f))));
            c_date = find_column(header, {"game_date", "date", "game_date_utc"});
            if (!c_date) return row_error(line_no, "no date column (game_date, date or game_date_utc)");
            c_label = find_column(header, {"player", "label"});
            c_prob = find_column(header, {"over_probability", "prob_over"});
            c_odds = find_column(header, {"decimal_odds", "odds"});
            c_under = find_column(header, {"decimal_odds_under"});
            c_conf = find_column(header, {"confidence"});
            c_line = find_column(header, {"line"});
            c_pred = find_column(header, {"predicted_value"});
            c_actual = find_column(header, {"actual_value", "value"});
            continue;
        }

        BetCandidate c;
        auto when = coerce_event_time(field_at(fields, c_date));
        if (!when) return row_error(line_no, when.error().message);
        c.event_time = *when;
        c.label = std::string(trim(field_at(fields, c_label)));

        if (auto f = trim(field_at(fields, c_prob)); !f.empty()) {
            auto p = coerce_probability(f);
            if (!p) return row_error(line_no, p.error().message);
            c.probability = *p;
        }
        if (auto f = trim(field_at(fields, c_odds)); !f.empty()) {
            auto o = coerce_decimal_odds(f);
            if (!o) return row_error(line_no, o.error().message);
            c.odds = *o;
        }
        if (auto f = trim(field_at(fields, c_under)); !f.empty()) {
            std::string reason;
            if (auto under = coerce_decimal_odds(f); !under) {
                reason = under.error().message;
            } else if (auto fair = remove_vig(c.odds, *under); !fair) {
                reason = fair.error().message;
            } else {
                c.odds = *fair;
            }
            if (!reason.empty()) {
                core::log(core::log_level::warn, kComponent,
                          "line " + std::to_string(line_no) + ": keeping over odds, vig removal failed: " + reason);
            }
        }
        if (auto f = trim(field_at(fields, c_conf)); !f.empty()) {
            auto v = coerce_confidence(f);
            if (!v) return row_error(line_no, v.error().message);
            c.confidence = *v;
        }
        if (auto f = trim(field_at(fields, c_line)); !f.empty()) {
            auto v = parse_number(f);
            if (!v) return row_error(line_no, "line: " + v.error().message);
            c.line = *v;
        }
        if (auto f = trim(field_at(fields, c_pred)); !f.empty()) {
            auto v = parse_number(f);
            if (!v) return row_error(line_no, "predicted_value: " + v.error().message);
            c.prediction = *v;
        }
        auto actual = coerce_outcome(field_at(fields, c_actual));
        if (!actual) return row_error(line_no, actual.error().message);
        c.actual = *actual;

        out.push_back(std::move(c));
    }

    if (header.empty()) {
        return core::make_error(core::error_code::data_integrity, "empty CSV (no header)", kComponent);
    }
    std::stable_sort(out.begin(), out.end(), [](const BetCandidate& l, const BetCandidate& r) {
        return l.event_time < r.event_time;
    });
    return out;
}

auto load_candidates_csv(const std::filesystem::path& path)
    -> std::expected<std::vector<BetCandidate>, core::error> {
    auto text = core::read_file(path);
    if (!text) return std::unexpected(text.error());
    auto rows = parse_candidates_csv(*text);
    if (!rows) {
        auto err = rows.error();
        err.message = path.string() + ": " + err.message;
        return std::unexpected(std::move(err));
    }
    return rows;
}

} // namespace calibet::backtest

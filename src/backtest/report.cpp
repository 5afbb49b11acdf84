#include "calibet/backtest/report.hpp"
#include "calibet/backtest/coercion.hpp"
#include "calibet/core/atomic_file.hpp"
#include "calibet/core/log.hpp"

#include <cstdio>
#include <system_error>
#include <utility>

namespace calibet::backtest {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "backtest.report";

auto num(double v) -> std::string {
    char buf[64];
    const int len = std::snprintf(buf, sizeof(buf), "%.10g", v);
    return std::string(buf, static_cast<std::size_t>(len));
}

auto opt(const std::optional<double>& v) -> std::string { return v ? num(*v) : std::string(); }

auto opt_json(const std::optional<double>& v) -> nlohmann::json {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

/** \brief Quote a CSV field when it contains a separator, quote or newline. */
auto csv_field(const std::string& s) -> std::string {
    if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // anonymous namespace

auto bets_csv(const BacktestResult& result) -> std::string {
    std::string out = "event_time,label,probability,confidence,ev,odds,line,prediction,actual,stake,won,profit,bankroll\n";
    for (const auto& b : result.bets) {
        out.append(format_event_time(b.event_time)).append(",")
           .append(csv_field(b.label)).append(",")
           .append(num(b.probability)).append(",")
           .append(opt(b.confidence)).append(",")
           .append(num(b.ev)).append(",")
           .append(num(b.odds)).append(",")
           .append(opt(b.line)).append(",")
           .append(opt(b.prediction)).append(",")
           .append(num(b.actual)).append(",")
           .append(num(b.stake)).append(",")
           .append(b.won ? "1" : "0").append(",")
           .append(num(b.profit)).append(",")
           .append(num(b.bankroll_after)).append("\n");
    }
    return out;
}

auto summary_csv(const BacktestSummary& s) -> std::string {
    std::string out = "initial_bankroll,final_bankroll,roi,win_rate,total_bets,wins,losses,sharpe,max_drawdown,cagr,brier_score\n";
    out.append(num(s.initial_bankroll)).append(",")
       .append(num(s.final_bankroll)).append(",")
       .append(num(s.roi)).append(",")
       .append(num(s.win_rate)).append(",")
       .append(std::to_string(s.total_bets)).append(",")
       .append(std::to_string(s.wins)).append(",")
       .append(std::to_string(s.losses)).append(",")
       .append(opt(s.sharpe)).append(",")
       .append(num(s.max_drawdown)).append(",")
       .append(opt(s.cagr)).append(",")
       .append(opt(s.brier_score)).append("\n");
    return out;
}

auto calibration_csv(const BacktestResult& result) -> std::string {
    std::string out = "bin,center,mean_pred,mean_obs,count\n";
    for (std::size_t i = 0; i < result.calibration.size(); ++i) {
        const auto& b = result.calibration[i];
        out.append(std::to_string(i)).append(",")
           .append(num(b.center)).append(",")
           .append(num(b.mean_predicted)).append(",")
           .append(num(b.mean_observed)).append(",")
           .append(std::to_string(b.count)).append("\n");
    }
    return out;
}

auto summary_json(const BacktestResult& result) -> nlohmann::json {
    const auto& s = result.summary;
    nlohmann::json j;
    j["initial_bankroll"] = s.initial_bankroll;
    j["final_bankroll"] = s.final_bankroll;
    j["roi"] = s.roi;
    j["win_rate"] = s.win_rate;
    j["total_bets"] = s.total_bets;
    j["wins"] = s.wins;
    j["losses"] = s.losses;
    j["sharpe"] = opt_json(s.sharpe);
    j["max_drawdown"] = s.max_drawdown;
    j["cagr"] = opt_json(s.cagr);
    j["brier_score"] = opt_json(s.brier_score);
    j["skipped"] = {
        {"pending", result.skipped_pending},
        {"ev", result.skipped_ev},
        {"confidence", result.skipped_confidence},
        {"stake", result.skipped_stake},
    };
    return j;
}

auto default_run_name(TimePoint now) -> std::string {
    // format_event_time gives YYYY-MM-DDTHH:MM:SSZ; compact it.
    const auto iso = format_event_time(now);
    std::string compact;
    for (char c : iso) {
        if (c != '-' && c != ':') compact.push_back(c);
    }
    return "backtest_" + compact;
}

auto save_report(const BacktestResult& result, const fs::path& outdir, std::optional<std::string> run_name)
    -> std::expected<fs::path, core::error> {
    const fs::path run_dir = outdir / run_name.value_or(default_run_name());
    std::error_code ec;
    fs::create_directories(run_dir, ec);
    if (ec) {
        return core::make_error(core::error_code::io_failed,
                                "cannot create report directory " + run_dir.string() + ": " + ec.message(),
                                kComponent);
    }
    const std::pair<const char*, std::string> files[] = {
        {"bets.csv", bets_csv(result)},
        {"summary.csv", summary_csv(result.summary)},
        {"calibration.csv", calibration_csv(result)},
        {"summary.json", summary_json(result).dump(2) + "\n"},
    };
    for (const auto& [name, contents] : files) {
        if (auto w = core::write_file_atomic(run_dir / name, contents, false); !w) {
            return std::unexpected(w.error());
        }
    }
    core::log(core::log_level::info, kComponent, "report written to " + run_dir.string());
    return run_dir;
}

} // namespace calibet::backtest

// src/backtest/backtest_csv_exporter.cpp
#include "options_ngin/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {
namespace backtest {

namespace {

void write_greeks(std::ostream& out, const Greeks& g) {
    out << "," << g.delta << "," << g.gamma << "," << g.theta << "," << g.vega;
}

}  // namespace

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {}

BacktestCSVExporter::~BacktestCSVExporter() {
    finalize();
}

std::string BacktestCSVExporter::trade_header() {
    return "position_id,strategy,entry_time,exit_time,entry_cost,exit_value,realized_pnl,"
           "holding_minutes,exit_reason,regime,leg_count,estimated,commission,"
           "entry_delta,entry_gamma,entry_theta,entry_vega,exit_delta,exit_gamma,exit_theta,"
           "exit_vega";
}

std::string BacktestCSVExporter::format_trade(const Trade& trade) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << trade.position_id << "," << trade.strategy << ","
       << core::format_timestamp(trade.entry_time) << ","
       << core::format_timestamp(trade.exit_time) << "," << trade.entry_cost << ","
       << trade.exit_value << "," << trade.realized_pnl << "," << trade.holding_minutes << ","
       << exit_reason_to_string(trade.exit_reason) << "," << trade.regime << ","
       << trade.leg_count << "," << (trade.estimated ? "true" : "false") << ","
       << trade.commission;


    // Position gamma is small; keep more digits
    ss << std::setprecision(4);
    write_greeks(ss, trade.greeks_at_entry);
    write_greeks(ss, trade.greeks_at_exit);
    return ss.str();
}

Result<void> BacktestCSVExporter::initialize_files() {
    try {
        std::filesystem::create_directories(output_directory_);

        trades_file_.open(std::filesystem::path(output_directory_) / "trades.csv");
        if (!trades_file_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open trades.csv for writing",
                                    "BacktestCSVExporter");
        }
        trades_file_ << trade_header() << "\n";

        equity_file_.open(std::filesystem::path(output_directory_) / "equity_curve.csv");
        if (!equity_file_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open equity_curve.csv for writing",
                                    "BacktestCSVExporter");
        }
        equity_file_ << "timestamp,equity\n";

        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error initializing CSV files: ") + e.what(),
                                "BacktestCSVExporter");
    }
}

Result<void> BacktestCSVExporter::append_trade(const Trade& trade) {
    if (!trades_file_.is_open()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "trades.csv is not open",
                                "BacktestCSVExporter");
    }
    trades_file_ << format_trade(trade) << "\n";
    if (!trades_file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Write to trades.csv failed",
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::append_equity_point(const Timestamp& time, double equity) {
    if (!equity_file_.is_open()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "equity_curve.csv is not open",
                                "BacktestCSVExporter");
    }
    equity_file_ << core::format_timestamp(time) << "," << std::fixed << std::setprecision(2)
                 << equity << "\n";
    if (!equity_file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Write to equity_curve.csv failed",
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

nlohmann::json BacktestCSVExporter::summary_to_json(const BacktestResults& results) {
    const auto& s = results.summary;
    nlohmann::json j;

    j["strategy"] = results.strategy;
    j["simulated"] = results.simulated;
    j["initial_capital"] = results.initial_capital;
    j["final_cash"] = results.final_cash;
    j["bars_processed"] = results.bars_processed;
    j["data_gaps"] = results.data_gaps;
    j["estimated_marks"] = results.estimated_marks;
    j["signals_received"] = results.signals_received;
    j["signals_accepted"] = results.signals_accepted;

    j["total_trades"] = s.total_trades;
    j["winning_trades"] = s.winning_trades;
    j["losing_trades"] = s.losing_trades;
    j["estimated_trades"] = s.estimated_trades;
    j["win_rate"] = s.win_rate;
    j["total_pnl"] = s.total_pnl;
    j["total_commission"] = s.total_commission;
    j["avg_pnl"] = s.avg_pnl;
    j["avg_win"] = s.avg_win;
    j["avg_loss"] = s.avg_loss;
    j["largest_win"] = s.largest_win;
    j["largest_loss"] = s.largest_loss;
    j["profit_factor"] = s.profit_factor;
    j["max_consecutive_wins"] = s.max_consecutive_wins;
    j["max_consecutive_losses"] = s.max_consecutive_losses;
    j["avg_holding_minutes"] = s.avg_holding_minutes;
    j["signal_efficiency"] = s.signal_efficiency;
    j["total_return"] = s.total_return;
    j["max_drawdown"] = s.max_drawdown;
    j["max_drawdown_pct"] = s.max_drawdown_pct;
    j["volatility"] = s.volatility;
    j["sharpe_ratio"] = s.sharpe_ratio;
    j["sortino_ratio"] = s.sortino_ratio;
    j["calmar_ratio"] = s.calmar_ratio;
    j["exit_reasons"] = s.exit_reasons;
    j["monthly_pnl"] = s.monthly_pnl;

    nlohmann::json regimes = nlohmann::json::object();
    for (const auto& [regime, stats] : s.regimes) {
        regimes[regime] = {{"trades", stats.trades},       {"wins", stats.wins},
                           {"losses", stats.losses},       {"win_rate", stats.win_rate},
                           {"total_pnl", stats.total_pnl}, {"avg_pnl", stats.avg_pnl}};
    }
    j["regimes"] = regimes;
    j["strategy_metrics"] = results.strategy_metrics;
    return j;
}

Result<void> BacktestCSVExporter::write_summary(const BacktestResults& results) const {
    try {
        std::filesystem::create_directories(output_directory_);
        std::ofstream file(std::filesystem::path(output_directory_) / "summary.json");
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open summary.json for writing",
                                    "BacktestCSVExporter");
        }
        file << std::setw(4) << summary_to_json(results) << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error writing summary: ") + e.what(),
                                "BacktestCSVExporter");
    }
}

Result<void> BacktestCSVExporter::export_results(const BacktestResults& results) {
    auto init = initialize_files();
    if (init.is_error()) {
        return init;
    }

    for (const auto& trade : results.trades) {
        auto written = append_trade(trade);
        if (written.is_error()) {
            return written;
        }
    }
    for (const auto& [time, equity] : results.equity_curve) {
        auto written = append_equity_point(time, equity);
        if (written.is_error()) {
            return written;
        }
    }
    finalize();

    auto summary = write_summary(results);
    if (summary.is_error()) {
        return summary;
    }

    Logger::register_component("BacktestCSVExporter");
    INFO("Exported " << results.trades.size() << " trades to " << output_directory_);
    return Result<void>();
}

void BacktestCSVExporter::finalize() {
    if (trades_file_.is_open()) {
        trades_file_.close();
    }
    if (equity_file_.is_open()) {
        equity_file_.close();
    }
}

}  // namespace backtest
}  // namespace options_ngin

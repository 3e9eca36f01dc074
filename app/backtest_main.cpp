#include "mmsim/closing_auction.hpp"
#include "mmsim/config.hpp"
#include "mmsim/market_maker_session.hpp"
#include "mmsim/session_clock.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace mmsim;

// --------- parsing helpers ---------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

static std::optional<EventType> parse_type(const std::string& token) {
    auto t = to_lower(token);
    if (t == "bid")   return EventType::Bid;
    if (t == "ask")   return EventType::Ask;
    if (t == "trade") return EventType::Trade;
    return std::nullopt;
}

static bool is_comment_or_empty(const std::string& line) {
    auto t = trim(line);
    return t.empty() || t[0] == '#';
}

struct ParsedLine {
    std::string security;
    MarketEvent ev;
};

// Формат: security,timestamp,type,price,volume
static std::optional<ParsedLine> parse_line(const std::string& line) {
    std::stringstream ss(line);
    std::string token;
    std::vector<std::string> fields;
    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }
    if (fields.size() < 5) return std::nullopt;

    auto ts   = parse_timestamp(fields[1]);
    auto type = parse_type(fields[2]);
    if (!ts || !type || fields[0].empty()) return std::nullopt;

    ParsedLine out;
    out.security = fields[0];
    out.ev.ts    = *ts;
    out.ev.type  = *type;

    try {
        out.ev.price = std::stod(fields[3]);
        // volume may come as "1500.0"
        out.ev.qty = static_cast<Quantity>(std::stod(fields[4]));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return out;
}

struct LoadStats {
    std::size_t lines   = 0;
    std::size_t skipped = 0;
};

static std::map<std::string, std::vector<MarketEvent>>
load_events(const std::string& path, LoadStats& stats) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open events file: " + path);
    }

    std::map<std::string, std::vector<MarketEvent>> by_security;
    std::string line;
    bool first = true;

    while (std::getline(in, line)) {
        if (is_comment_or_empty(line)) continue;
        ++stats.lines;

        auto parsed = parse_line(line);
        if (!parsed) {
            // header line is expected to fail
            if (!first) ++stats.skipped;
            first = false;
            continue;
        }
        first = false;
        by_security[parsed->security].push_back(parsed->ev);
    }

    for (auto& item : by_security) {
        auto& events = item.second;
        std::stable_sort(events.begin(), events.end(),
                         [](const MarketEvent& a, const MarketEvent& b) { return a.ts < b.ts; });
    }
    return by_security;
}

// --------- output ---------

static void write_trades_csv(const std::filesystem::path& dir, const SessionResult& r) {
    if (r.fills.empty()) return;

    const auto path = dir / (r.security + "_trades.csv");
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("failed to write " + path.string());
    }

    out << "timestamp,side,price,quantity,realized_pnl,position,cumulative_pnl,reason\n";
    out << std::fixed;
    for (const auto& f : r.fills) {
        out << format_timestamp(f.ts) << ','
            << to_string(f.side) << ','
            << std::setprecision(4) << f.price << ','
            << f.qty << ','
            << std::setprecision(2) << f.realized_pnl << ','
            << f.position << ','
            << f.cumulative_pnl << ','
            << to_string(f.reason) << '\n';
    }
}

static void print_summary(const SessionResult& r) {
    std::cout << "--- " << r.security << " ---\n";
    std::cout << "  events      : bid=" << r.counters.bid_updates
              << " ask=" << r.counters.ask_updates
              << " trade=" << r.counters.trades
              << " gated=" << r.counters.gated
              << " ignored=" << r.counters.ignored << "\n";
    std::cout << "  fills       : " << r.fills.size() << "\n";
    std::cout << "  days        : market=" << r.market_dates.size()
              << " traded=" << r.fill_dates.size() << "\n";
    std::cout << "  position    : " << r.position << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  realized    : " << r.realized_pnl << "\n";
    std::cout << "  total (mtm) : " << r.total_pnl << "\n";
    if (r.stop_loss_triggers > 0) {
        std::cout << "  stop losses : " << r.stop_loss_triggers << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);

    if (r.unresolved_flatten) {
        std::cerr << "[warn] " << r.security
                  << ": stream ended with an unresolved flatten, position " << r.position << "\n";
    }
    if (r.dropped_flattens > 0) {
        std::cerr << "[warn] " << r.security << ": " << r.dropped_flattens
                  << " end-of-day flatten(s) found no trade before the next day\n";
    }
}

static void print_closing_summary(const std::string& security, const ClosingAuctionSummary& s) {
    std::cout << "  auction     : buy=" << s.buy_entries << " sell=" << s.sell_entries
              << " exits=" << s.vwap_exits << " stops=" << s.stop_losses
              << " flattens=" << s.eod_flattens
              << " filtered(buy/sell)=" << s.filtered_buy << "/" << s.filtered_sell
              << "  [" << security << "]\n";
}

// --------- main ---------

struct Job {
    std::string security;
    const std::vector<MarketEvent>* events = nullptr;

    SessionResult         result;
    ClosingAuctionSummary closing;
    std::string           error;
};

static void run_job(Job& job, const BacktestConfig& cfg, bool closing) {
    try {
        if (closing) {
            auto session = ClosingAuctionSession::create(job.security, cfg);
            session.process(*job.events);
            job.result  = session.result();
            job.closing = session.summary();
        } else {
            auto session = MarketMakerSession::create(job.security, cfg);
            session.process(*job.events);
            job.result = session.result();
        }
    } catch (const std::exception& e) {
        job.error = e.what();
    }
}

int main(int argc, char** argv) {
    bool closing = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--closing") {
            closing = true;
        } else {
            args.push_back(a);
        }
    }

    if (args.size() < 2) {
        std::cerr << "Usage: mmsim_backtest [--closing] <config.json> <events.csv> [output_dir]\n";
        return 1;
    }

    try {
        const BacktestConfig cfg = BacktestConfig::load(args[0]);
        const std::filesystem::path out_dir = args.size() > 2 ? args[2] : "output";
        std::filesystem::create_directories(out_dir);

        LoadStats load_stats;
        const auto by_security = load_events(args[1], load_stats);

        std::cout << "[backtest] strategy=" << (closing ? "closing_auction" : to_string(cfg.variant))
                  << " securities=" << by_security.size()
                  << " lines=" << load_stats.lines
                  << " skipped=" << load_stats.skipped << "\n";

        std::vector<Job> jobs;
        jobs.reserve(by_security.size());
        for (const auto& item : by_security) {
            Job job;
            job.security = item.first;
            job.events   = &item.second;
            jobs.push_back(std::move(job));
        }

        // one worker per security, nothing shared but the read-only config
        std::vector<std::thread> workers;
        workers.reserve(jobs.size());
        for (auto& job : jobs) {
            workers.emplace_back([&job, &cfg, closing]() { run_job(job, cfg, closing); });
        }
        for (auto& t : workers) {
            t.join();
        }

        double total_realized = 0.0;
        double total_mtm      = 0.0;
        int    failures       = 0;

        for (const auto& job : jobs) {
            if (!job.error.empty()) {
                std::cerr << "[backtest] " << job.security << " failed: " << job.error << "\n";
                ++failures;
                continue;
            }
            print_summary(job.result);
            if (closing) {
                print_closing_summary(job.security, job.closing);
            }
            write_trades_csv(out_dir, job.result);
            total_realized += job.result.realized_pnl;
            total_mtm      += job.result.total_pnl;
        }

        std::cout << "\n=== Portfolio ===\n"
                  << std::fixed << std::setprecision(2)
                  << "  realized    : " << total_realized << "\n"
                  << "  total (mtm) : " << total_mtm << "\n"
                  << "  output      : " << out_dir.string() << "\n";

        return failures == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[backtest] error: " << e.what() << "\n";
        return 1;
    }
}

#include "mmsim/session_clock.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>

using namespace mmsim;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: mmsim_generate <num_events> <seed> [security]\n";
        return 1;
    }

    const std::size_t   num_events = static_cast<std::size_t>(std::stoull(argv[1]));
    const std::uint32_t seed       = static_cast<std::uint32_t>(std::stoul(argv[2]));
    const std::string   security   = argc > 3 ? argv[3] : "SYNTH";

    if (num_events == 0) {
        std::cerr << "num_events must be positive\n";
        return 1;
    }

    std::mt19937_64 rng(seed);

    // Вероятности типов событий:
    // 0..39  -> BID   (40%)
    // 40..79 -> ASK   (40%)
    // 80..99 -> TRADE (20%)
    std::uniform_int_distribution<int>           event_type_dist(0, 99);
    std::uniform_int_distribution<int>           step_dist(-1, 1);
    std::uniform_int_distribution<int>           level_dist(0, 2);
    std::uniform_int_distribution<std::int64_t>  qty_dist(1, 40);
    std::uniform_int_distribution<std::int64_t>  trade_qty_dist(1, 20);

    constexpr double tick      = 0.01;
    constexpr double lot       = 500.0;
    constexpr int    start_mid = 1000;   // in ticks

    // один торговый день, 09:30 .. 15:00
    const Timestamp day_start = make_timestamp(2025, 5, 6, 9, 30, 0);
    const Timestamp day_end   = make_timestamp(2025, 5, 6, 15, 0, 0);
    const std::int64_t step_ns = std::max<std::int64_t>(1, (day_end - day_start)
                                                            / static_cast<std::int64_t>(num_events));

    int mid_ticks = start_mid;

    std::cout << "security,timestamp,type,price,volume\n";
    std::cout << std::fixed << std::setprecision(2);

    for (std::size_t i = 0; i < num_events; ++i) {
        const Timestamp ts = day_start + static_cast<std::int64_t>(i) * step_ns;

        // случайное блуждание mid, спред минимум 2 тика
        mid_ticks = std::max(10, mid_ticks + step_dist(rng));
        const int bid_ticks = mid_ticks - 1;
        const int ask_ticks = mid_ticks + 1;

        const int r = event_type_dist(rng);
        const std::string ts_str = format_timestamp(ts);

        if (r < 40) {
            const int lvl = level_dist(rng);
            std::cout << security << ',' << ts_str << ",bid,"
                      << (bid_ticks - lvl) * tick << ','
                      << static_cast<std::int64_t>(qty_dist(rng) * lot) << "\n";
        } else if (r < 80) {
            const int lvl = level_dist(rng);
            std::cout << security << ',' << ts_str << ",ask,"
                      << (ask_ticks + lvl) * tick << ','
                      << static_cast<std::int64_t>(qty_dist(rng) * lot) << "\n";
        } else {
            // сделка на одной из сторон
            const bool at_ask = step_dist(rng) > 0;
            std::cout << security << ',' << ts_str << ",trade,"
                      << (at_ask ? ask_ticks : bid_ticks) * tick << ','
                      << static_cast<std::int64_t>(trade_qty_dist(rng) * lot) << "\n";
        }
    }

    return 0;
}

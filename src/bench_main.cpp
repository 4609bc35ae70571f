#include "dispatch_bench.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

static std::atomic<bool> g_running{true};

static void handle_sigint(int) {
    g_running = false;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);

    BenchConfig cfg;
    std::string csvPath;

    std::string error;
    switch (parse_args(argc, argv, cfg, csvPath, error)) {
        case ArgsResult::Help:
            std::cout << usage_text(argv[0]);
            return 0;
        case ArgsResult::Error:
            std::cerr << "[Config] " << error << "\n";
            std::cerr << usage_text(argv[0]);
            return 2;
        case ArgsResult::Ok:
            break;
    }

    try {
        DispatchBench bench(cfg, g_running);

        std::cout << "Dispatching " << cfg.messages << " messages x " << cfg.producers
                  << " producers through capacity " << cfg.capacity << " (Ctrl-C to stop early)\n";
        BenchStats stats = bench.run();
        if (!g_running) std::cerr << "[Signal] SIGINT received. Producers stopped early.\n";

        std::cout << format_report(bench.config(), stats);

        if (!csvPath.empty()) {
            if (!write_csv(stats, csvPath)) {
                std::cerr << "[Bench] could not write " << csvPath << "\n";
                return 1;
            }
            std::cout << "Wrote " << csvPath << "\n";
        }

        if (stats.consumed != stats.produced || stats.duplicates != 0) {
            std::cerr << "[Bench] delivery mismatch: produced " << stats.produced
                      << ", consumed " << stats.consumed << "\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return 1;
    }
    return 0;
}

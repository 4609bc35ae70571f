#include "dispatch_bench.hpp"

#include <exception>
#include <limits>
#include <sstream>

std::string usage_text(const std::string& prog) {
    std::ostringstream out;
    out << "Usage: " << prog << " [options]\n"
        << "  --capacity N          queue capacity (default 1024)\n"
        << "  --producers N         producer threads (default 4)\n"
        << "  --consumers N         consumer threads (default 4)\n"
        << "  --messages N          messages per producer (default 10000)\n"
        << "  --offer-timeout-ms N  producers use offer() with this timeout\n"
        << "  --poll-timeout-ms N   consumers use poll() with this timeout\n"
        << "  --payload N           body bytes per message (default 64)\n"
        << "  --csv FILE            also write results as CSV\n"
        << "  --verbose             per-thread progress on stderr\n";
    return out.str();
}

// Whole-string integer parse; false on junk or overflow.
static bool parse_int(const std::string& s, int64_t& out) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

ArgsResult parse_args(int argc, const char* const* argv, BenchConfig& cfg,
                      std::string& csvPath, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") return ArgsResult::Help;
        if (a == "--verbose") { cfg.verbose = true; continue; }
        if (a == "--csv") {
            if (i+1 >= argc) { error = "--csv expects a file name"; return ArgsResult::Error; }
            csvPath = argv[++i];
            continue;
        }

        bool known = a == "--capacity" || a == "--producers" || a == "--consumers" ||
                     a == "--messages" || a == "--offer-timeout-ms" ||
                     a == "--poll-timeout-ms" || a == "--payload";
        if (!known) { error = "unknown option " + a; return ArgsResult::Error; }

        int64_t v = 0;
        if (i+1 >= argc || !parse_int(argv[i+1], v)) {
            error = a + " expects an integer";
            return ArgsResult::Error;
        }
        ++i;

        if (a == "--producers" || a == "--consumers") {
            // checked before narrowing to int so large values cannot wrap
            if (v < 1 || v > std::numeric_limits<int>::max()) {
                error = a + " must be between 1 and " + std::to_string(std::numeric_limits<int>::max());
                return ArgsResult::Error;
            }
        } else if ((a == "--capacity" || a == "--payload") && v < 0) {
            error = a + " must not be negative";
            return ArgsResult::Error;
        }

        if      (a == "--capacity")         cfg.capacity  = static_cast<size_t>(v);
        else if (a == "--producers")        cfg.producers = static_cast<int>(v);
        else if (a == "--consumers")        cfg.consumers = static_cast<int>(v);
        else if (a == "--messages")         cfg.messages  = v;
        else if (a == "--offer-timeout-ms") cfg.offer_timeout_ms = v;
        else if (a == "--poll-timeout-ms")  cfg.poll_timeout_ms  = v;
        else if (a == "--payload")          cfg.payload   = static_cast<size_t>(v);
    }
    return ArgsResult::Ok;
}

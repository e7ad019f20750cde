#include "../../include/cli/options.hpp"
#include "../../include/common/errors.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace knntune {
namespace cli {

    namespace {

        StoreBacking parse_backing(const std::string& name) {
            if (name == "shared") return StoreBacking::Shared;
            if (name == "file") return StoreBacking::File;
            if (name == "heap") return StoreBacking::Heap;
            throw KnnError("unknown backing '" + name + "'");
        }

        // Non-negative decimal no larger than `limit`.
        unsigned long parse_number(const std::string& flag, const std::string& text,
                                   unsigned long limit = ULONG_MAX) {
            errno = 0;
            char* end = nullptr;
            long v = std::strtol(text.c_str(), &end, 10);
            if (text.empty() || *end != '\0' || v < 0) {
                throw KnnError("bad value for " + flag + ": '" + text + "'");
            }
            if (errno == ERANGE || (unsigned long)v > limit) {
                throw KnnError("value for " + flag + " is too large: '" + text + "'");
            }
            return (unsigned long)v;
        }

        void require(bool ok, const std::string& message) {
            if (!ok) throw KnnError(message);
        }

    } // namespace

    void usage(std::ostream& os, const char* argv0) {
        os << "Usage: " << argv0 << " [options]\n"
           << "  --rows N            synthetic rows to generate (default 1500)\n"
           << "  --seed S            generator seed (default " << config::DEFAULT_SEED << ")\n"
           << "  --workers N         pool size, 0 = hardware threads (default 0)\n"
           << "  --executor E        processes | threads | inline (default processes)\n"
           << "  --backing B         shared | file | heap (default shared)\n"
           << "  --store-path P      file for --backing file (default " << config::STORE_FILE_PATH << ")\n"
           << "  --strategy S        sort | insertion | heap (default sort)\n"
           << "  --k-max K           sweep k = " << config::K_FIRST << ", " << config::K_FIRST + config::K_STEP
           << ", ... < K, K > " << config::K_FIRST << " (default " << config::K_LAST << ")\n"
           << "  --test-every N      every Nth row is testing, >= 2 (default " << config::TEST_EVERY << ")\n"
           << "  --top N             rows of the ranked table to print (default 10)\n"
           << "  --bench             also time the three selection strategies\n"
           << "  --verbose           log pool and trial progress\n";
    }

    Options parse_args(int argc, const char* const* argv) {
        Options opt;
        for (int i = 1; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--bench") { opt.bench = true; continue; }
            if (flag == "--verbose") { opt.tuner.verbose = true; continue; }
            if (flag == "--help" || flag == "-h") { opt.help = true; return opt; }

            if (i + 1 >= argc) throw KnnError("missing value for " + flag);
            std::string value = argv[++i];

            if (flag == "--rows") opt.rows = parse_number(flag, value);
            else if (flag == "--seed") opt.seed = (unsigned int)parse_number(flag, value, UINT_MAX);
            else if (flag == "--workers") opt.tuner.workers = parse_number(flag, value);
            else if (flag == "--executor") opt.tuner.executor = parse_executor(value);
            else if (flag == "--backing") opt.backing = parse_backing(value);
            else if (flag == "--store-path") opt.store_path = value;
            else if (flag == "--strategy") opt.tuner.strategy = parse_strategy(value);
            else if (flag == "--k-max") opt.k_max = (int)parse_number(flag, value, INT_MAX);
            else if (flag == "--test-every") opt.test_every = parse_number(flag, value);
            else if (flag == "--top") opt.top = parse_number(flag, value);
            else throw KnnError("unknown option " + flag);
        }

        // Row 0 is always testing, so test_every >= 2 and rows >= test_every
        // leave at least one row on each side of the split.
        require(opt.test_every >= 2, "--test-every must be at least 2");
        require(opt.rows >= opt.test_every, "--rows must be at least --test-every ("
                                            + std::to_string(opt.test_every) + ")");
        require(opt.k_max > config::K_FIRST,
                "--k-max must be greater than " + std::to_string(config::K_FIRST) + " so at least one k is tried");

        size_t training = opt.rows - (opt.rows + opt.test_every - 1) / opt.test_every;
        int largest_k = config::K_FIRST + (opt.k_max - 1 - config::K_FIRST) / config::K_STEP * config::K_STEP;
        require((size_t)largest_k <= training, "--k-max " + std::to_string(opt.k_max) + " sweeps k up to "
                                               + std::to_string(largest_k) + " but only "
                                               + std::to_string(training) + " rows are training");
        return opt;
    }

} // namespace cli
} // namespace knntune

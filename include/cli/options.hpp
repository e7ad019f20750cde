#pragma once

#include "../common/config.hpp"
#include "../storage/sample_store.hpp"
#include "../core/tuner.hpp"

#include <ostream>
#include <string>

namespace knntune {
namespace cli {

    // Command line of the knntune executable.
    struct Options {
        size_t rows = 1500;
        unsigned int seed = config::DEFAULT_SEED;
        TunerConfig tuner;
        StoreBacking backing = StoreBacking::Shared;
        std::string store_path = config::STORE_FILE_PATH;
        int k_max = config::K_LAST;
        size_t test_every = config::TEST_EVERY;
        size_t top = 10;
        bool bench = false;
        bool help = false;
    };

    void usage(std::ostream& os, const char* argv0);

    // Throws KnnError for an unknown flag, a missing or malformed value, or a
    // value that leaves nothing to run (no rows, no k, no testing split).
    // --help stops parsing and sets Options::help.
    Options parse_args(int argc, const char* const* argv);

} // namespace cli
} // namespace knntune

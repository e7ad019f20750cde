#pragma once

#include <cstddef>

namespace knntune {

    namespace config {

        // ---------------------------------------------------------
        // Store Layout
        // ---------------------------------------------------------

        // Upper bound on distinct class names a store can hold.
        constexpr size_t MAX_CLASSES = 256;

        // Fixed width of one entry in the class-name table (including the terminating NUL).
        constexpr size_t MAX_LABEL_LEN = 64;


        // ---------------------------------------------------------
        // Grid Search Defaults
        // ---------------------------------------------------------

        // k is swept over [K_FIRST, K_LAST) in steps of K_STEP.
        // Odd values avoid most two-way voting ties.
        constexpr int K_FIRST = 1;
        constexpr int K_LAST = 41;
        constexpr int K_STEP = 2;

        // Positional split: every Nth row goes to the testing subset (a 80/20 split).
        constexpr size_t TEST_EVERY = 5;

        // Hash split: rows are dealt into this many buckets by feature hash.
        constexpr size_t HASH_BUCKETS = 60;

        // Seed used by the shuffled partition and by the synthetic dataset generator.
        constexpr unsigned int DEFAULT_SEED = 42;

        // Worker pool size. 0 means "one per hardware thread".
        constexpr size_t DEFAULT_WORKERS = 0;

        // How long the coordinator waits on the result pipe before it checks for dead workers.
        constexpr int POOL_POLL_MS = 100;

        // ---------------------------------------------------------
        // System Settings
        // ---------------------------------------------------------

        // Default path for a file-backed sample store
        constexpr char STORE_FILE_PATH[] = "data/samples.kns";

    } // namespace config

} // namespace knntune

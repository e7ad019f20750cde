#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <algorithm>
#include <optional>

#include "../include/cli/options.hpp"
#include "../include/common/config.hpp"
#include "../include/common/errors.hpp"
#include "../include/common/types.hpp"
#include "../include/storage/sample_store.hpp"
#include "../include/core/classifier.hpp"
#include "../include/core/distance.hpp"
#include "../include/core/partitioner.hpp"
#include "../include/core/sample.hpp"
#include "../include/core/trial.hpp"
#include "../include/core/tuner.hpp"

using namespace knntune;
using namespace std;

namespace {

    // Iris-like records: three species, each a gaussian blob around the real dataset's class means.
    vector<Record> generate_iris(size_t rows, mt19937& rng) {
        struct Species {
            const char* name;
            double mean[4];
            double sd[4];
        };
        const Species species[] = {
            {"Iris-setosa",     {5.01, 3.43, 1.46, 0.25}, {0.35, 0.38, 0.17, 0.11}},
            {"Iris-versicolor", {5.94, 2.77, 4.26, 1.33}, {0.52, 0.31, 0.47, 0.20}},
            {"Iris-virginica",  {6.59, 2.97, 5.55, 2.03}, {0.64, 0.32, 0.55, 0.27}},
        };
        const Schema schema = Schema::iris();

        vector<Record> records;
        records.reserve(rows);
        for (size_t i = 0; i < rows; ++i) {
            const Species& s = species[i % 3];
            Record rec;
            for (size_t f = 0; f < 4; ++f) {
                normal_distribution<double> dist(s.mean[f], s.sd[f]);
                double v = max(0.1, dist(rng));
                ostringstream text;
                text << fixed << setprecision(1) << v;
                rec[schema.features[f]] = text.str();
            }
            rec[schema.label] = s.name;
            records.push_back(rec);
        }
        return records;
    }

    void bench_strategies(const SampleStore& store, const Partition& split) {
        cout << "\n[Benchmark] Selection strategies (k=5, MD)" << endl;
        cout << "| algorithm  | test quality  | time      |" << endl;
        cout << "|------------|---------------|-----------|" << endl;
        for (Strategy s : {Strategy::FullSort, Strategy::BoundedInsertion, Strategy::Heap}) {
            Trial trial(5, Metric::manhattan(), store, split.training, split.testing, s);
            double q = trial.test();
            size_t pass = (size_t)(q * split.testing.size() + 0.5);
            cout << "| " << left << setw(10) << strategy_name(s) << " | q="
                 << right << setw(5) << pass << "/" << setw(5) << split.testing.size() << " | "
                 << fixed << setprecision(3) << setw(7) << trial.elapsed_ms() << "ms |" << defaultfloat << endl;
        }
    }

} // namespace

int main(int argc, char** argv) {
    cli::Options opt;
    try {
        opt = cli::parse_args(argc, argv);
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        cli::usage(cerr, argv[0]);
        return 2;
    }
    if (opt.help) {
        cli::usage(cout, argv[0]);
        return 0;
    }

    cout << "============================================" << endl;
    cout << "   KnnTune: k-NN Hyperparameter Grid Search  " << endl;
    cout << "============================================" << endl;

    try {
        // Generate Data
        mt19937 rng(opt.seed);
        cout << "[Data] Generating " << opt.rows << " iris-like records (seed " << opt.seed << ")..." << endl;
        vector<Record> records = generate_iris(opt.rows, rng);

        // Build the shared store once; every worker reads it in place.
        auto start = chrono::high_resolution_clock::now();
        LoadResult loaded = SampleStore::load(records, Schema::iris(), LoadPolicy::Skip, opt.backing, opt.store_path);
        auto end = chrono::high_resolution_clock::now();
        const SampleStore& store = *loaded.store;
        cout << "[Store] " << store.size() << " rows x " << store.dimensions() << " features, "
             << store.classes().size() << " classes, " << store.block_size() << " bytes"
             << (opt.backing == StoreBacking::Heap ? " (heap)" : opt.backing == StoreBacking::File ? " (file)" : " (shared)")
             << ", " << loaded.rejected.size() << " rejected, "
             << chrono::duration<double, milli>(end - start).count() << " ms" << endl;

        PartitionRule rule = PartitionRule::every_nth(opt.test_every);
        Partition split = knntune::partition(store, rule);
        cout << "[Partition] " << rule.describe() << ": " << split.training.size() << " training, "
             << split.testing.size() << " testing" << endl;

        if (opt.bench) {
            bench_strategies(store, split);
        }

        // Grid Search
        vector<int> ks = k_range(config::K_FIRST, opt.k_max, config::K_STEP);
        vector<Metric> metrics = Metric::family();
        cout << "\n[Tuner] Searching " << ks.size() * metrics.size() << " combinations on "
             << executor_name(opt.tuner.executor) << " (" << resolve_workers(opt.tuner.workers) << " workers)..." << endl;

        start = chrono::high_resolution_clock::now();
        vector<TrialResult> results = knntune::rank(Tuner(opt.tuner).tune(ks, metrics, store, split));
        end = chrono::high_resolution_clock::now();
        cout << "[Tuner] Done. Time: " << chrono::duration<double, milli>(end - start).count() << " ms" << endl;

        // Results
        cout << "\n" << left << setw(6) << "Rank" << setw(6) << "k" << setw(12) << "Metric"
             << setw(10) << "Quality" << "Elapsed (ms)" << endl;
        cout << "--------------------------------------------------------" << endl;
        size_t failed = 0;
        for (size_t i = 0; i < results.size(); ++i) {
            const TrialResult& r = results[i];
            if (!r.ok()) { failed++; continue; }
            if (i >= opt.top) continue;
            cout << left << setw(6) << (i + 1) << setw(6) << r.k << setw(12) << r.metric
                 << setw(10) << fixed << setprecision(3) << r.quality
                 << r.elapsed_ms << defaultfloat << endl;
        }
        if (failed > 0) {
            cerr << "[Tuner] " << failed << " trials failed" << endl;
        }

        // Live classification with the winner
        optional<TrialResult> winner = best(results);
        if (winner) {
            UnknownSample unknown({7.9, 3.2, 4.7, 1.4});
            string label = classify_one(store, split.training, winner->k, Metric::parse(winner->metric),
                                        unknown.features(), opt.tuner.strategy);
            cout << "\n[Classify] k=" << winner->k << " " << winner->metric << ": "
                 << ClassifiedSample(label, unknown) << endl;
        }

        return failed == 0 ? 0 : 1;

    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
}

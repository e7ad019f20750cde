#include "../../include/core/tuner.hpp"
#include "../../include/common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace knntune {

    std::vector<int> k_range(int first, int last, int step) {
        if (step <= 0) {
            throw InvalidHyperparameter("k range step must be positive, got " + std::to_string(step));
        }
        std::vector<int> ks;
        for (int k = first; k < last; k += step) {
            ks.push_back(k);
        }
        return ks;
    }

    std::vector<TrialResult> Tuner::tune(const std::vector<int>& k_values,
                                         const std::vector<Metric>& metrics,
                                         const SampleStore& store,
                                         const IndexList& training,
                                         const IndexList& testing) const {
        if (k_values.empty() || metrics.empty()) {
            throw InvalidHyperparameter("grid search needs at least one k and one metric");
        }
        if (testing.empty()) {
            throw EmptyTestSet();
        }

        // ---------------------------------------------------------
        // 1. Build (and validate) every Trial before any worker starts
        // ---------------------------------------------------------
        std::vector<Trial> trials;
        trials.reserve(k_values.size() * metrics.size());
        for (int k : k_values) {
            for (const Metric& metric : metrics) {
                trials.emplace_back(k, metric, store, training, testing, config_.strategy);
            }
        }

        if (config_.verbose) {
            std::cout << "[Tuner] " << trials.size() << " trials (" << k_values.size() << " k x "
                      << metrics.size() << " metrics), strategy=" << strategy_name(config_.strategy)
                      << ", executor=" << executor_name(config_.executor)
                      << ", workers=" << resolve_workers(config_.workers) << std::endl;
        }

        // ---------------------------------------------------------
        // 2. Fan out, gather by completion
        // ---------------------------------------------------------
        // Runs in whichever worker picks the task up. Trials only read shared state;
        // quality_/elapsed_ms_ of a Trial are touched by that one worker alone.
        Job job = [this, &trials](size_t task) {
            if (config_.on_start) config_.on_start(trials[task]);
            TaskOutcome outcome;
            outcome.value = trials[task].test();
            outcome.elapsed_ms = trials[task].elapsed_ms();
            return outcome;
        };

        std::vector<TrialResult> results;
        results.reserve(trials.size());

        OnComplete collect = [&](const Completion& c) {
            const Trial& trial = trials[c.task];
            TrialResult r;
            r.k = trial.k();
            r.metric = trial.metric().name();
            r.quality = c.outcome.value;
            r.elapsed_ms = c.outcome.elapsed_ms;
            if (!c.outcome.ok) {
                r.quality = 0.0;
                r.error = WorkerFailure(r.k, r.metric, c.outcome.error).what();
                std::cerr << "[Tuner] " << r.error << std::endl;
            } else if (config_.verbose) {
                std::cout << "[Tuner] " << r << std::endl;
            }
            results.push_back(std::move(r));
        };

        auto start = std::chrono::high_resolution_clock::now();
        run_tasks(config_.executor, config_.workers, trials.size(), job, collect, config_.verbose);
        auto end = std::chrono::high_resolution_clock::now();

        if (config_.verbose) {
            std::cout << "[Tuner] Grid search complete: " << results.size() << " results in "
                      << std::chrono::duration<double, std::milli>(end - start).count() << "ms" << std::endl;
        }
        return results;
    }

    std::vector<TrialResult> rank(std::vector<TrialResult> results) {
        std::stable_sort(results.begin(), results.end(), [](const TrialResult& a, const TrialResult& b) {
            if (a.ok() != b.ok()) return a.ok();
            if (a.quality != b.quality) return a.quality > b.quality;
            if (a.elapsed_ms != b.elapsed_ms) return a.elapsed_ms < b.elapsed_ms;
            if (a.k != b.k) return a.k < b.k;
            return a.metric < b.metric;
        });
        return results;
    }

    std::optional<TrialResult> best(const std::vector<TrialResult>& results) {
        std::vector<TrialResult> ranked = rank(results);
        if (ranked.empty() || !ranked.front().ok()) return std::nullopt;
        return ranked.front();
    }

} // namespace knntune

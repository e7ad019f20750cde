#pragma once

#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../storage/sample_store.hpp"
#include "classifier.hpp"
#include "distance.hpp"
#include "partitioner.hpp"
#include "sample.hpp"
#include "trial.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace knntune {

    // A named dataset: one SampleStore plus the training/testing split made from it.
    // Trials made by hyperparameter() borrow both. A later load() or the destruction
    // of this object releases them, after which those Trials throw KnnError on use.
    class TrainingData {
    public:
        using Clock = std::chrono::system_clock;

        explicit TrainingData(std::string name) : name_(std::move(name)) {}

        // Builds the store and partitions it. Replaces anything loaded before.
        // Returns the records skipped under LoadPolicy::Skip.
        const std::vector<InvalidRecord>& load(const std::vector<Record>& records,
                                               const Schema& schema,
                                               const PartitionRule& rule = PartitionRule::every_nth(),
                                               LoadPolicy policy = LoadPolicy::Skip,
                                               StoreBacking backing = StoreBacking::Heap,
                                               const std::string& path = config::STORE_FILE_PATH);

        const std::string& name() const { return name_; }
        bool loaded() const { return dataset_ != nullptr; }

        // Both throw KnnError before load().
        const SampleStore& store() const;
        const Partition& partition() const;

        std::vector<TrainingKnownSample> training() const;
        std::vector<TestingKnownSample> testing() const;

        const std::vector<InvalidRecord>& rejected() const { return rejected_; }

        Trial hyperparameter(int k, const Metric& metric, Strategy strategy = Strategy::FullSort) const;

        // Runs the trial and stamps tested().
        double test(Trial& trial);

        ClassifiedSample classify(const Trial& trial, const UnknownSample& unknown) const;

        const std::optional<Clock::time_point>& uploaded() const { return uploaded_; }
        const std::optional<Clock::time_point>& tested() const { return tested_; }

    private:
        struct Dataset {
            std::unique_ptr<SampleStore> store;
            Partition partition;
        };

        const Dataset& dataset() const;

        std::string name_;
        std::shared_ptr<const Dataset> dataset_;
        std::vector<InvalidRecord> rejected_;
        std::optional<Clock::time_point> uploaded_;
        std::optional<Clock::time_point> tested_;
    };

} // namespace knntune

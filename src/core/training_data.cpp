#include "../../include/core/training_data.hpp"

namespace knntune {

    const std::vector<InvalidRecord>& TrainingData::load(const std::vector<Record>& records,
                                                         const Schema& schema,
                                                         const PartitionRule& rule,
                                                         LoadPolicy policy,
                                                         StoreBacking backing,
                                                         const std::string& path) {
        LoadResult loaded = SampleStore::load(records, schema, policy, backing, path);

        // Swap in only once both steps succeeded.
        auto next = std::make_shared<Dataset>();
        next->partition = rule.apply(*loaded.store);
        next->store = std::move(loaded.store);
        dataset_ = std::move(next);
        rejected_ = std::move(loaded.rejected);
        uploaded_ = Clock::now();
        tested_.reset();
        return rejected_;
    }

    const TrainingData::Dataset& TrainingData::dataset() const {
        if (!dataset_) {
            throw KnnError("training data '" + name_ + "' has not been loaded");
        }
        return *dataset_;
    }

    const SampleStore& TrainingData::store() const {
        return *dataset().store;
    }

    const Partition& TrainingData::partition() const {
        return dataset().partition;
    }

    std::vector<TrainingKnownSample> TrainingData::training() const {
        return training_views(store(), partition().training);
    }

    std::vector<TestingKnownSample> TrainingData::testing() const {
        return testing_views(store(), partition().testing);
    }

    Trial TrainingData::hyperparameter(int k, const Metric& metric, Strategy strategy) const {
        const Dataset& data = dataset();
        Trial trial(k, metric, *data.store, data.partition.training, data.partition.testing, strategy);
        trial.tie_to(dataset_);
        return trial;
    }

    double TrainingData::test(Trial& trial) {
        double quality = trial.test();
        tested_ = Clock::now();
        return quality;
    }

    ClassifiedSample TrainingData::classify(const Trial& trial, const UnknownSample& unknown) const {
        return trial.classify(unknown);
    }

} // namespace knntune

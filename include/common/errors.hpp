#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace knntune {

    // Base of every error raised by the engine.
    class KnnError : public std::runtime_error {
    public:
        explicit KnnError(const std::string& what) : std::runtime_error(what) {}
    };

    // A raw record failed field or numeric validation while building a SampleStore.
    // record_number is 1-based, in input order.
    class InvalidRecord : public KnnError {
    public:
        InvalidRecord(size_t record_number, const std::string& reason)
            : KnnError("invalid record " + std::to_string(record_number) + ": " + reason),
              record_number_(record_number), reason_(reason) {}

        size_t record_number() const { return record_number_; }
        const std::string& reason() const { return reason_; }

    private:
        size_t record_number_;
        std::string reason_;
    };

    // k out of range, Minkowski exponent below 1, query of the wrong dimension, ...
    class InvalidHyperparameter : public KnnError {
    public:
        explicit InvalidHyperparameter(const std::string& reason)
            : KnnError("invalid hyperparameter: " + reason) {}
    };

    class EmptyTestSet : public KnnError {
    public:
        EmptyTestSet() : KnnError("testing set is empty, quality is undefined") {}
    };

    // A trial raised (or its worker died) while running inside the pool.
    // The tuner folds this into a failed TrialResult instead of throwing it.
    class WorkerFailure : public KnnError {
    public:
        WorkerFailure(int k, const std::string& metric, const std::string& reason)
            : KnnError("trial k=" + std::to_string(k) + " metric=" + metric + " failed: " + reason),
              k_(k), metric_(metric) {}

        int k() const { return k_; }
        const std::string& metric() const { return metric_; }

    private:
        int k_;
        std::string metric_;
    };

    // mmap / file level failures of the shared region.
    class StoreError : public KnnError {
    public:
        explicit StoreError(const std::string& what) : KnnError(what) {}
    };

} // namespace knntune

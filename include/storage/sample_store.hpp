#pragma once

#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../common/types.hpp"
#include "mmap_handler.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace knntune {

    class KnownSample;

    // Where the sample block lives.
    enum class StoreBacking {
        Heap,    // private buffer; forked workers each get a copy-on-write copy
        Shared,  // anonymous MAP_SHARED region; forked workers map the same pages
        File     // MAP_SHARED view of a file; can be re-opened later with SampleStore::open()
    };

    // What load() does with a record that fails validation.
    enum class LoadPolicy {
        Skip,    // report it (log + LoadResult::rejected) and keep going
        Abort    // throw the first InvalidRecord, nothing is loaded
    };

    // Names of the fields a record must carry.
    struct Schema {
        std::vector<std::string> features;
        std::string label = "species";

        // Closed set of accepted class names. Empty means "any non-empty label".
        std::vector<std::string> classes;

        // sepal_length, sepal_width, petal_length, petal_width + species
        static Schema iris();
    };

    // ---------------------------------------------------------
    // On-block layout
    // ---------------------------------------------------------
    // [StoreHeader][rows: rows * stride slots][class table][field-name table]
    // Row i occupies slots [i * stride, i * stride + stride):
    // the first `dimensions` slots are feature values, the last one is the class index.
    struct StoreHeader {
        char magic[8];
        uint64_t rows;
        uint64_t dimensions;
        uint64_t stride;
        uint64_t class_count;
        uint64_t rows_offset;
        uint64_t classes_offset;
        uint64_t fields_offset;
    };

    constexpr char STORE_MAGIC[8] = {'K', 'N', 'N', 'S', 'T', 'O', 'R', '1'};

    class SampleStore;

    struct LoadResult {
        std::unique_ptr<SampleStore> store;
        std::vector<InvalidRecord> rejected;
    };

    // Immutable, fixed-stride block of labeled feature vectors.
    // Frozen once load() returns: any number of threads or forked processes
    // may read it concurrently without synchronization.
    class SampleStore {
    public:
        ~SampleStore();

        SampleStore(const SampleStore&) = delete;
        SampleStore& operator=(const SampleStore&) = delete;

        // Validates and packs records into a new block.
        // Record numbers in errors are 1-based positions in `records`.
        static LoadResult load(const std::vector<Record>& records,
                               const Schema& schema,
                               LoadPolicy policy = LoadPolicy::Skip,
                               StoreBacking backing = StoreBacking::Heap,
                               const std::string& path = config::STORE_FILE_PATH);

        // Maps a block previously written with StoreBacking::File.
        static std::unique_ptr<SampleStore> open(const std::string& path);

        size_t size() const { return rows_; }
        bool empty() const { return rows_ == 0; }
        size_t dimensions() const { return dimensions_; }
        size_t stride() const { return dimensions_ + 1; }

        // Pointer to `dimensions()` contiguous feature values of a row. No copy.
        const val_t* features(row_t row) const {
            return slots_ + (size_t)row * stride();
        }

        uint32_t class_index(row_t row) const {
            return static_cast<uint32_t>(slots_[(size_t)row * stride() + dimensions_]);
        }

        const std::string& label(row_t row) const {
            return classes_[class_index(row)];
        }

        // Flyweight view on one row.
        KnownSample row(row_t row) const;

        // Bounds-checked row access for callers holding untrusted indices.
        KnownSample at(row_t row) const;

        const std::vector<std::string>& classes() const { return classes_; }
        const Schema& schema() const { return schema_; }
        StoreBacking backing() const { return backing_; }

        // Size in bytes of the whole block (header, rows and tables).
        size_t block_size() const { return block_size_; }

    private:
        SampleStore() = default;

        // Decodes the header and tables of a fully written block.
        void attach(const unsigned char* block, size_t block_size);

        StoreBacking backing_ = StoreBacking::Heap;
        std::unique_ptr<MMapHandler> region_;   // Shared / File
        std::vector<uint64_t> heap_;            // Heap (uint64_t keeps slots 8-byte aligned)

        const val_t* slots_ = nullptr;
        size_t rows_ = 0;
        size_t dimensions_ = 0;
        size_t block_size_ = 0;

        std::vector<std::string> classes_;
        Schema schema_;
    };

    // Parses one feature field. Throws InvalidRecord on empty, trailing garbage or non-finite input.
    val_t parse_feature(const std::string& text, const std::string& field, size_t record_number);

} // namespace knntune

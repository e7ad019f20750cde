#include "../../include/storage/sample_store.hpp"
#include "../../include/core/sample.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace knntune {

    namespace {

        // Round up to the next multiple of 64 so each region starts on a cache line.
        size_t align_up(size_t n) {
            return (n + 63) & ~size_t(63);
        }

        std::string trim(const std::string& s) {
            size_t b = 0, e = s.size();
            while (b < e && std::isspace((unsigned char)s[b])) ++b;
            while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
            return s.substr(b, e - b);
        }

        void write_name(unsigned char* slot, const std::string& name) {
            std::memset(slot, 0, config::MAX_LABEL_LEN);
            std::memcpy(slot, name.data(), std::min(name.size(), config::MAX_LABEL_LEN - 1));
        }

        std::string read_name(const unsigned char* slot) {
            const char* p = reinterpret_cast<const char*>(slot);
            return std::string(p, strnlen(p, config::MAX_LABEL_LEN));
        }

        // A record that passed validation, waiting to be packed.
        struct ParsedRow {
            Features values;
            uint32_t class_index;
        };

    } // namespace

    Schema Schema::iris() {
        Schema s;
        s.features = {"sepal_length", "sepal_width", "petal_length", "petal_width"};
        s.label = "species";
        return s;
    }

    val_t parse_feature(const std::string& text, const std::string& field, size_t record_number) {
        std::string t = trim(text);
        if (t.empty()) {
            throw InvalidRecord(record_number, "field '" + field + "' is empty");
        }

        errno = 0;
        char* end = nullptr;
        double v = std::strtod(t.c_str(), &end);
        if (end != t.c_str() + t.size()) {
            throw InvalidRecord(record_number, "field '" + field + "' is not a number: '" + text + "'");
        }
        if (errno == ERANGE || !std::isfinite(v)) {
            throw InvalidRecord(record_number, "field '" + field + "' is out of range: '" + text + "'");
        }
        return v;
    }

    SampleStore::~SampleStore() = default;

    LoadResult SampleStore::load(const std::vector<Record>& records,
                                 const Schema& schema,
                                 LoadPolicy policy,
                                 StoreBacking backing,
                                 const std::string& path) {
        if (schema.features.empty()) {
            throw KnnError("schema has no feature fields");
        }
        for (const auto& name : schema.features) {
            if (name.size() >= config::MAX_LABEL_LEN) {
                throw KnnError("feature name '" + name + "' is too long");
            }
        }
        if (schema.classes.size() > config::MAX_CLASSES) {
            throw KnnError("schema lists more than " + std::to_string(config::MAX_CLASSES) + " classes");
        }

        LoadResult result;
        const size_t dim = schema.features.size();

        // The class table starts with the declared classes (in order), then grows in first-seen order.
        std::vector<std::string> classes = schema.classes;
        std::vector<ParsedRow> parsed;
        parsed.reserve(records.size());

        // ---------------------------------------------------------
        // 1. Validate every record
        // ---------------------------------------------------------
        for (size_t i = 0; i < records.size(); ++i) {
            const Record& rec = records[i];
            const size_t number = i + 1;

            try {
                ParsedRow row;
                row.values.reserve(dim);
                for (const auto& field : schema.features) {
                    auto it = rec.find(field);
                    if (it == rec.end()) {
                        throw InvalidRecord(number, "missing field '" + field + "'");
                    }
                    row.values.push_back(parse_feature(it->second, field, number));
                }

                auto lit = rec.find(schema.label);
                if (lit == rec.end()) {
                    throw InvalidRecord(number, "missing field '" + schema.label + "'");
                }
                std::string label = trim(lit->second);
                if (label.empty()) {
                    throw InvalidRecord(number, "label '" + schema.label + "' is empty");
                }
                if (label.size() >= config::MAX_LABEL_LEN) {
                    throw InvalidRecord(number, "label '" + label + "' is longer than "
                                                + std::to_string(config::MAX_LABEL_LEN - 1) + " characters");
                }

                auto cit = std::find(classes.begin(), classes.end(), label);
                if (cit == classes.end()) {
                    if (!schema.classes.empty()) {
                        throw InvalidRecord(number, "unknown class '" + label + "'");
                    }
                    if (classes.size() == config::MAX_CLASSES) {
                        throw InvalidRecord(number, "too many distinct classes");
                    }
                    classes.push_back(label);
                    cit = classes.end() - 1;
                }
                row.class_index = static_cast<uint32_t>(cit - classes.begin());
                parsed.push_back(std::move(row));

            } catch (const InvalidRecord& e) {
                if (policy == LoadPolicy::Abort) {
                    throw;
                }
                std::cerr << "[Store] Skipping " << e.what() << std::endl;
                result.rejected.push_back(e);
            }
        }

        // ---------------------------------------------------------
        // 2. Lay out the block
        // ---------------------------------------------------------
        const size_t stride = dim + 1;
        const size_t rows_offset = align_up(sizeof(StoreHeader));
        const size_t classes_offset = align_up(rows_offset + parsed.size() * stride * sizeof(val_t));
        const size_t fields_offset = align_up(classes_offset + classes.size() * config::MAX_LABEL_LEN);
        const size_t total = align_up(fields_offset + (dim + 1) * config::MAX_LABEL_LEN);

        std::unique_ptr<SampleStore> store(new SampleStore());
        store->backing_ = backing;

        unsigned char* block = nullptr;
        switch (backing) {
            case StoreBacking::Heap:
                store->heap_.assign(total / sizeof(uint64_t), 0);
                block = reinterpret_cast<unsigned char*>(store->heap_.data());
                break;
            case StoreBacking::Shared:
                store->region_.reset(new MMapHandler());
                store->region_->open_anonymous(total);
                block = static_cast<unsigned char*>(store->region_->get_data());
                break;
            case StoreBacking::File:
                store->region_.reset(new MMapHandler());
                store->region_->open_file(path, total);
                // An older, larger store at the same path: shrink it so no stale bytes remain.
                if (store->region_->get_size() != total) {
                    store->region_->close_file();
                    std::filesystem::resize_file(path, total);
                    store->region_->open_file(path, total);
                }
                block = static_cast<unsigned char*>(store->region_->get_data());
                break;
        }

        // ---------------------------------------------------------
        // 3. Pack rows and tables
        // ---------------------------------------------------------
        StoreHeader header;
        std::memcpy(header.magic, STORE_MAGIC, sizeof(header.magic));
        header.rows = parsed.size();
        header.dimensions = dim;
        header.stride = stride;
        header.class_count = classes.size();
        header.rows_offset = rows_offset;
        header.classes_offset = classes_offset;
        header.fields_offset = fields_offset;
        std::memcpy(block, &header, sizeof(header));

        val_t* slots = reinterpret_cast<val_t*>(block + rows_offset);
        for (size_t r = 0; r < parsed.size(); ++r) {
            val_t* row = slots + r * stride;
            std::copy(parsed[r].values.begin(), parsed[r].values.end(), row);
            row[dim] = static_cast<val_t>(parsed[r].class_index);
        }

        for (size_t c = 0; c < classes.size(); ++c) {
            write_name(block + classes_offset + c * config::MAX_LABEL_LEN, classes[c]);
        }
        for (size_t f = 0; f < dim; ++f) {
            write_name(block + fields_offset + f * config::MAX_LABEL_LEN, schema.features[f]);
        }
        write_name(block + fields_offset + dim * config::MAX_LABEL_LEN, schema.label);

        // ---------------------------------------------------------
        // 4. Freeze
        // ---------------------------------------------------------
        if (store->region_) {
            store->region_->sync();
            store->region_->seal();
        }
        store->attach(block, total);
        store->schema_.classes = schema.classes;

        result.store = std::move(store);
        return result;
    }

    std::unique_ptr<SampleStore> SampleStore::open(const std::string& path) {
        std::unique_ptr<SampleStore> store(new SampleStore());
        store->backing_ = StoreBacking::File;
        store->region_.reset(new MMapHandler());
        store->region_->open_existing(path);
        store->attach(static_cast<const unsigned char*>(store->region_->get_data()),
                      store->region_->get_size());
        return store;
    }

    void SampleStore::attach(const unsigned char* block, size_t block_size) {
        if (block_size < sizeof(StoreHeader)) {
            throw StoreError("store block is smaller than its header");
        }
        StoreHeader header;
        std::memcpy(&header, block, sizeof(header));
        if (std::memcmp(header.magic, STORE_MAGIC, sizeof(header.magic)) != 0) {
            throw StoreError("store block has a bad magic number");
        }
        if (header.stride != header.dimensions + 1 || header.dimensions == 0
            || header.class_count > config::MAX_CLASSES) {
            throw StoreError("store header is corrupt");
        }
        const size_t fields_end = header.fields_offset + (header.dimensions + 1) * config::MAX_LABEL_LEN;
        const size_t rows_end = header.rows_offset + header.rows * header.stride * sizeof(val_t);
        if (fields_end > block_size || rows_end > header.classes_offset
            || header.classes_offset + header.class_count * config::MAX_LABEL_LEN > header.fields_offset) {
            throw StoreError("store block is truncated");
        }

        slots_ = reinterpret_cast<const val_t*>(block + header.rows_offset);
        rows_ = header.rows;
        dimensions_ = header.dimensions;
        block_size_ = block_size;

        classes_.clear();
        for (size_t c = 0; c < header.class_count; ++c) {
            classes_.push_back(read_name(block + header.classes_offset + c * config::MAX_LABEL_LEN));
        }
        schema_.features.clear();
        for (size_t f = 0; f < dimensions_; ++f) {
            schema_.features.push_back(read_name(block + header.fields_offset + f * config::MAX_LABEL_LEN));
        }
        schema_.label = read_name(block + header.fields_offset + dimensions_ * config::MAX_LABEL_LEN);

        for (size_t r = 0; r < rows_; ++r) {
            if (class_index((row_t)r) >= classes_.size()) {
                throw StoreError("row " + std::to_string(r) + " has an out-of-range class index");
            }
        }
    }

    KnownSample SampleStore::row(row_t row) const {
        return KnownSample(*this, row);
    }

    KnownSample SampleStore::at(row_t row) const {
        if (row >= rows_) {
            throw std::out_of_range("row " + std::to_string(row) + " out of range (size "
                                    + std::to_string(rows_) + ")");
        }
        return KnownSample(*this, row);
    }

} // namespace knntune

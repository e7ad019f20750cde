/**
 * Unit Tests for SampleStore
 *
 * Tests cover:
 * - Packing valid records (heap, shared and file backing)
 * - Skip and abort policies for malformed records
 * - Field validation messages
 * - Flyweight views
 * - Re-opening a file backed store
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "../include/common/errors.hpp"
#include "../include/core/sample.hpp"
#include "../include/storage/sample_store.hpp"
#include "test_helpers.hpp"

using namespace knntune;
using namespace knntune::testing_support;

class SampleStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_ = make_schema(4);
        path_ = (std::filesystem::temp_directory_path() /
                 ("knntune_store_" + std::to_string(getpid()) + "_" +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".kns")).string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    Schema schema_;
    std::string path_;
};

TEST_F(SampleStoreTest, LoadsEveryValidRecord) {
    LoadResult loaded = SampleStore::load(abcd_records(), schema_);
    const SampleStore& store = *loaded.store;

    EXPECT_TRUE(loaded.rejected.empty());
    EXPECT_EQ(store.size(), 4u);
    EXPECT_EQ(store.dimensions(), 4u);
    EXPECT_EQ(store.stride(), 5u);
    EXPECT_EQ(store.backing(), StoreBacking::Heap);

    const val_t* row2 = store.features(2);
    EXPECT_DOUBLE_EQ(row2[0], 3.0);
    EXPECT_DOUBLE_EQ(row2[3], 6.0);
    EXPECT_EQ(store.label(2), "c");
}

TEST_F(SampleStoreTest, ClassTableKeepsFirstSeenOrder) {
    std::vector<Record> records = {
        make_record(Features{1, 1}, "y"),
        make_record(Features{2, 2}, "x"),
        make_record(Features{3, 3}, "y"),
    };
    LoadResult loaded = SampleStore::load(records, make_schema(2));
    const SampleStore& store = *loaded.store;

    ASSERT_EQ(store.classes().size(), 2u);
    EXPECT_EQ(store.classes()[0], "y");
    EXPECT_EQ(store.classes()[1], "x");
    EXPECT_EQ(store.class_index(2), 0u);
}

TEST_F(SampleStoreTest, SkipPolicyReportsBadRecordAndKeepsSibling) {
    std::vector<Record> records = {
        make_record(std::vector<std::string>{"5.1", "3.5", "1.4", "0.2"}, "Iris-setosa"),
        make_record(std::vector<std::string>{"5.1", "abc", "1.4", "0.2"}, "Iris-setosa"),
    };
    LoadResult loaded = SampleStore::load(records, schema_, LoadPolicy::Skip);

    ASSERT_EQ(loaded.store->size(), 1u);
    EXPECT_DOUBLE_EQ(loaded.store->features(0)[0], 5.1);

    ASSERT_EQ(loaded.rejected.size(), 1u);
    EXPECT_EQ(loaded.rejected[0].record_number(), 2u);
    EXPECT_NE(loaded.rejected[0].reason().find("not a number"), std::string::npos);
    EXPECT_NE(loaded.rejected[0].reason().find("f1"), std::string::npos);
}

TEST_F(SampleStoreTest, AbortPolicyThrowsFirstBadRecord) {
    std::vector<Record> records = abcd_records();
    records.push_back(make_record(std::vector<std::string>{"1", "2", "", "4"}, "e"));
    records.push_back(make_record(std::vector<std::string>{"1", "x", "3", "4"}, "e"));

    try {
        SampleStore::load(records, schema_, LoadPolicy::Abort);
        FAIL() << "expected InvalidRecord";
    } catch (const InvalidRecord& e) {
        EXPECT_EQ(e.record_number(), 5u);
        EXPECT_NE(e.reason().find("empty"), std::string::npos);
    }
}

TEST_F(SampleStoreTest, RejectsMissingFieldAndEmptyLabel) {
    Record missing = make_record(Features{1, 2, 3}, "a");
    Record blank = make_record(Features{1, 2, 3, 4}, "   ");
    LoadResult loaded = SampleStore::load({missing, blank}, schema_);

    EXPECT_EQ(loaded.store->size(), 0u);
    EXPECT_TRUE(loaded.store->empty());
    ASSERT_EQ(loaded.rejected.size(), 2u);
    EXPECT_NE(loaded.rejected[0].reason().find("missing field 'f3'"), std::string::npos);
    EXPECT_EQ(loaded.rejected[1].record_number(), 2u);
    EXPECT_NE(loaded.rejected[1].reason().find("empty"), std::string::npos);
}

TEST_F(SampleStoreTest, DeclaredClassesRejectUnknownLabels) {
    schema_.classes = {"a", "b"};
    LoadResult loaded = SampleStore::load(abcd_records(), schema_);

    EXPECT_EQ(loaded.store->size(), 2u);
    ASSERT_EQ(loaded.rejected.size(), 2u);
    EXPECT_NE(loaded.rejected[0].reason().find("unknown class 'c'"), std::string::npos);
    EXPECT_EQ(loaded.store->schema().classes.size(), 2u);
}

TEST_F(SampleStoreTest, EmptySchemaThrows) {
    EXPECT_THROW(SampleStore::load(abcd_records(), Schema()), KnnError);
}

TEST_F(SampleStoreTest, ParseFeatureAcceptsSurroundingWhitespace) {
    EXPECT_DOUBLE_EQ(parse_feature(" 4.25 ", "f0", 1), 4.25);
    EXPECT_DOUBLE_EQ(parse_feature("-1e2", "f0", 1), -100.0);
}

TEST_F(SampleStoreTest, ParseFeatureRejectsGarbage) {
    EXPECT_THROW(parse_feature("4.2cm", "f0", 3), InvalidRecord);
    EXPECT_THROW(parse_feature("", "f0", 3), InvalidRecord);
    EXPECT_THROW(parse_feature("nan", "f0", 3), InvalidRecord);
    EXPECT_THROW(parse_feature("1e999", "f0", 3), InvalidRecord);
}

TEST_F(SampleStoreTest, ViewsReadTheBlockInPlace) {
    LoadResult loaded = SampleStore::load(abcd_records(), schema_);
    const SampleStore& store = *loaded.store;

    KnownSample view = store.row(1);
    EXPECT_EQ(view.features(), store.features(1));
    EXPECT_EQ(view.label(), "b");
    EXPECT_DOUBLE_EQ(view[3], 5.0);
    EXPECT_EQ(view.to_features(), (Features{2, 3, 4, 5}));

    EXPECT_THROW(store.at(4), std::out_of_range);
}

TEST_F(SampleStoreTest, SharedBackingMatchesHeapBacking) {
    LoadResult heap = SampleStore::load(abcd_records(), schema_, LoadPolicy::Skip, StoreBacking::Heap);
    LoadResult shared = SampleStore::load(abcd_records(), schema_, LoadPolicy::Skip, StoreBacking::Shared);

    EXPECT_EQ(shared.store->backing(), StoreBacking::Shared);
    ASSERT_EQ(shared.store->size(), heap.store->size());
    EXPECT_EQ(shared.store->block_size(), heap.store->block_size());
    for (row_t r = 0; r < heap.store->size(); ++r) {
        EXPECT_EQ(shared.store->row(r), heap.store->row(r));
    }
}

TEST_F(SampleStoreTest, FileBackedStoreCanBeReopened) {
    {
        LoadResult written = SampleStore::load(abcd_records(), schema_, LoadPolicy::Skip,
                                               StoreBacking::File, path_);
        EXPECT_EQ(written.store->backing(), StoreBacking::File);
    }

    std::unique_ptr<SampleStore> reopened = SampleStore::open(path_);
    ASSERT_EQ(reopened->size(), 4u);
    EXPECT_EQ(reopened->dimensions(), 4u);
    EXPECT_EQ(reopened->label(3), "d");
    EXPECT_DOUBLE_EQ(reopened->features(3)[0], 4.0);
    EXPECT_EQ(reopened->schema().features, schema_.features);
    EXPECT_EQ(reopened->schema().label, "label");
}

TEST_F(SampleStoreTest, RewritingASmallerFileStoreLeavesNoStaleRows) {
    SampleStore::load(random_records(200, 4, 3, 7), schema_, LoadPolicy::Skip, StoreBacking::File, path_);
    LoadResult smaller = SampleStore::load(abcd_records(), schema_, LoadPolicy::Skip, StoreBacking::File, path_);

    EXPECT_EQ(std::filesystem::file_size(path_), smaller.store->block_size());
    EXPECT_EQ(SampleStore::open(path_)->size(), 4u);
}

TEST_F(SampleStoreTest, OpenRejectsForeignFile) {
    {
        std::ofstream out(path_, std::ios::binary);
        out << std::string(256, 'z');
    }
    EXPECT_THROW(SampleStore::open(path_), StoreError);
}

TEST_F(SampleStoreTest, KnownSamplePrintsFieldNames) {
    LoadResult loaded = SampleStore::load(abcd_records(), schema_);
    std::ostringstream out;
    out << loaded.store->row(0);
    EXPECT_EQ(out.str(), "KnownSample(row=0, f0=1, f1=2, f2=3, f3=4, label='a')");
}

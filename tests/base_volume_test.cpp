#include "base_volume.hpp"
#include "test_utils.hpp"
#include "volume_errors.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class BaseVolumeTest : public ::testing::Test {
  protected:
    BaseVolume vol = make_scenario_volume();
};

// Exposes the two-phase construction path derived classes use.
class BootstrapVolume : public BaseVolume {
  public:
    BootstrapVolume() = default;
    using BaseVolume::initialise;
};

TEST_F(BaseVolumeTest, ShapeAndMandatoryFields) {
    EXPECT_TRUE(vol.initialised());
    EXPECT_EQ(vol.nsamples(), 4u);
    EXPECT_EQ(vol.nfeatures(), 3u);
    EXPECT_EQ(vol.data().rows(), 4);
    EXPECT_EQ(vol.data().cols(), 3);

    for (const auto &name : standard_field_names()) {
        EXPECT_TRUE(vol.meta_samples().has_field(name)) << name;
        EXPECT_TRUE(vol.meta_features().has_field(name)) << name;
    }
    EXPECT_TRUE(vol.meta_field(Axis::Features, "labels").is_unset());
    EXPECT_EQ(vol.meta_field(Axis::Features, "roi").numeric_values(), (std::vector<double>{ 7, 8, 7 }));
}

TEST_F(BaseVolumeTest, OrderIsFilledOnBothAxes) {
    EXPECT_EQ(vol.meta_field(Axis::Samples, "order").numeric_values(), (std::vector<double>{ 1, 2, 3, 4 }));
    EXPECT_EQ(vol.meta_field(Axis::Features, "order").numeric_values(), (std::vector<double>{ 1, 2, 3 }));
}

TEST_F(BaseVolumeTest, DescriptorsReflectTables) {
    const FieldDescriptor &chunks = vol.desc(Axis::Samples).at("chunks");
    EXPECT_EQ(chunks.count, 2u);
    EXPECT_EQ(chunks.inverse_index, (std::vector<std::size_t>{ 0, 0, 1, 1 }));
    EXPECT_EQ(vol.desc(Axis::Features).at("roi").count, 2u);
    EXPECT_EQ(vol.desc(Axis::Features).at("labels").count, 0u);
}

TEST_F(BaseVolumeTest, CallerTablesAreNotModified) {
    VolumeOptions options;
    options.metasamples = MetaTable{ { "chunks", { 1, 2 } } };
    MetaTable const before = options.metasamples;
    BaseVolume const v(Eigen::MatrixXd::Zero(2, 2), options);
    EXPECT_EQ(options.metasamples, before);
    EXPECT_FALSE(options.metasamples.has_field("order"));
}

TEST(BaseVolumeConstructionTest, MalformedChunksThrowShapeMismatch) {
    VolumeOptions options;
    options.metasamples = MetaTable{ { "chunks", { 1, 1, 2 } } };
    try {
        BaseVolume const v(make_position_data(4, 3), options);
        FAIL() << "Expected ShapeMismatch";
    } catch (const ShapeMismatch &e) {
        EXPECT_EQ(e.field(), "chunks");
        EXPECT_EQ(e.actual_length(), 3u);
        EXPECT_EQ(e.expected_length(), 4u);
    }
}

TEST(BaseVolumeConstructionTest, FeatureFieldMismatchThrows) {
    VolumeOptions options;
    options.metafeatures = MetaTable{ { "names", { "a", "b" } } };
    EXPECT_THROW(BaseVolume(make_position_data(4, 3), options), ShapeMismatch);
}

TEST(BaseVolumeConstructionTest, DefaultsOnlyMandatoryFields) {
    BaseVolume const v(Eigen::MatrixXd::Ones(2, 5));
    EXPECT_EQ(v.meta_samples().field_names(), standard_field_names());
    EXPECT_EQ(v.meta_features().field_names(), standard_field_names());
    EXPECT_EQ(v.meta_field(Axis::Features, "order").length(), 5u);
}

TEST(BaseVolumeConstructionTest, UninitialisedUntilBootstrapped) {
    BootstrapVolume v;
    EXPECT_FALSE(v.initialised());
    EXPECT_THROW(v.get(AxisIndex::all()), std::logic_error);
    EXPECT_THROW(v.zscore(), std::logic_error);

    v.initialise(make_position_data(2, 2), VolumeOptions{});
    EXPECT_TRUE(v.initialised());
    EXPECT_EQ(v.nsamples(), 2u);
}

TEST(BaseVolumeConstructionTest, FailedBootstrapLeavesVolumeUninitialised) {
    BootstrapVolume v;
    VolumeOptions options;
    options.metasamples = MetaTable{ { "labels", { "x" } } };
    EXPECT_THROW(v.initialise(make_position_data(2, 2), options), ShapeMismatch);
    EXPECT_FALSE(v.initialised());
}

// --- Indexing --- //

TEST_F(BaseVolumeTest, FullIndexIsIdentity) {
    auto copy = vol.get(AxisIndex::mask({ true, true, true, true }), AxisIndex::mask({ true, true, true }));
    EXPECT_EQ(copy->data(), vol.data());
    EXPECT_EQ(copy->meta_samples(), vol.meta_samples());
    EXPECT_EQ(copy->meta_features(), vol.meta_features());
}

TEST(BaseVolumeIndexTest, FullIndexKeepsNanMetadataEqual) {
    VolumeOptions options;
    options.metasamples = MetaTable{ { "rt", { std::nan(""), 1.0 } } };
    BaseVolume const v(make_position_data(2, 3), options);
    auto same = v.get(AxisIndex::all(), AxisIndex::all());
    EXPECT_EQ(same->meta_samples(), v.meta_samples());
    EXPECT_EQ(same->meta_features(), v.meta_features());
}

TEST_F(BaseVolumeTest, RowIndexKeepsAllFeatures) {
    auto sub = vol.get(AxisIndex::positions({ 2, 0 }));
    EXPECT_EQ(row_origins(*sub), (std::vector<int>{ 3, 1 }));
    EXPECT_EQ(sub->nfeatures(), 3u);
    EXPECT_EQ(sub->meta_features(), vol.meta_features());
    EXPECT_EQ(sub->meta_field(Axis::Samples, "order").numeric_values(), (std::vector<double>{ 3, 1 }));
    EXPECT_EQ(sub->meta_field(Axis::Samples, "labels").categorical_values(), (std::vector<std::string>{ "A", "A" }));
}

TEST_F(BaseVolumeTest, TwoDimensionalIndex) {
    auto sub = vol.get(AxisIndex::all(), AxisIndex::positions({ 2 }));
    EXPECT_EQ(sub->nsamples(), 4u);
    EXPECT_EQ(column_origins(*sub), (std::vector<int>{ 3 }));
    EXPECT_EQ(sub->meta_field(Axis::Features, "names").categorical_values(), (std::vector<std::string>{ "v3" }));
    EXPECT_EQ(sub->meta_field(Axis::Features, "order").numeric_values(), (std::vector<double>{ 3 }));
}

TEST_F(BaseVolumeTest, DerivedVolumeOwnsItsStorage) {
    auto sub = vol.get(AxisIndex::all());
    sub->set_meta_field(Axis::Samples, "labels", MetaField{ "Z", "Z", "Z", "Z" });
    sub->zscore();
    EXPECT_EQ(vol.meta_field(Axis::Samples, "labels").categorical_values(),
              (std::vector<std::string>{ "A", "B", "A", "B" }));
    EXPECT_EQ(vol.data(), make_position_data());
}

TEST_F(BaseVolumeTest, BadMaskLengthThrows) {
    EXPECT_THROW(vol.get(AxisIndex::mask({ true, false })), ShapeMismatch);
    EXPECT_THROW(vol.get(AxisIndex::all(), AxisIndex::positions({ 3 })), std::out_of_range);
}

// --- Selection --- //

TEST_F(BaseVolumeTest, SelectByChunk) {
    auto sel = vol.select_by_meta(MetaQuery{ { "chunks", 1 } });
    EXPECT_EQ(row_origins(*sel), (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(sel->meta_field(Axis::Samples, "chunks").numeric_values(), (std::vector<double>{ 1, 1 }));
    EXPECT_EQ(sel->nfeatures(), 3u);
    EXPECT_EQ(sel->desc(Axis::Samples).at("chunks").count, 1u);
}

TEST_F(BaseVolumeTest, SelectByLabel) {
    auto sel = vol.select_by_meta(MetaQuery{ { "labels", "A" } });
    EXPECT_EQ(row_origins(*sel), (std::vector<int>{ 1, 3 }));
}

TEST_F(BaseVolumeTest, RemoveByLabel) {
    auto rem = vol.remove_by_meta(MetaQuery{ { "labels", "A" } });
    EXPECT_EQ(row_origins(*rem), (std::vector<int>{ 2, 4 }));
    EXPECT_EQ(rem->nfeatures(), 3u);
}

TEST_F(BaseVolumeTest, SelectAndRemovePartitionConstrainedAxis) {
    MetaQuery const query{ { "names", { "v1", "v3" } } };
    auto sel = vol.select_by_meta(query);
    auto rem = vol.remove_by_meta(query);
    EXPECT_EQ(column_origins(*sel), (std::vector<int>{ 1, 3 }));
    EXPECT_EQ(column_origins(*rem), (std::vector<int>{ 2 }));
    // the samples axis is untouched by a feature-only query
    EXPECT_EQ(sel->nsamples(), 4u);
    EXPECT_EQ(rem->nsamples(), 4u);
}

TEST_F(BaseVolumeTest, RemoveNeverDropsUnconstrainedAxis) {
    auto rem = vol.remove_by_meta(MetaQuery{ { "chunks", 2 } });
    EXPECT_EQ(row_origins(*rem), (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(column_origins(*rem), (std::vector<int>{ 1, 2, 3 }));
}

TEST_F(BaseVolumeTest, SelectionCanBeEmpty) {
    auto sel = vol.select_by_meta(MetaQuery{ { "chunks", 9 } });
    EXPECT_EQ(sel->nsamples(), 0u);
    EXPECT_EQ(sel->meta_field(Axis::Samples, "chunks").length(), 0u);
    EXPECT_TRUE(sel->meta_field(Axis::Samples, "names").is_unset());
}

TEST_F(BaseVolumeTest, SelectionErrorsPropagate) {
    EXPECT_THROW(vol.select_by_meta(MetaQuery{ { "labelz", "A" } }), FieldNotFound);
    EXPECT_THROW(vol.remove_by_meta(MetaQuery{ { "labels", 1 } }), TypeMismatch);
    // names is declared on samples but unset; features carry it, so this is valid
    EXPECT_NO_THROW(vol.select_by_meta(MetaQuery{ { "names", "v2" } }));
}

// --- Metadata mutation --- //

TEST_F(BaseVolumeTest, SetMetaFieldRebuildsDescriptors) {
    vol.set_meta_field(Axis::Samples, "chunks", MetaField{ 1, 2, 3, 4 });
    EXPECT_EQ(vol.desc(Axis::Samples).at("chunks").count, 4u);

    vol.set_meta_field(Axis::Samples, "run", MetaField{ 1, 1, 1, 1 });
    EXPECT_TRUE(vol.desc(Axis::Samples).has_field("run"));
    EXPECT_EQ(vol.desc(Axis::Samples).at("run").count, 1u);
}

TEST_F(BaseVolumeTest, RejectedMetaFieldLeavesVolumeUnchanged) {
    MetaTable const before = vol.meta_samples();
    EXPECT_THROW(vol.set_meta_field(Axis::Samples, "chunks", MetaField{ 1, 2 }), ShapeMismatch);
    EXPECT_EQ(vol.meta_samples(), before);
    EXPECT_EQ(vol.desc(Axis::Samples).at("chunks").count, 2u);
}

TEST_F(BaseVolumeTest, ClearingOrderRefillsIdentity) {
    auto sub = vol.get(AxisIndex::positions({ 3, 1 }));
    sub->set_meta_field(Axis::Samples, "order", MetaField::unset());
    EXPECT_EQ(sub->meta_field(Axis::Samples, "order").numeric_values(), (std::vector<double>{ 1, 2 }));
}

#ifndef BASE_VOLUME_HPP
#define BASE_VOLUME_HPP

#include "axis_index.hpp"
#include "field_descriptor.hpp"
#include "meta_query.hpp"
#include "meta_table.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pilab {

/**
 * @brief Construction options for a volume.
 *
 * Tables left empty still receive the mandatory fields (labels, chunks,
 * names, order) as Unset placeholders.
 */
struct VolumeOptions {
    MetaTable metasamples;  ///< One entry per sample (row) in every non-unset field.
    MetaTable metafeatures; ///< One entry per feature (column) in every non-unset field.
    bool verbose = false;   ///< Print diagnostics to std::cout. Inherited by derived volumes.
};

/**
 * @brief Data matrix (samples x features) with per-axis metadata kept in register.
 *
 * Every selection, indexing and concatenation returns a new, independently
 * owned volume built through the virtual factory methods, so a derived class
 * gets instances of its own type back. Descriptors are rebuilt whenever a
 * metadata table changes.
 *
 * The in-place filters (median_filter, sg_detrend, zscore) change data only
 * and operate per chunk. They are not atomic: if a chunk fails, earlier chunks
 * remain filtered.
 */
class BaseVolume {
  public:
    /**
     * @brief Builds a volume from data and optional metadata tables.
     * @throws ShapeMismatch if a non-unset field does not match its axis length.
     */
    explicit BaseVolume(Eigen::MatrixXd data, VolumeOptions options = {});

    /**
     * @brief Stacks @p operands along the sample axis.
     *
     * Sample metadata is merged with append_table_fields; feature metadata and
     * the verbose flag come from the first operand.
     * @throws std::invalid_argument if @p operands is empty or holds a null or
     *         uninitialised volume.
     * @throws ShapeMismatch if the operands disagree on nfeatures.
     * @throws UnsupportedOperation if a declared feature field differs between
     *         the first operand and a later one.
     */
    explicit BaseVolume(const std::vector<const BaseVolume *> &operands);

    virtual ~BaseVolume() = default;

    bool initialised() const { return initialised_; }
    std::size_t nsamples() const { return nsamples_; }
    std::size_t nfeatures() const { return nfeatures_; }
    bool verbose() const { return verbose_; }

    const Eigen::MatrixXd &data() const { return data_; }

    const MetaTable &meta(Axis axis) const;
    const MetaTable &meta_samples() const { return meta(Axis::Samples); }
    const MetaTable &meta_features() const { return meta(Axis::Features); }

    const AxisDescriptor &desc(Axis axis) const;

    /// @throws FieldNotFound if the axis table does not declare @p name.
    const MetaField &meta_field(Axis axis, const std::string &name) const;

    /**
     * @brief Replaces (or adds) one metadata field and rebuilds descriptors.
     * @throws ShapeMismatch if the new value is out of register; the volume is
     *         left unchanged in that case.
     */
    void set_meta_field(Axis axis, const std::string &name, MetaField value);

    // --- Selection --- //

    MetaMasks find_by_meta(const MetaQuery &query) const;

    /// Samples and features matching every criterion.
    std::unique_ptr<BaseVolume> select_by_meta(const MetaQuery &query) const;

    /// Complement of select_by_meta on each axis the query constrains.
    std::unique_ptr<BaseVolume> remove_by_meta(const MetaQuery &query) const;

    /// Rows only; all features are kept and feature metadata is copied as is.
    std::unique_ptr<BaseVolume> get(const AxisIndex &rows) const;
    std::unique_ptr<BaseVolume> get(const AxisIndex &rows, const AxisIndex &cols) const;

    // --- Concatenation --- //

    /// Stacks this volume followed by @p others via create_from_operands.
    std::unique_ptr<BaseVolume> concat_samples(const std::vector<const BaseVolume *> &others) const;

    /// @throws UnsupportedOperation always.
    std::unique_ptr<BaseVolume> concat_features(const std::vector<const BaseVolume *> &others) const;

    /**
     * @brief Concatenates along dimension @p dim (0 = samples).
     * @throws UnsupportedOperation for any other dimension.
     */
    std::unique_ptr<BaseVolume> concat(int dim, const std::vector<const BaseVolume *> &others) const;

    // --- In-place filters, grouped by chunk --- //

    void median_filter(int window);
    void sg_detrend(int order, int frame);
    void zscore();

    // --- Factory hooks --- //

    /// Builds a volume of this concrete type from sliced parts.
    virtual std::unique_ptr<BaseVolume> create(Eigen::MatrixXd data, VolumeOptions options) const;

    /// Builds a volume of this concrete type by stacking @p operands.
    virtual std::unique_ptr<BaseVolume> create_from_operands(const std::vector<const BaseVolume *> &operands) const;

  protected:
    /// Uninitialised; only for derived classes that call initialise() later.
    BaseVolume() = default;

    // Copying through a base reference would drop derived state; use
    // get(AxisIndex::all()) for a copy of the concrete type.
    BaseVolume(const BaseVolume &) = default;
    BaseVolume(BaseVolume &&) = default;
    BaseVolume &operator=(const BaseVolume &) = default;
    BaseVolume &operator=(BaseVolume &&) = default;

    /**
     * @brief Installs data and metadata, then validates and describes them.
     * Used by the public constructors and by derived-class bootstrapping.
     */
    void initialise(Eigen::MatrixXd data, VolumeOptions options);

    void require_initialised(const char *caller) const;

  private:
    Eigen::MatrixXd data_;
    std::size_t nsamples_ = 0;
    std::size_t nfeatures_ = 0;
    MetaTable meta_samples_;
    MetaTable meta_features_;
    AxisDescriptor desc_samples_;
    AxisDescriptor desc_features_;
    bool verbose_ = false;
    bool initialised_ = false;

    std::unique_ptr<BaseVolume> index_volume(const AxisIndex &rows, const AxisIndex *cols) const;

    /// Row positions of every chunk, in order of the sorted unique chunk ids.
    std::vector<std::vector<Eigen::Index>> chunk_groups(const char *caller) const;

    template<typename Filter>
    void apply_by_chunk(const char *caller, Filter &&filter);
};

} // namespace pilab

#endif // BASE_VOLUME_HPP

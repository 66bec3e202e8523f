#include "base_volume.hpp"
#include "signal_filters.hpp"
#include "table_ops.hpp"
#include "volume_errors.hpp"

#include <iostream>
#include <stdexcept>

namespace pilab {

namespace {

// Feature axes are never merged, so every declared feature field must agree
// between the first operand and a later one.
void
require_matching_features(const MetaTable &first, const MetaTable &other, std::size_t operand) {
    auto check = [&](const MetaTable &declared, const MetaTable &counterpart) {
        for (const auto &[name, field] : declared) {
            if (field.is_unset()) { continue; }
            if (!counterpart.has_field(name) || !(counterpart.field(name) == field)) {
                throw UnsupportedOperation("Feature field '" + name + "' differs between operand 0 and operand " +
                                           std::to_string(operand) + "; feature metadata cannot be merged.");
            }
        }
    };
    check(first, other);
    check(other, first);
}

} // namespace

BaseVolume::BaseVolume(Eigen::MatrixXd data, VolumeOptions options) {
    initialise(std::move(data), std::move(options));
}

BaseVolume::BaseVolume(const std::vector<const BaseVolume *> &operands) {
    if (operands.empty()) { throw std::invalid_argument("Cannot concatenate an empty list of volumes."); }
    for (std::size_t i = 0; i < operands.size(); ++i) {
        if (operands[i] == nullptr || !operands[i]->initialised()) {
            throw std::invalid_argument("Concatenation operand " + std::to_string(i) +
                                        " is not an initialised volume.");
        }
    }

    const BaseVolume &first = *operands.front();
    Eigen::Index total_rows = 0;
    for (std::size_t i = 0; i < operands.size(); ++i) {
        const BaseVolume &op = *operands[i];
        if (op.nfeatures() != first.nfeatures()) {
            throw ShapeMismatch("nfeatures", op.nfeatures(), first.nfeatures(), "concatenation operands");
        }
        if (i > 0) { require_matching_features(first.meta_features(), op.meta_features(), i); }
        total_rows += op.data().rows();
    }

    Eigen::MatrixXd stacked(total_rows, first.data().cols());
    VolumeOptions options;
    options.metasamples = first.meta_samples();
    options.metafeatures = first.meta_features();
    options.verbose = first.verbose();

    Eigen::Index row = 0;
    for (std::size_t i = 0; i < operands.size(); ++i) {
        const BaseVolume &op = *operands[i];
        stacked.middleRows(row, op.data().rows()) = op.data();
        row += op.data().rows();
        if (i > 0) {
            options.metasamples = append_table_fields(options.metasamples, op.meta_samples(), Axis::Samples);
        }
    }

    if (options.verbose) {
        std::cout << "[BaseVolume::BaseVolume] Stacked " << operands.size() << " volumes into " << stacked.rows()
                  << " x " << stacked.cols() << "." << std::endl;
    }
    initialise(std::move(stacked), std::move(options));
}

void
BaseVolume::initialise(Eigen::MatrixXd data, VolumeOptions options) {
    const std::size_t nsamples = static_cast<std::size_t>(data.rows());
    const std::size_t nfeatures = static_cast<std::size_t>(data.cols());

    // Validate into locals first so a failed initialise leaves *this untouched.
    MetaTable samples = with_standard_fields(options.metasamples);
    MetaTable features = with_standard_fields(options.metafeatures);
    AxisDescriptor desc_samples = build_axis_descriptor(samples, nsamples, axis_name(Axis::Samples));
    AxisDescriptor desc_features = build_axis_descriptor(features, nfeatures, axis_name(Axis::Features));

    data_ = std::move(data);
    nsamples_ = nsamples;
    nfeatures_ = nfeatures;
    meta_samples_ = std::move(samples);
    meta_features_ = std::move(features);
    desc_samples_ = std::move(desc_samples);
    desc_features_ = std::move(desc_features);
    verbose_ = options.verbose;
    initialised_ = true;

    if (verbose_) {
        std::cout << "[BaseVolume::initialise] " << nsamples_ << " samples x " << nfeatures_ << " features, "
                  << meta_samples_.size() << " sample fields, " << meta_features_.size() << " feature fields."
                  << std::endl;
    }
}

void
BaseVolume::require_initialised(const char *caller) const {
    if (!initialised_) { throw std::logic_error(std::string("[") + caller + "] Volume has not been initialised."); }
}

const MetaTable &
BaseVolume::meta(Axis axis) const {
    return axis == Axis::Samples ? meta_samples_ : meta_features_;
}

const AxisDescriptor &
BaseVolume::desc(Axis axis) const {
    return axis == Axis::Samples ? desc_samples_ : desc_features_;
}

const MetaField &
BaseVolume::meta_field(Axis axis, const std::string &name) const {
    return meta(axis).field(name);
}

void
BaseVolume::set_meta_field(Axis axis, const std::string &name, MetaField value) {
    require_initialised("BaseVolume::set_meta_field");
    MetaTable updated = meta(axis);
    updated.set_field(name, std::move(value));
    const std::size_t length = axis == Axis::Samples ? nsamples_ : nfeatures_;
    AxisDescriptor rebuilt = build_axis_descriptor(updated, length, axis_name(axis));

    if (axis == Axis::Samples) {
        meta_samples_ = std::move(updated);
        desc_samples_ = std::move(rebuilt);
    } else {
        meta_features_ = std::move(updated);
        desc_features_ = std::move(rebuilt);
    }
}

//-----------------------------------------------------------------------------
// Selection and indexing
//-----------------------------------------------------------------------------

MetaMasks
BaseVolume::find_by_meta(const MetaQuery &query) const {
    require_initialised("BaseVolume::find_by_meta");
    return pilab::find_by_meta(meta_samples_, meta_features_, nsamples_, nfeatures_, query);
}

std::unique_ptr<BaseVolume>
BaseVolume::select_by_meta(const MetaQuery &query) const {
    MetaMasks masks = find_by_meta(query);
    if (verbose_) {
        std::cout << "[BaseVolume::select_by_meta] " << query.size() << " criteria." << std::endl;
    }
    return get(AxisIndex::mask(std::move(masks.samples)), AxisIndex::mask(std::move(masks.features)));
}

std::unique_ptr<BaseVolume>
BaseVolume::remove_by_meta(const MetaQuery &query) const {
    MetaMasks masks = complement_constrained(find_by_meta(query));
    if (verbose_) {
        std::cout << "[BaseVolume::remove_by_meta] " << query.size() << " criteria." << std::endl;
    }
    return get(AxisIndex::mask(std::move(masks.samples)), AxisIndex::mask(std::move(masks.features)));
}

std::unique_ptr<BaseVolume>
BaseVolume::get(const AxisIndex &rows) const {
    return index_volume(rows, nullptr);
}

std::unique_ptr<BaseVolume>
BaseVolume::get(const AxisIndex &rows, const AxisIndex &cols) const {
    return index_volume(rows, &cols);
}

std::unique_ptr<BaseVolume>
BaseVolume::index_volume(const AxisIndex &rows, const AxisIndex *cols) const {
    require_initialised("BaseVolume::get");
    const std::vector<Eigen::Index> row_pos = rows.resolve(nsamples_, axis_name(Axis::Samples));

    VolumeOptions options;
    options.verbose = verbose_;
    options.metasamples = index_table_fields(meta_samples_, row_pos);

    Eigen::MatrixXd sliced;
    if (cols != nullptr) {
        const std::vector<Eigen::Index> col_pos = cols->resolve(nfeatures_, axis_name(Axis::Features));
        sliced = data_(row_pos, col_pos);
        options.metafeatures = index_table_fields(meta_features_, col_pos);
    } else {
        sliced = data_(row_pos, Eigen::all);
        options.metafeatures = meta_features_;
    }

    if (verbose_) {
        std::cout << "[BaseVolume::get] " << nsamples_ << " x " << nfeatures_ << " -> " << sliced.rows() << " x "
                  << sliced.cols() << "." << std::endl;
    }
    return create(std::move(sliced), std::move(options));
}

//-----------------------------------------------------------------------------
// Concatenation
//-----------------------------------------------------------------------------

std::unique_ptr<BaseVolume>
BaseVolume::concat_samples(const std::vector<const BaseVolume *> &others) const {
    require_initialised("BaseVolume::concat_samples");
    std::vector<const BaseVolume *> operands;
    operands.reserve(others.size() + 1);
    operands.push_back(this);
    operands.insert(operands.end(), others.begin(), others.end());
    return create_from_operands(operands);
}

std::unique_ptr<BaseVolume>
BaseVolume::concat_features(const std::vector<const BaseVolume *> & /*others*/) const {
    throw UnsupportedOperation("Concatenation in the feature dimension is not supported.");
}

std::unique_ptr<BaseVolume>
BaseVolume::concat(int dim, const std::vector<const BaseVolume *> &others) const {
    if (dim != static_cast<int>(Axis::Samples)) {
        throw UnsupportedOperation("Concatenation is only supported in the samples dimension (0), got dimension " +
                                   std::to_string(dim) + ".");
    }
    return concat_samples(others);
}

std::unique_ptr<BaseVolume>
BaseVolume::create(Eigen::MatrixXd data, VolumeOptions options) const {
    return std::make_unique<BaseVolume>(std::move(data), std::move(options));
}

std::unique_ptr<BaseVolume>
BaseVolume::create_from_operands(const std::vector<const BaseVolume *> &operands) const {
    return std::make_unique<BaseVolume>(operands);
}

//-----------------------------------------------------------------------------
// Chunk-grouped filters
//-----------------------------------------------------------------------------

std::vector<std::vector<Eigen::Index>>
BaseVolume::chunk_groups(const char *caller) const {
    std::vector<std::vector<Eigen::Index>> groups;
    const FieldDescriptor &chunks = desc_samples_.at(kChunksField);
    if (meta_samples_.field(kChunksField).is_unset()) {
        std::cerr << "[" << caller << "] Warning: no chunks declared, filtering all samples as one chunk."
                  << std::endl;
        std::vector<Eigen::Index> all(nsamples_);
        for (std::size_t i = 0; i < nsamples_; ++i) { all[i] = static_cast<Eigen::Index>(i); }
        groups.push_back(std::move(all));
        return groups;
    }

    groups.resize(chunks.count);
    for (std::size_t i = 0; i < chunks.inverse_index.size(); ++i) {
        groups[chunks.inverse_index[i]].push_back(static_cast<Eigen::Index>(i));
    }
    return groups;
}

template<typename Filter>
void
BaseVolume::apply_by_chunk(const char *caller, Filter &&filter) {
    require_initialised(caller);
    const auto groups = chunk_groups(caller);
    for (std::size_t c = 0; c < groups.size(); ++c) {
        const auto &rows = groups[c];
        if (rows.empty()) { continue; }
        Eigen::MatrixXd block = data_(rows, Eigen::all);
        data_(rows, Eigen::all) = filter(block);
        if (verbose_) {
            std::cout << "[" << caller << "] Filtered chunk " << c + 1 << "/" << groups.size() << " ("
                      << rows.size() << " samples)." << std::endl;
        }
    }
}

void
BaseVolume::median_filter(int window) {
    apply_by_chunk("BaseVolume::median_filter",
                   [window](const Eigen::MatrixXd &block) { return pilab::median_filter(block, window); });
}

void
BaseVolume::sg_detrend(int order, int frame) {
    apply_by_chunk("BaseVolume::sg_detrend", [order, frame](const Eigen::MatrixXd &block) {
        Eigen::MatrixXd trend = savitzky_golay_filter(block, order, frame);
        return Eigen::MatrixXd(block - trend);
    });
}

void
BaseVolume::zscore() {
    apply_by_chunk("BaseVolume::zscore", [](const Eigen::MatrixXd &block) { return pilab::zscore(block); });
}

} // namespace pilab

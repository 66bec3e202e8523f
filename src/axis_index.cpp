#include "axis_index.hpp"
#include "volume_errors.hpp"

#include <algorithm> // For std::count
#include <stdexcept>

namespace pilab {

const char *
axis_name(Axis axis) {
    return axis == Axis::Samples ? "samples" : "features";
}

AxisIndex
AxisIndex::mask(std::vector<bool> mask) {
    AxisIndex index;
    index.kind_ = Kind::Mask;
    index.mask_ = std::move(mask);
    return index;
}

AxisIndex
AxisIndex::positions(std::vector<std::size_t> positions) {
    AxisIndex index;
    index.kind_ = Kind::Positions;
    index.positions_ = std::move(positions);
    return index;
}

std::vector<Eigen::Index>
AxisIndex::resolve(std::size_t axis_length, const std::string &axis_label) const {
    std::vector<Eigen::Index> resolved;
    switch (kind_) {
        case Kind::All:
            resolved.reserve(axis_length);
            for (std::size_t i = 0; i < axis_length; ++i) { resolved.push_back(static_cast<Eigen::Index>(i)); }
            break;
        case Kind::Mask:
            if (mask_.size() != axis_length) { throw ShapeMismatch(axis_label + " mask", mask_.size(), axis_length); }
            for (std::size_t i = 0; i < mask_.size(); ++i) {
                if (mask_[i]) { resolved.push_back(static_cast<Eigen::Index>(i)); }
            }
            break;
        case Kind::Positions:
            resolved.reserve(positions_.size());
            for (std::size_t pos : positions_) {
                if (pos >= axis_length) {
                    throw std::out_of_range("Index " + std::to_string(pos) + " exceeds " + axis_label +
                                            " axis length " + std::to_string(axis_length) + ".");
                }
                resolved.push_back(static_cast<Eigen::Index>(pos));
            }
            break;
    }
    return resolved;
}

std::size_t
AxisIndex::count(std::size_t axis_length) const {
    switch (kind_) {
        case Kind::Mask:
            return static_cast<std::size_t>(std::count(mask_.begin(), mask_.end(), true));
        case Kind::Positions:
            return positions_.size();
        case Kind::All:
            break;
    }
    return axis_length;
}

} // namespace pilab

#ifndef AXIS_INDEX_HPP
#define AXIS_INDEX_HPP

#include <Eigen/Core>
#include <cstddef>
#include <string>
#include <vector>

namespace pilab {

/// The two axes of a volume: rows are samples, columns are features.
enum class Axis { Samples = 0, Features = 1 };

const char *
axis_name(Axis axis);

/**
 * @brief Selection along one axis: everything, a boolean mask, or a list of
 * 0-based positions (repeats and reordering allowed).
 */
class AxisIndex {
  public:
    enum class Kind { All, Mask, Positions };

    /// Equivalent to all().
    AxisIndex() = default;

    static AxisIndex all() { return AxisIndex(); }
    static AxisIndex mask(std::vector<bool> mask);
    static AxisIndex positions(std::vector<std::size_t> positions);

    Kind kind() const { return kind_; }
    bool is_all() const { return kind_ == Kind::All; }

    /**
     * @brief Converts the index into explicit row/column positions.
     *
     * @param axis_length Number of elements along the indexed axis.
     * @param axis_label Used in error messages (e.g. "samples").
     * @throws ShapeMismatch if a mask does not have @p axis_length entries.
     * @throws std::out_of_range if a position is not below @p axis_length.
     */
    std::vector<Eigen::Index> resolve(std::size_t axis_length, const std::string &axis_label) const;

    /// Number of positions selected on an axis of @p axis_length elements.
    std::size_t count(std::size_t axis_length) const;

  private:
    Kind kind_ = Kind::All;
    std::vector<bool> mask_;
    std::vector<std::size_t> positions_;
};

} // namespace pilab

#endif // AXIS_INDEX_HPP

#ifndef FIELD_DESCRIPTOR_HPP
#define FIELD_DESCRIPTOR_HPP

#include "meta_table.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pilab {

/**
 * @brief Derived summary of one metadata field.
 *
 * unique_values holds the sorted distinct values (same kind as the field),
 * inverse_index maps each element to its position in unique_values.
 * values[i] == unique_values[inverse_index[i]] for every non-NaN element.
 */
struct FieldDescriptor {
    MetaField unique_values;                ///< Sorted distinct values (Unset for an Unset field).
    std::vector<std::size_t> inverse_index; ///< 0-based, one entry per element.
    std::size_t count = 0;                  ///< Number of distinct values.
};

/**
 * @brief Descriptors for every flat field of one axis table.
 *
 * Nested fields have no descriptor.
 */
class AxisDescriptor {
  public:
    bool has_field(const std::string &name) const { return fields_.count(name) > 0; }

    /// @throws FieldNotFound if no descriptor exists for @p name.
    const FieldDescriptor &at(const std::string &name) const;

    std::size_t size() const { return fields_.size(); }

  private:
    std::map<std::string, FieldDescriptor> fields_;

    friend AxisDescriptor build_axis_descriptor(MetaTable &table,
                                                std::size_t axis_length,
                                                const std::string &axis_label);
};

/**
 * @brief Computes unique values, inverse index and count for a single field.
 *
 * Numeric values are sorted ascending; NaNs are placed last and each NaN is
 * treated as a distinct value. Categorical values are sorted lexicographically.
 * @throws TypeMismatch for nested fields.
 */
FieldDescriptor
describe_field(const MetaField &field);

/**
 * @brief Checks that every non-unset field of @p table (recursing into nested
 * tables) has exactly @p axis_length elements.
 *
 * @throws ShapeMismatch naming the first offending field.
 */
void
validate_table_length(const MetaTable &table, std::size_t axis_length, const std::string &axis_label);

/**
 * @brief Validates @p table against its axis, fills an empty `order` field
 * with 1..axis_length, and returns the descriptors of all flat fields.
 *
 * @p table is the container's own copy; it is modified only by the order fill.
 */
AxisDescriptor
build_axis_descriptor(MetaTable &table, std::size_t axis_length, const std::string &axis_label);

} // namespace pilab

#endif // FIELD_DESCRIPTOR_HPP

#ifndef TABLE_OPS_HPP
#define TABLE_OPS_HPP

#include "axis_index.hpp"
#include "meta_table.hpp"

#include <Eigen/Core>
#include <cstddef>
#include <string>
#include <vector>

namespace pilab {

/**
 * @brief Slices every field of @p table with the same positions.
 *
 * Unset fields are carried through unchanged whatever the index; nested
 * tables are sliced recursively. The input table is not modified.
 * @throws std::out_of_range if a position exceeds a field's length.
 */
MetaTable
index_table_fields(const MetaTable &table, const std::vector<Eigen::Index> &positions);

/// Resolves @p index against @p axis_length first (see AxisIndex::resolve).
MetaTable
index_table_fields(const MetaTable &table,
                   const AxisIndex &index,
                   std::size_t axis_length,
                   const std::string &axis_label);

/**
 * @brief Combines two tables that describe operands stacked along @p axis.
 *
 * Fields present in both are concatenated (base first), recursing into nested
 * tables. An Unset side contributes nothing. Fields only in @p incoming are
 * added under their own name, fields only in @p base keep their value.
 *
 * @throws TypeMismatch if a shared field has incompatible kinds on the two sides.
 */
MetaTable
append_table_fields(const MetaTable &base, const MetaTable &incoming, Axis axis);

} // namespace pilab

#endif // TABLE_OPS_HPP

#include "table_ops.hpp"
#include "volume_errors.hpp"

#include <stdexcept>

namespace pilab {

namespace {

template<typename T>
std::vector<T>
take(const std::vector<T> &values, const std::vector<Eigen::Index> &positions, const std::string &name) {
    std::vector<T> out;
    out.reserve(positions.size());
    for (Eigen::Index pos : positions) {
        if (pos < 0 || static_cast<std::size_t>(pos) >= values.size()) {
            throw std::out_of_range("Index " + std::to_string(pos) + " out of range for field '" + name +
                                    "' of length " + std::to_string(values.size()) + ".");
        }
        out.push_back(values[static_cast<std::size_t>(pos)]);
    }
    return out;
}

MetaField
index_field(const MetaField &field, const std::vector<Eigen::Index> &positions, const std::string &name) {
    switch (field.kind()) {
        case FieldKind::Unset:
            return field;
        case FieldKind::Numeric:
            return MetaField::numeric(take(field.numeric_values(), positions, name));
        case FieldKind::Categorical:
            return MetaField::categorical(take(field.categorical_values(), positions, name));
        case FieldKind::Nested:
            return MetaField::nested(index_table_fields(field.nested_table(), positions));
    }
    return field;
}

template<typename T>
std::vector<T>
concatenated(const std::vector<T> &first, const std::vector<T> &second) {
    std::vector<T> out;
    out.reserve(first.size() + second.size());
    out.insert(out.end(), first.begin(), first.end());
    out.insert(out.end(), second.begin(), second.end());
    return out;
}

MetaField
append_field(const MetaField &base, const MetaField &incoming, Axis axis, const std::string &name) {
    if (incoming.is_unset()) { return base; }
    if (base.is_unset()) { return incoming; }

    if (base.kind() != incoming.kind()) {
        throw TypeMismatch("Cannot concatenate " + std::string(field_kind_name(base.kind())) + " and " +
                             field_kind_name(incoming.kind()) + " values of field '" + name + "' along the " +
                             axis_name(axis) + " axis.",
                           name);
    }
    switch (base.kind()) {
        case FieldKind::Numeric:
            return MetaField::numeric(concatenated(base.numeric_values(), incoming.numeric_values()));
        case FieldKind::Categorical:
            return MetaField::categorical(concatenated(base.categorical_values(), incoming.categorical_values()));
        case FieldKind::Nested:
            return MetaField::nested(append_table_fields(base.nested_table(), incoming.nested_table(), axis));
        case FieldKind::Unset:
            break;
    }
    return base;
}

} // namespace

MetaTable
index_table_fields(const MetaTable &table, const std::vector<Eigen::Index> &positions) {
    MetaTable out;
    for (const auto &entry : table) { out.set_field(entry.first, index_field(entry.second, positions, entry.first)); }
    return out;
}

MetaTable
index_table_fields(const MetaTable &table,
                   const AxisIndex &index,
                   std::size_t axis_length,
                   const std::string &axis_label) {
    return index_table_fields(table, index.resolve(axis_length, axis_label));
}

MetaTable
append_table_fields(const MetaTable &base, const MetaTable &incoming, Axis axis) {
    MetaTable out = base;
    for (const auto &entry : incoming) {
        const std::string &name = entry.first;
        if (base.has_field(name)) {
            out.set_field(name, append_field(base.field(name), entry.second, axis, name));
        } else {
            out.set_field(name, entry.second);
        }
    }
    return out;
}

} // namespace pilab

#include "field_descriptor.hpp"
#include "volume_errors.hpp"

#include <algorithm> // For std::sort, std::unique, std::lower_bound
#include <cmath>     // For std::isnan

namespace pilab {

const FieldDescriptor &
AxisDescriptor::at(const std::string &name) const {
    auto it = fields_.find(name);
    if (it == fields_.end()) { throw FieldNotFound(name); }
    return it->second;
}

namespace {

FieldDescriptor
describe_numeric(const std::vector<double> &values) {
    FieldDescriptor desc;

    std::vector<double> sorted;
    sorted.reserve(values.size());
    std::size_t nan_count = 0;
    for (double v : values) {
        if (std::isnan(v)) {
            ++nan_count;
        } else {
            sorted.push_back(v);
        }
    }
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    const std::size_t n_finite_unique = sorted.size();

    desc.inverse_index.reserve(values.size());
    std::size_t nan_seen = 0;
    for (double v : values) {
        if (std::isnan(v)) {
            desc.inverse_index.push_back(n_finite_unique + nan_seen);
            ++nan_seen;
        } else {
            auto it = std::lower_bound(sorted.begin(), sorted.end(), v);
            desc.inverse_index.push_back(static_cast<std::size_t>(it - sorted.begin()));
        }
    }
    // every NaN is its own unique value
    sorted.insert(sorted.end(), nan_count, std::nan(""));

    desc.count = sorted.size();
    desc.unique_values = MetaField::numeric(std::move(sorted));
    return desc;
}

FieldDescriptor
describe_categorical(const std::vector<std::string> &values) {
    FieldDescriptor desc;
    std::vector<std::string> sorted(values);
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    desc.inverse_index.reserve(values.size());
    for (const auto &v : values) {
        auto it = std::lower_bound(sorted.begin(), sorted.end(), v);
        desc.inverse_index.push_back(static_cast<std::size_t>(it - sorted.begin()));
    }
    desc.count = sorted.size();
    desc.unique_values = MetaField::categorical(std::move(sorted));
    return desc;
}

void
validate_fields(const MetaTable &table,
                std::size_t axis_length,
                const std::string &axis_label,
                const std::string &prefix) {
    for (const auto &entry : table) {
        const std::string name = prefix + entry.first;
        const MetaField &field = entry.second;
        if (field.is_unset()) { continue; }
        if (field.is_nested()) {
            validate_fields(field.nested_table(), axis_length, axis_label, name + ".");
            continue;
        }
        if (field.length() != axis_length) {
            throw ShapeMismatch(name, field.length(), axis_length, "meta." + axis_label + " vs n" + axis_label);
        }
    }
}

} // namespace

FieldDescriptor
describe_field(const MetaField &field) {
    switch (field.kind()) {
        case FieldKind::Numeric:
            return describe_numeric(field.numeric_values());
        case FieldKind::Categorical:
            return describe_categorical(field.categorical_values());
        case FieldKind::Nested:
            throw TypeMismatch("Cannot describe a nested metadata table.");
        case FieldKind::Unset:
            break;
    }
    return FieldDescriptor{};
}

void
validate_table_length(const MetaTable &table, std::size_t axis_length, const std::string &axis_label) {
    validate_fields(table, axis_length, axis_label, "");
}

AxisDescriptor
build_axis_descriptor(MetaTable &table, std::size_t axis_length, const std::string &axis_label) {
    validate_table_length(table, axis_length, axis_label);

    if (!table.has_field(kOrderField) || table.field(kOrderField).is_unset()) {
        std::vector<double> order(axis_length);
        for (std::size_t i = 0; i < axis_length; ++i) { order[i] = static_cast<double>(i + 1); }
        table.set_field(kOrderField, MetaField::numeric(std::move(order)));
    }

    AxisDescriptor result;
    for (const auto &entry : table) {
        if (entry.second.is_nested()) { continue; }
        result.fields_[entry.first] = describe_field(entry.second);
    }
    return result;
}

} // namespace pilab

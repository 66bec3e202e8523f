#include "meta_table.hpp"
#include "volume_errors.hpp"

#include <algorithm> // For std::find_if, std::equal
#include <cmath>

namespace pilab {

const char *
field_kind_name(FieldKind kind) {
    switch (kind) {
        case FieldKind::Unset:
            return "unset";
        case FieldKind::Numeric:
            return "numeric";
        case FieldKind::Categorical:
            return "categorical";
        case FieldKind::Nested:
            return "nested";
    }
    return "unknown";
}

//-----------------------------------------------------------------------------
// MetaField
//-----------------------------------------------------------------------------

MetaField::MetaField() = default;

MetaField::MetaField(std::initializer_list<double> values)
  : kind_(FieldKind::Numeric)
  , numeric_(values) {}

MetaField::MetaField(std::initializer_list<std::string> values)
  : kind_(FieldKind::Categorical)
  , categorical_(values) {}

MetaField::MetaField(std::vector<double> values)
  : kind_(FieldKind::Numeric)
  , numeric_(std::move(values)) {}

MetaField::MetaField(std::vector<std::string> values)
  : kind_(FieldKind::Categorical)
  , categorical_(std::move(values)) {}

MetaField::MetaField(const MetaTable &nested)
  : kind_(FieldKind::Nested)
  , nested_(std::make_unique<MetaTable>(nested)) {}

MetaField::MetaField(const MetaField &other)
  : kind_(other.kind_)
  , numeric_(other.numeric_)
  , categorical_(other.categorical_)
  , nested_(other.nested_ ? std::make_unique<MetaTable>(*other.nested_) : nullptr) {}

MetaField::MetaField(MetaField &&other) noexcept
  : kind_(other.kind_)
  , numeric_(std::move(other.numeric_))
  , categorical_(std::move(other.categorical_))
  , nested_(std::move(other.nested_)) {
    other.kind_ = FieldKind::Unset;
}

MetaField &
MetaField::operator=(const MetaField &other) {
    if (this != &other) {
        MetaField tmp(other);
        *this = std::move(tmp);
    }
    return *this;
}

MetaField &
MetaField::operator=(MetaField &&other) noexcept {
    if (this != &other) {
        kind_ = other.kind_;
        numeric_ = std::move(other.numeric_);
        categorical_ = std::move(other.categorical_);
        nested_ = std::move(other.nested_);
        other.kind_ = FieldKind::Unset;
    }
    return *this;
}

MetaField::~MetaField() = default;

std::size_t
MetaField::length() const {
    switch (kind_) {
        case FieldKind::Numeric:
            return numeric_.size();
        case FieldKind::Categorical:
            return categorical_.size();
        case FieldKind::Nested:
            for (const auto &entry : *nested_) {
                if (!entry.second.is_unset()) { return entry.second.length(); }
            }
            return 0;
        case FieldKind::Unset:
            break;
    }
    return 0;
}

const std::vector<double> &
MetaField::numeric_values() const {
    if (kind_ != FieldKind::Numeric) {
        throw TypeMismatch(std::string("Requested numeric values from a ") + field_kind_name(kind_) + " field.");
    }
    return numeric_;
}

const std::vector<std::string> &
MetaField::categorical_values() const {
    if (kind_ != FieldKind::Categorical) {
        throw TypeMismatch(std::string("Requested categorical values from a ") + field_kind_name(kind_) +
                           " field.");
    }
    return categorical_;
}

const MetaTable &
MetaField::nested_table() const {
    if (kind_ != FieldKind::Nested) {
        throw TypeMismatch(std::string("Requested a nested table from a ") + field_kind_name(kind_) + " field.");
    }
    return *nested_;
}

bool
MetaField::operator==(const MetaField &other) const {
    if (kind_ != other.kind_) { return false; }
    switch (kind_) {
        case FieldKind::Unset:
            return true;
        case FieldKind::Numeric:
            // NaN entries compare equal to each other so a copied field equals its source.
            return std::equal(numeric_.begin(),
                              numeric_.end(),
                              other.numeric_.begin(),
                              other.numeric_.end(),
                              [](double a, double b) { return a == b || (std::isnan(a) && std::isnan(b)); });
        case FieldKind::Categorical:
            return categorical_ == other.categorical_;
        case FieldKind::Nested:
            return *nested_ == *other.nested_;
    }
    return false;
}

//-----------------------------------------------------------------------------
// MetaTable
//-----------------------------------------------------------------------------

MetaTable::MetaTable(std::initializer_list<Entry> entries) {
    for (const auto &entry : entries) { set_field(entry.first, entry.second); }
}

const MetaTable::Entry *
MetaTable::find_entry(const std::string &name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&name](const Entry &e) { return e.first == name; });
    return it == entries_.end() ? nullptr : &*it;
}

bool
MetaTable::has_field(const std::string &name) const {
    return find_entry(name) != nullptr;
}

const MetaField &
MetaTable::field(const std::string &name) const {
    const Entry *entry = find_entry(name);
    if (entry == nullptr) { throw FieldNotFound(name); }
    return entry->second;
}

void
MetaTable::set_field(const std::string &name, MetaField value) {
    for (auto &entry : entries_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(name, std::move(value));
}

bool
MetaTable::remove_field(const std::string &name) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&name](const Entry &e) { return e.first == name; });
    if (it == entries_.end()) { return false; }
    entries_.erase(it);
    return true;
}

std::vector<std::string>
MetaTable::field_names() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto &entry : entries_) { names.push_back(entry.first); }
    return names;
}

const std::vector<std::string> &
standard_field_names() {
    static const std::vector<std::string> names = { kLabelsField, kChunksField, kNamesField, kOrderField };
    return names;
}

MetaTable
with_standard_fields(const MetaTable &user) {
    MetaTable result;
    for (const auto &name : standard_field_names()) { result.set_field(name, MetaField::unset()); }
    for (const auto &entry : user) { result.set_field(entry.first, entry.second); }
    return result;
}

std::ostream &
operator<<(std::ostream &os, const MetaField &field) {
    switch (field.kind()) {
        case FieldKind::Unset:
            os << "<unset>";
            break;
        case FieldKind::Numeric: {
            os << "[";
            const auto &values = field.numeric_values();
            for (std::size_t i = 0; i < values.size(); ++i) { os << (i ? ", " : "") << values[i]; }
            os << "]";
            break;
        }
        case FieldKind::Categorical: {
            os << "{";
            const auto &values = field.categorical_values();
            for (std::size_t i = 0; i < values.size(); ++i) { os << (i ? ", " : "") << "'" << values[i] << "'"; }
            os << "}";
            break;
        }
        case FieldKind::Nested:
            os << field.nested_table();
            break;
    }
    return os;
}

std::ostream &
operator<<(std::ostream &os, const MetaTable &table) {
    os << "(";
    bool first = true;
    for (const auto &entry : table) {
        if (!first) { os << "; "; }
        os << entry.first << ": " << entry.second;
        first = false;
    }
    os << ")";
    return os;
}

} // namespace pilab

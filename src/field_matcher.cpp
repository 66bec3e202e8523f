#include "field_matcher.hpp"
#include "volume_errors.hpp"

#include <stdexcept>

namespace pilab {

FieldQuery::FieldQuery(double value)
  : domain_(Domain::Numeric)
  , numeric_{ value } {}

FieldQuery::FieldQuery(const char *value)
  : FieldQuery(std::string(value)) {}

FieldQuery::FieldQuery(std::string value)
  : domain_(Domain::Categorical)
  , categorical_{ std::move(value) } {}

FieldQuery::FieldQuery(std::initializer_list<double> values)
  : domain_(Domain::Numeric)
  , numeric_(values) {}

FieldQuery::FieldQuery(std::initializer_list<std::string> values)
  : domain_(Domain::Categorical)
  , categorical_(values) {}

FieldQuery::FieldQuery(std::vector<double> values)
  : domain_(Domain::Numeric)
  , numeric_(std::move(values)) {}

FieldQuery::FieldQuery(std::vector<std::string> values)
  : domain_(Domain::Categorical)
  , categorical_(std::move(values)) {}

namespace {

std::string
label(const std::string &field_name) {
    return field_name.empty() ? std::string("array") : "field '" + field_name + "'";
}

} // namespace

std::vector<bool>
match_field(const MetaField &field, const FieldQuery &query, const std::string &field_name) {
    if (query.size() == 0) {
        throw std::invalid_argument("Query for " + label(field_name) + " must contain at least one value.");
    }

    switch (field.kind()) {
        case FieldKind::Unset:
            return {};
        case FieldKind::Nested:
            throw TypeMismatch("Cannot match values against nested " + label(field_name) + ".", field_name);
        case FieldKind::Numeric: {
            if (!query.is_numeric()) {
                throw TypeMismatch("Categorical query against numeric " + label(field_name) + ".", field_name);
            }
            const auto &values = field.numeric_values();
            std::vector<bool> mask(values.size(), false);
            for (double item : query.numeric_values()) {
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (values[i] == item) { mask[i] = true; }
                }
            }
            return mask;
        }
        case FieldKind::Categorical: {
            if (query.is_numeric()) {
                throw TypeMismatch("Numeric query against categorical " + label(field_name) + ".", field_name);
            }
            const auto &values = field.categorical_values();
            std::vector<bool> mask(values.size(), false);
            for (const auto &item : query.categorical_values()) {
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (values[i] == item) { mask[i] = true; }
                }
            }
            return mask;
        }
    }
    return {};
}

} // namespace pilab

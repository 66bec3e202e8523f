#ifndef FIELD_MATCHER_HPP
#define FIELD_MATCHER_HPP

#include "meta_table.hpp"

#include <initializer_list>
#include <string>
#include <type_traits>
#include <vector>

namespace pilab {

/**
 * @brief One or more query values drawn from a single domain.
 *
 * A query is either numeric or categorical; there is no way to build a mixed
 * one. Several values are combined with OR when matched.
 */
class FieldQuery {
  public:
    enum class Domain { Numeric, Categorical };

    FieldQuery(double value);

    /// Any integer type (chunk ids are often held in std::size_t) is a numeric value.
    template<typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    FieldQuery(T value)
      : FieldQuery(static_cast<double>(value)) {}

    FieldQuery(const char *value);
    FieldQuery(std::string value);
    FieldQuery(std::initializer_list<double> values);
    FieldQuery(std::initializer_list<std::string> values);
    explicit FieldQuery(std::vector<double> values);
    explicit FieldQuery(std::vector<std::string> values);

    Domain domain() const { return domain_; }
    bool is_numeric() const { return domain_ == Domain::Numeric; }
    std::size_t size() const { return is_numeric() ? numeric_.size() : categorical_.size(); }

    const std::vector<double> &numeric_values() const { return numeric_; }
    const std::vector<std::string> &categorical_values() const { return categorical_; }

  private:
    Domain domain_;
    std::vector<double> numeric_;
    std::vector<std::string> categorical_;
};

/**
 * @brief Returns mask[i] = true iff @p field element i equals any query value.
 *
 * Numeric comparison is exact (NaN never matches); categorical comparison is
 * exact string equality. An Unset field yields an empty mask.
 *
 * @param field_name Only used to label errors.
 * @throws TypeMismatch if the field's domain differs from the query's domain,
 *         or the field is a nested table.
 * @throws std::invalid_argument if the query holds no values.
 */
std::vector<bool>
match_field(const MetaField &field, const FieldQuery &query, const std::string &field_name = "");

} // namespace pilab

#endif // FIELD_MATCHER_HPP

#ifndef META_QUERY_HPP
#define META_QUERY_HPP

#include "field_matcher.hpp"
#include "meta_table.hpp"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace pilab {

/**
 * @brief A set of named criteria, e.g. chunks = {1, 2} and labels = "A".
 *
 * Values within one criterion are OR-ed, criteria are AND-ed per axis.
 */
class MetaQuery {
  public:
    using Criterion = std::pair<std::string, FieldQuery>;

    MetaQuery() = default;
    MetaQuery(std::initializer_list<Criterion> criteria);

    /// Adds a criterion, replacing any earlier one for the same field.
    MetaQuery &where(const std::string &field, FieldQuery values);

    bool empty() const { return criteria_.empty(); }
    std::size_t size() const { return criteria_.size(); }

    // nullptr when the field is not constrained
    const FieldQuery *criterion(const std::string &field) const;

    std::vector<std::string> field_names() const;

  private:
    std::vector<Criterion> criteria_;
};

/// Per-axis boolean selections produced by a query.
struct MetaMasks {
    std::vector<bool> samples;
    std::vector<bool> features;
};

/**
 * @brief Resolves @p query into sample and feature masks.
 *
 * Both masks start all-true. For every constrained field that holds values in
 * the samples table the match is AND-ed into the samples mask, and likewise
 * for the features table; a field present on both axes constrains both.
 *
 * @throws FieldNotFound if a criterion names a field that is absent or Unset
 *         in both tables.
 * @throws TypeMismatch if a criterion's domain differs from the field's.
 */
MetaMasks
find_by_meta(const MetaTable &samples,
             const MetaTable &features,
             std::size_t nsamples,
             std::size_t nfeatures,
             const MetaQuery &query);

/**
 * @brief Inverts each mask that is not all-true.
 *
 * An axis the query did not constrain keeps its all-true mask, so removal
 * never drops an entire unconstrained axis.
 */
MetaMasks
complement_constrained(MetaMasks masks);

} // namespace pilab

#endif // META_QUERY_HPP

#include "meta_query.hpp"
#include "volume_errors.hpp"

#include <algorithm> // For std::all_of, std::find_if

namespace pilab {

MetaQuery::MetaQuery(std::initializer_list<Criterion> criteria) {
    for (const auto &c : criteria) { where(c.first, c.second); }
}

MetaQuery &
MetaQuery::where(const std::string &field, FieldQuery values) {
    for (auto &c : criteria_) {
        if (c.first == field) {
            c.second = std::move(values);
            return *this;
        }
    }
    criteria_.emplace_back(field, std::move(values));
    return *this;
}

const FieldQuery *
MetaQuery::criterion(const std::string &field) const {
    auto it =
      std::find_if(criteria_.begin(), criteria_.end(), [&field](const Criterion &c) { return c.first == field; });
    return it == criteria_.end() ? nullptr : &it->second;
}

std::vector<std::string>
MetaQuery::field_names() const {
    std::vector<std::string> names;
    names.reserve(criteria_.size());
    for (const auto &c : criteria_) { names.push_back(c.first); }
    return names;
}

namespace {

// A field only counts as present if it is declared and carries values.
bool
holds_values(const MetaTable &table, const std::string &name) {
    return table.has_field(name) && !table.field(name).is_unset();
}

void
and_into(std::vector<bool> &running, const std::vector<bool> &mask, const std::string &name) {
    if (mask.size() != running.size()) { throw ShapeMismatch(name, mask.size(), running.size()); }
    for (std::size_t i = 0; i < running.size(); ++i) { running[i] = running[i] && mask[i]; }
}

std::vector<std::string>
union_of_names(const MetaTable &samples, const MetaTable &features) {
    std::vector<std::string> names = samples.field_names();
    for (const auto &name : features.field_names()) {
        if (!samples.has_field(name)) { names.push_back(name); }
    }
    return names;
}

} // namespace

MetaMasks
find_by_meta(const MetaTable &samples,
             const MetaTable &features,
             std::size_t nsamples,
             std::size_t nfeatures,
             const MetaQuery &query) {
    MetaMasks masks{ std::vector<bool>(nsamples, true), std::vector<bool>(nfeatures, true) };

    // Criteria naming a field neither table declares are typos.
    for (const auto &name : query.field_names()) {
        if (!holds_values(samples, name) && !holds_values(features, name)) { throw FieldNotFound(name); }
    }

    for (const auto &name : union_of_names(samples, features)) {
        const FieldQuery *values = query.criterion(name);
        if (values == nullptr) { continue; }

        if (holds_values(samples, name)) {
            and_into(masks.samples, match_field(samples.field(name), *values, name), name);
        }
        if (holds_values(features, name)) {
            and_into(masks.features, match_field(features.field(name), *values, name), name);
        }
    }
    return masks;
}

MetaMasks
complement_constrained(MetaMasks masks) {
    auto flip_if_constrained = [](std::vector<bool> &mask) {
        if (std::all_of(mask.begin(), mask.end(), [](bool b) { return b; })) { return; }
        mask.flip();
    };
    flip_if_constrained(masks.samples);
    flip_if_constrained(masks.features);
    return masks;
}

} // namespace pilab

#ifndef META_TABLE_HPP
#define META_TABLE_HPP

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace pilab {

class MetaTable;

/**
 * @brief Storage kind of a single metadata field.
 *
 * Unset marks a field that is declared but carries no values for this
 * instance. It is distinct from a Numeric/Categorical field with zero elements.
 */
enum class FieldKind { Unset, Numeric, Categorical, Nested };

const char *
field_kind_name(FieldKind kind);

/**
 * @brief One named metadata array (or nested table) attached to an axis.
 *
 * A MetaField owns its values. Copying a Nested field deep-copies the nested
 * table, so no two fields ever share storage.
 */
class MetaField {
  public:
    /// Constructs an Unset placeholder.
    MetaField();
    MetaField(std::initializer_list<double> values);
    MetaField(std::initializer_list<std::string> values);

    explicit MetaField(std::vector<double> values);
    explicit MetaField(std::vector<std::string> values);
    explicit MetaField(const MetaTable &nested);

    MetaField(const MetaField &other);
    MetaField(MetaField &&other) noexcept;
    MetaField &operator=(const MetaField &other);
    MetaField &operator=(MetaField &&other) noexcept;
    ~MetaField();

    static MetaField unset() { return MetaField(); }
    static MetaField numeric(std::vector<double> values) { return MetaField(std::move(values)); }
    static MetaField categorical(std::vector<std::string> values) { return MetaField(std::move(values)); }
    static MetaField nested(const MetaTable &table) { return MetaField(table); }

    FieldKind kind() const { return kind_; }
    bool is_unset() const { return kind_ == FieldKind::Unset; }
    bool is_numeric() const { return kind_ == FieldKind::Numeric; }
    bool is_categorical() const { return kind_ == FieldKind::Categorical; }
    bool is_nested() const { return kind_ == FieldKind::Nested; }

    /**
     * @brief Number of elements along the axis.
     *
     * Unset fields report 0. A nested table reports the length of its first
     * non-unset member (0 if it has none); consistency of the remaining
     * members is checked when the owning table is validated.
     */
    std::size_t length() const;

    /// Accessors throw TypeMismatch when the field holds another kind.
    const std::vector<double> &numeric_values() const;
    const std::vector<std::string> &categorical_values() const;
    const MetaTable &nested_table() const;

    bool operator==(const MetaField &other) const;
    bool operator!=(const MetaField &other) const { return !(*this == other); }

  private:
    FieldKind kind_ = FieldKind::Unset;
    std::vector<double> numeric_;
    std::vector<std::string> categorical_;
    std::unique_ptr<MetaTable> nested_;
};

/**
 * @brief Ordered registry of named metadata fields for one axis.
 *
 * Field order is insertion order; set_field on an existing name replaces the
 * value in place.
 */
class MetaTable {
  public:
    using Entry = std::pair<std::string, MetaField>;
    using const_iterator = std::vector<Entry>::const_iterator;

    MetaTable() = default;
    MetaTable(std::initializer_list<Entry> entries);

    bool has_field(const std::string &name) const;

    /// @throws FieldNotFound if the table does not declare @p name.
    const MetaField &field(const std::string &name) const;

    void set_field(const std::string &name, MetaField value);

    // Returns false if nothing was removed.
    bool remove_field(const std::string &name);

    std::vector<std::string> field_names() const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const MetaTable &other) const { return entries_ == other.entries_; }
    bool operator!=(const MetaTable &other) const { return !(*this == other); }

  private:
    std::vector<Entry> entries_;

    const Entry *find_entry(const std::string &name) const;
};

// --- Mandatory fields --- //

inline const std::string kLabelsField = "labels";
inline const std::string kChunksField = "chunks";
inline const std::string kNamesField = "names";
inline const std::string kOrderField = "order";

/// Names of the fields every container table declares, in declaration order.
const std::vector<std::string> &
standard_field_names();

/**
 * @brief Returns a table that starts with the mandatory fields (Unset) followed
 * by the fields of @p user. Values in @p user override the Unset defaults.
 */
MetaTable
with_standard_fields(const MetaTable &user);

std::ostream &
operator<<(std::ostream &os, const MetaField &field);
std::ostream &
operator<<(std::ostream &os, const MetaTable &table);

} // namespace pilab

#endif // META_TABLE_HPP

#ifndef VOLUME_ERRORS_HPP
#define VOLUME_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace pilab {

/**
 * @brief A metadata field is out of register with its axis.
 *
 * Thrown when a non-empty field's length disagrees with the number of samples
 * (or features) it describes. Never recovered from internally.
 */
class ShapeMismatch : public std::invalid_argument {
  public:
    ShapeMismatch(const std::string &field, std::size_t actual_length, std::size_t expected_length,
                  const std::string &context = "")
      : std::invalid_argument(make_message(field, actual_length, expected_length, context))
      , field_(field)
      , actual_length_(actual_length)
      , expected_length_(expected_length) {}

    const std::string &field() const { return field_; }
    std::size_t actual_length() const { return actual_length_; }
    std::size_t expected_length() const { return expected_length_; }

  private:
    std::string field_;
    std::size_t actual_length_;
    std::size_t expected_length_;

    static std::string make_message(const std::string &field,
                                    std::size_t actual_length,
                                    std::size_t expected_length,
                                    const std::string &context) {
        std::string msg = "Field '" + field + "' has length " + std::to_string(actual_length) + " but " +
                          std::to_string(expected_length) + " was expected";
        if (!context.empty()) { msg += " (" + context + ")"; }
        return msg + ".";
    }
};

/**
 * @brief A query named a field that neither metadata table declares with content.
 */
class FieldNotFound : public std::invalid_argument {
  public:
    explicit FieldNotFound(const std::string &field)
      : std::invalid_argument("Meta data does not exist: '" + field + "'.")
      , field_(field) {}

    const std::string &field() const { return field_; }

  private:
    std::string field_;
};

/**
 * @brief Query value domain (numeric/categorical) disagrees with the field's domain.
 */
class TypeMismatch : public std::invalid_argument {
  public:
    TypeMismatch(const std::string &message, std::string field = "")
      : std::invalid_argument(message)
      , field_(std::move(field)) {}

    const std::string &field() const { return field_; }

  private:
    std::string field_;
};

// Raised for concatenation along the feature axis.
class UnsupportedOperation : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

} // namespace pilab

#endif // VOLUME_ERRORS_HPP

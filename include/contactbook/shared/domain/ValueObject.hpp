/**
 * @file ValueObject.hpp
 * @brief Base classes for the contact book's self-validating values
 */

#pragma once

#include <string>

namespace contactbook::shared::domain {

/**
 * @brief A value identified only by what it wraps
 *
 * Concrete values (Phone, ContactName, Birthday) run validate() from their
 * private constructor and are created through a static of() factory, so no
 * instance ever holds an invalid value. The wrapped value has no mutators;
 * a stored value is changed by assigning a whole new one.
 *
 * @tparam T Wrapped type
 */
template<typename T>
class ValueObject {
protected:
    T value_;

    explicit ValueObject(T value) : value_(std::move(value)) {}

    /// Throws a shared::exception::ValidationException on a bad value
    virtual void validate() const {}

public:
    virtual ~ValueObject() = default;

    ValueObject(const ValueObject&) = default;
    ValueObject& operator=(const ValueObject&) = default;
    ValueObject(ValueObject&&) noexcept = default;
    ValueObject& operator=(ValueObject&&) noexcept = default;

    [[nodiscard]] const T& getValue() const noexcept {
        return value_;
    }

    bool operator==(const ValueObject& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const ValueObject& other) const {
        return !(value_ == other.value_);
    }
};

/**
 * @brief Text value stored verbatim
 */
class StringValueObject : public ValueObject<std::string> {
protected:
    explicit StringValueObject(std::string value)
        : ValueObject<std::string>(std::move(value)) {}

public:
    /// Length in bytes
    [[nodiscard]] size_t length() const noexcept {
        return value_.length();
    }
};

} // namespace contactbook::shared::domain

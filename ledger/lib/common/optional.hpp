/*
 * Optional value
 */

#pragma once

#include <stdexcept>
#include <utility>

namespace tigerscore
{
namespace ledger
{

template <typename T> class Optional
{
public:
    // Construct without a value
    Optional();

    // Construct holding a copy of (or the moved) value
    Optional(const T &value);
    Optional(T &&value);

    bool has_value() const;
    const T &value() const;
    T &value();

private:
    T value_;
    bool has_value_;
};

template <typename T> Optional<T>::Optional() : value_(), has_value_(false) {}

template <typename T> Optional<T>::Optional(const T &value) : value_(value), has_value_(true) {}

template <typename T>
Optional<T>::Optional(T &&value) : value_(std::move(value)), has_value_(true)
{
}

template <typename T> bool Optional<T>::has_value() const { return has_value_; }

template <typename T> const T &Optional<T>::value() const
{
    if (!has_value_)
        throw std::logic_error(
            "Trying to access non-existent value of Optional by const reference");

    return value_;
}

template <typename T> T &Optional<T>::value()
{
    if (!has_value_)
        throw std::logic_error(
            "Trying to access non-existent value of Optional by non-const reference");

    return value_;
}

} // namespace ledger
} // namespace tigerscore

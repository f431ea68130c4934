#pragma once

#include <optional>
#include <string>
#include <utility>

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <nlohmann/json.hpp>

namespace orderguard {

// Exact decimal for prices, quantities and notionals. Always finite.
class Decimal {
public:
    using Backend = boost::multiprecision::cpp_dec_float_50;

    Decimal() = default;

    static Decimal fromInt(long long value);

    Decimal operator+(const Decimal& other) const { return Decimal(value_ + other.value_); }
    Decimal operator-(const Decimal& other) const { return Decimal(value_ - other.value_); }
    Decimal operator*(const Decimal& other) const { return Decimal(value_ * other.value_); }
    Decimal operator-() const { return Decimal(-value_); }
    Decimal& operator+=(const Decimal& other) { value_ += other.value_; return *this; }
    Decimal& operator-=(const Decimal& other) { value_ -= other.value_; return *this; }

    // Returns nullopt for a zero divisor.
    std::optional<Decimal> dividedBy(const Decimal& divisor) const;

    bool operator==(const Decimal& other) const { return value_ == other.value_; }
    bool operator!=(const Decimal& other) const { return value_ != other.value_; }
    bool operator<(const Decimal& other) const { return value_ < other.value_; }
    bool operator<=(const Decimal& other) const { return value_ <= other.value_; }
    bool operator>(const Decimal& other) const { return value_ > other.value_; }
    bool operator>=(const Decimal& other) const { return value_ >= other.value_; }

    Decimal abs() const;
    bool isZero() const { return value_.is_zero(); }
    bool isPositive() const { return value_ > 0; }
    bool isNegative() const { return value_ < 0; }

    std::string toString() const;
    double toDouble() const { return value_.convert_to<double>(); }

private:
    explicit Decimal(Backend value) : value_(std::move(value)) {}

    friend std::optional<Decimal> parseDecimal(const std::string& text);

    Backend value_{0};
};

// Accepts [+-]digits[.digits][e[+-]digits]. NaN, Infinity and empty input are rejected.
std::optional<Decimal> parseDecimal(const std::string& text);

// Accepts JSON numbers and numeric strings. Booleans, null and non-finite floats are rejected.
std::optional<Decimal> parseDecimal(const nlohmann::json& value);

inline Decimal max(const Decimal& a, const Decimal& b) {
    return (a < b) ? b : a;
}

} // namespace orderguard

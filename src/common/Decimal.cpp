#include "common/Decimal.h"

#include <cctype>
#include <cmath>
#include <ios>

namespace orderguard {

namespace {
bool isDecimalSyntax(const std::string& text) {
    std::size_t i = 0;
    const std::size_t n = text.size();
    if (i < n && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }

    std::size_t int_digits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
        ++int_digits;
    }

    std::size_t frac_digits = 0;
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            ++frac_digits;
        }
    }
    if (int_digits + frac_digits == 0) {
        return false;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) {
            ++i;
        }
        std::size_t exp_digits = 0;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            ++exp_digits;
        }
        // Keep exponents small enough that the backend never overflows to infinity.
        if (exp_digits == 0 || exp_digits > 4) {
            return false;
        }
    }
    return i == n;
}

std::string trimCopy(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}
}

Decimal Decimal::fromInt(long long value) {
    return Decimal(Backend(value));
}

std::optional<Decimal> Decimal::dividedBy(const Decimal& divisor) const {
    if (divisor.isZero()) {
        return std::nullopt;
    }
    return Decimal(value_ / divisor.value_);
}

Decimal Decimal::abs() const {
    return value_ < 0 ? Decimal(-value_) : *this;
}

std::string Decimal::toString() const {
    std::string out = value_.str(20, std::ios_base::fixed);
    const auto dot = out.find('.');
    if (dot != std::string::npos) {
        while (!out.empty() && out.back() == '0') {
            out.pop_back();
        }
        if (!out.empty() && out.back() == '.') {
            out.pop_back();
        }
    }
    if (out == "-0") {
        out = "0";
    }
    return out;
}

std::optional<Decimal> parseDecimal(const std::string& text) {
    const std::string trimmed = trimCopy(text);
    if (!isDecimalSyntax(trimmed)) {
        return std::nullopt;
    }
    try {
        Decimal::Backend value(trimmed);
        if (!boost::multiprecision::isfinite(value)) {
            return std::nullopt;
        }
        return Decimal(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Decimal> parseDecimal(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        if (value.is_number_unsigned()) {
            return parseDecimal(std::to_string(value.get<unsigned long long>()));
        }
        return Decimal::fromInt(value.get<long long>());
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        if (!std::isfinite(raw)) {
            return std::nullopt;
        }
        // dump() yields the shortest round-trip form, e.g. 0.1 -> "0.1".
        return parseDecimal(value.dump());
    }
    if (value.is_string()) {
        return parseDecimal(value.get<std::string>());
    }
    return std::nullopt;
}

} // namespace orderguard

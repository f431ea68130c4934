#include "common/ParseUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace orderguard {
namespace utils {

namespace {
// Howard Hinnant's days_from_civil.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeap(y)) ? 29 : kDays[m - 1];
}

bool readDigits(const std::string& s, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& s, std::size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}
}

std::optional<Timestamp> parseIsoTimestamp(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (!(expect(text, pos, 'T') || expect(text, pos, ' '))) {
        return std::nullopt;
    }
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    long long micros = 0;
    if (expect(text, pos, '.')) {
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    long long offset_seconds = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            const int sign = (text[pos] == '-') ? -1 : 1;
            ++pos;
            int off_h = 0, off_m = 0;
            if (!readDigits(text, pos, 2, off_h)) {
                return std::nullopt;
            }
            expect(text, pos, ':');
            if (!readDigits(text, pos, 2, off_m) || off_h > 23 || off_m > 59) {
                return std::nullopt;
            }
            offset_seconds = sign * (off_h * 3600LL + off_m * 60LL);
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const long long epoch_seconds = days * 86400LL + hour * 3600LL + minute * 60LL + second - offset_seconds;
    const auto since_epoch = std::chrono::seconds(epoch_seconds) + std::chrono::microseconds(micros);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

std::optional<Timestamp> parseIsoTimestamp(const nlohmann::json& value) {
    if (!value.is_string()) {
        return std::nullopt;
    }
    return parseIsoTimestamp(value.get<std::string>());
}

std::string formatIsoTimestamp(Timestamp ts) {
    const long long ms = toEpochMs(ts);
    long long secs = ms / 1000;
    long long rem_ms = ms % 1000;
    if (rem_ms < 0) {
        rem_ms += 1000;
        secs -= 1;
    }
    const std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << rem_ms << "Z";
    return oss.str();
}

std::optional<std::string> normalizeSymbol(const std::string& raw) {
    std::string symbol;
    symbol.reserve(raw.size());
    std::size_t begin = 0;
    std::size_t end = raw.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;

    for (std::size_t i = begin; i < end; ++i) {
        symbol.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(raw[i]))));
    }

    if (symbol.empty() || symbol.size() > 10) {
        return std::nullopt;
    }
    if (!std::isalpha(static_cast<unsigned char>(symbol.front()))) {
        return std::nullopt;
    }
    const bool valid = std::all_of(symbol.begin(), symbol.end(), [](unsigned char c) {
        return std::isupper(c) || std::isdigit(c) || c == '.' || c == '-';
    });
    if (!valid) {
        return std::nullopt;
    }
    return symbol;
}

const nlohmann::json* findField(
    const nlohmann::json& object,
    const char* snake_key,
    const char* camel_key
) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(snake_key);
    if (it != object.end()) {
        return &(*it);
    }
    if (camel_key != nullptr) {
        it = object.find(camel_key);
        if (it != object.end()) {
            return &(*it);
        }
    }
    return nullptr;
}

} // namespace utils
} // namespace orderguard

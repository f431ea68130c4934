#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace orderguard {
namespace utils {

// YYYY-MM-DDTHH:MM:SS[.frac][Z|+HH:MM|-HH:MM]; naive values are UTC.
std::optional<Timestamp> parseIsoTimestamp(const std::string& text);

// Same, but accepts only JSON strings.
std::optional<Timestamp> parseIsoTimestamp(const nlohmann::json& value);

// UTC with millisecond precision and a trailing 'Z'.
std::string formatIsoTimestamp(Timestamp ts);

// Trim + upper-case; 1-10 chars of [A-Z0-9.-] starting with a letter.
std::optional<std::string> normalizeSymbol(const std::string& raw);

// Looks up `snake_key`, then `camel_key`. Returns nullptr when neither is present.
const nlohmann::json* findField(
    const nlohmann::json& object,
    const char* snake_key,
    const char* camel_key = nullptr
);

} // namespace utils
} // namespace orderguard

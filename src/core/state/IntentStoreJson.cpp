#include "core/state/IntentStoreJson.h"

#include <cctype>
#include <fstream>
#include <system_error>

#include "common/Logger.h"
#include "core/model/PayloadParsers.h"

namespace orderguard {
namespace core {

namespace {
// Session ids come from config; keep them from escaping the directory.
std::string sanitizeSessionId(const std::string& session_id) {
    std::string out;
    for (unsigned char c : session_id) {
        out.push_back((std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_');
    }
    return out.empty() ? std::string("default") : out;
}
}

IntentStoreJson::IntentStoreJson(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path IntentStoreJson::pathFor(const std::string& session_id) const {
    return directory_ / ("order_entry_" + sanitizeSessionId(session_id) + ".json");
}

std::optional<OrderIntent> IntentStoreJson::load(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = pathFor(session_id);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    const nlohmann::json raw = nlohmann::json::parse(in, nullptr, false);
    in.close();

    std::optional<OrderIntent> intent;
    if (!raw.is_discarded()) {
        intent = parseOrderIntent(raw);
    }
    if (!intent) {
        LOG_WARN("Discarding invalid pending order intent: {}", path.string());
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return std::nullopt;
    }
    return intent;
}

bool IntentStoreJson::save(const std::string& session_id, const OrderIntent& intent) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = pathFor(session_id);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        LOG_WARN("Cannot create intent store directory {}: {}", path.parent_path().string(), ec.message());
        return false;
    }

    auto tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << orderIntentToJson(intent).dump(2);
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        LOG_WARN("Intent store rename failed: {}", ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

void IntentStoreJson::clear(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(pathFor(session_id), ec);
    if (ec) {
        LOG_WARN("Intent store clear failed: {}", ec.message());
    }
}

} // namespace core
} // namespace orderguard

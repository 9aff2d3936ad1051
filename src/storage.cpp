#include "licenseguard/storage.hpp"
#include "licenseguard/json.hpp"
#include "licenseguard/logging.hpp"

#include <fstream>
#include <iterator>

namespace licenseguard {

// ==================== FileStateStore Implementation ====================

FileStateStore::FileStateStore(const std::string& path) : path_(path) {}

bool FileStateStore::ensure_directory() const {
    auto parent = path_.parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    return !ec;
}

std::optional<LicenseState> FileStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        LICENSEGUARD_LOG_ERROR("state_store: cannot open {}", path_.string());
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    try {
        return json::state_from_json(json::json::parse(content));
    } catch (const nlohmann::json::exception& e) {
        LICENSEGUARD_LOG_ERROR("state_store: {} is not valid JSON: {}", path_.string(), e.what());
        return std::nullopt;
    }
}

bool FileStateStore::save(const LicenseState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ensure_directory()) {
        LICENSEGUARD_LOG_ERROR("state_store: cannot create directory for {}", path_.string());
        return false;
    }

    auto tmp_path = path_;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            LICENSEGUARD_LOG_ERROR("state_store: cannot write {}", tmp_path.string());
            return false;
        }
        file << json::state_to_json(state).dump(2) << "\n";
        if (!file.good()) {
            LICENSEGUARD_LOG_ERROR("state_store: short write to {}", tmp_path.string());
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        LICENSEGUARD_LOG_ERROR("state_store: rename to {} failed: {}", path_.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

// ==================== MemoryStateStore Implementation ====================

std::optional<LicenseState> MemoryStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool MemoryStateStore::save(const LicenseState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    ++save_count_;
    return true;
}

int MemoryStateStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

}  // namespace licenseguard

#pragma once

/**
 * @file storage.hpp
 * @brief License state persistence for licenseguard SDK
 *
 * The controller treats persistence as an opaque document store with
 * load/save semantics; last writer wins.
 */

#include "licenseguard/licenseguard.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace licenseguard {

/**
 * @brief Storage interface for the license state document
 */
class StateStoreInterface {
  public:
    virtual ~StateStoreInterface() = default;

    /// Load the stored state, nullopt when nothing has been saved yet
    [[nodiscard]] virtual std::optional<LicenseState> load() = 0;

    /// Persist the state, replacing the previous document
    [[nodiscard]] virtual bool save(const LicenseState& state) = 0;
};

/**
 * @brief File-based storage implementation
 *
 * Stores the state as a JSON document, written atomically through a
 * temporary file and rename.
 */
class FileStateStore : public StateStoreInterface {
  public:
    /**
     * @brief Construct file storage
     *
     * @param path Path of the JSON state document
     */
    explicit FileStateStore(const std::string& path);

    [[nodiscard]] std::optional<LicenseState> load() override;
    [[nodiscard]] bool save(const LicenseState& state) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    bool ensure_directory() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

/**
 * @brief In-memory storage implementation (for testing or embedding)
 */
class MemoryStateStore : public StateStoreInterface {
  public:
    MemoryStateStore() = default;
    explicit MemoryStateStore(LicenseState initial) : state_(std::move(initial)) {}

    [[nodiscard]] std::optional<LicenseState> load() override;
    [[nodiscard]] bool save(const LicenseState& state) override;

    /// Number of successful save() calls
    [[nodiscard]] int save_count() const;

  private:
    std::optional<LicenseState> state_;
    int save_count_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace licenseguard

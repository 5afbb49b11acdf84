#pragma once

/** \file calibrator_registry.hpp
 *  \brief Versioned, content-addressed filesystem store for fitted calibrators.
 *
 * Layout:
 *   <base>/<name>/versions/<version_id>/calibrator.txt   model blob (calibrator.hpp v1 format)
 *   <base>/<name>/versions/<version_id>/metadata.json    sidecar record
 *
 * Versions are write-once: the version directory is created exclusively and an
 * existing directory is reported as data_integrity. Both files are written with
 * tmp + fsync + rename. "latest" is the version with the greatest created_at;
 * ties go to the greater version_id.
 *
 * Thread-safety: concurrent registrations are safe (distinct version ids);
 * loads go through an owned, mutex-protected LRU cache.
 */

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "calibet/calibration/calibrator.hpp"
#include "calibet/error.hpp"
#include "calibet/registry/model_cache.hpp"

namespace calibet::registry {

/** \brief Persisted description of one calibrator version. */
struct CalibratorRecord {
    std::string name;                          /**< logical name as registered */
    std::string version_id;                    /**< 12 hex chars */
    std::string created_at;                    /**< UTC ISO-8601 with microseconds */
    std::filesystem::path calibrator_path;     /**< blob path at registration time */
    nlohmann::json metadata = nlohmann::json::object();
};

struct RegistryOptions {
    std::size_t cache_capacity{64};            /**< 0 disables the model cache */
    bool durable{true};                        /**< fsync files and directories */
    /** Timestamp source for created_at; defaults to system_clock::now. */
    std::function<std::chrono::system_clock::time_point()> clock;
};

/** \brief Sidecar JSON encoding of a record. */
[[nodiscard]] auto to_json(const CalibratorRecord& r) -> nlohmann::json;
auto record_from_json(const nlohmann::json& j) -> std::expected<CalibratorRecord, core::error>;

/** \brief "YYYY-MM-DDTHH:MM:SS.ffffffZ" */
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

/** \brief Directory name for a calibrator name (spaces become '_'), or invalid_argument. */
auto safe_name(std::string_view name) -> std::expected<std::string, core::error>;

class CalibratorRegistry {
public:
    /** \brief Open (creating if needed) a registry rooted at base_dir. */
    static auto open(std::filesystem::path base_dir, RegistryOptions options = {})
        -> std::expected<CalibratorRegistry, core::error>;

    /** \brief Open the registry at CALIBET_REGISTRY_DIR (default ./calibrators). */
    static auto open_default(RegistryOptions options = {})
        -> std::expected<CalibratorRegistry, core::error>;

    CalibratorRegistry(CalibratorRegistry&&) noexcept = default;
    CalibratorRegistry& operator=(CalibratorRegistry&&) noexcept = default;

    /** \brief Persist a new version and return its record. */
    auto register_calibrator(std::string_view name, const calibration::Calibrator& calibrator,
                             const nlohmann::json& metadata = nlohmann::json::object())
        -> std::expected<CalibratorRecord, core::error>;

    /** \brief Registered calibrator directory names, sorted. */
    auto list_names() const -> std::expected<std::vector<std::string>, core::error>;

    /** \brief Version ids of one calibrator, sorted lexicographically. */
    auto list_versions(std::string_view name) const
        -> std::expected<std::vector<std::string>, core::error>;

    auto get_record(std::string_view name, std::string_view version_id) const
        -> std::expected<CalibratorRecord, core::error>;

    auto latest_record(std::string_view name) const
        -> std::expected<CalibratorRecord, core::error>;

    auto load(std::string_view name, std::string_view version_id)
        -> std::expected<ModelCache::Value, core::error>;

    auto load_latest(std::string_view name)
        -> std::expected<ModelCache::Value, core::error>;

    [[nodiscard]] auto base_dir() const noexcept -> const std::filesystem::path& { return base_; }
    [[nodiscard]] auto cache_stats() const -> CacheStats { return cache_->stats(); }

private:
    CalibratorRegistry(std::filesystem::path base_dir, RegistryOptions options);

    auto version_dir(std::string_view name, std::string_view version_id) const
        -> std::expected<std::filesystem::path, core::error>;

    std::filesystem::path base_;
    RegistryOptions options_;
    std::unique_ptr<ModelCache> cache_;
};

} // namespace calibet::registry

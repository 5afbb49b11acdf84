#include "calibet/registry/calibrator_registry.hpp"
#include "calibet/core/atomic_file.hpp"
#include "calibet/core/log.hpp"
#include "calibet/core/platform_utils.hpp"
#include "calibet/registry/content_hash.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <system_error>

namespace calibet::registry {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "registry";
constexpr const char* kBlobFile = "calibrator.txt";
constexpr const char* kSidecarFile = "metadata.json";
constexpr const char* kVersionsDir = "versions";
constexpr int kMaxVersionCollisions = 16;

auto io_error(const std::string& what, const fs::path& p, const std::error_code& ec)
    -> std::unexpected<core::error> {
    return core::make_error(core::error_code::io_failed,
                            what + ": " + p.string() + ": " + ec.message(), kComponent);
}

auto read_sidecar(const fs::path& dir) -> std::expected<CalibratorRecord, core::error> {
    auto text = core::read_file(dir / kSidecarFile);
    if (!text) return std::unexpected(text.error());
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*text);
    } catch (const nlohmann::json::exception& e) {
        return core::make_error(core::error_code::data_integrity,
            "invalid sidecar " + (dir / kSidecarFile).string() + ": " + e.what(), kComponent);
    }
    return record_from_json(j);
}

} // anonymous namespace

auto to_json(const CalibratorRecord& r) -> nlohmann::json {
    return nlohmann::json{
        {"name", r.name},
        {"version_id", r.version_id},
        {"created_at", r.created_at},
        {"calibrator_path", r.calibrator_path.string()},
        {"metadata", r.metadata},
    };
}

auto record_from_json(const nlohmann::json& j) -> std::expected<CalibratorRecord, core::error> {
    if (!j.is_object()) {
        return core::make_error(core::error_code::data_integrity, "sidecar is not a JSON object", kComponent);
    }
    CalibratorRecord r;
    for (const char* key : {"name", "version_id", "created_at", "calibrator_path"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return core::make_error(core::error_code::data_integrity,
                std::string("sidecar field \"") + key + "\" missing or not a string", kComponent);
        }
    }
    r.name = j.at("name").get<std::string>();
    r.version_id = j.at("version_id").get<std::string>();
    r.created_at = j.at("created_at").get<std::string>();
    r.calibrator_path = j.at("calibrator_path").get<std::string>();
    if (auto it = j.find("metadata"); it != j.end()) r.metadata = *it;
    if (!is_version_id(r.version_id)) {
        return core::make_error(core::error_code::data_integrity,
                                "sidecar version_id \"" + r.version_id + "\" is malformed", kComponent);
    }
    return r;
}

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    using namespace std::chrono;
    const auto us = duration_cast<microseconds>(tp.time_since_epoch()).count();
    auto secs = us / 1'000'000;
    auto frac = us % 1'000'000;
    if (frac < 0) { frac += 1'000'000; secs -= 1; }
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(frac));
    return buf;
}

auto safe_name(std::string_view name) -> std::expected<std::string, core::error> {
    auto invalid = [&](const char* why) {
        return core::make_error(core::error_code::invalid_argument,
                                "invalid calibrator name \"" + std::string(name) + "\": " + why, kComponent);
    };
    if (name.empty()) return invalid("empty");
    if (name.starts_with("..")) return invalid("leading '..'");
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '/' || c == '\\') return invalid("path separator");
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) return invalid("control character");
        out.push_back(c == ' ' ? '_' : c);
    }
    if (out == ".") return invalid("'.'");
    return out;
}

CalibratorRegistry::CalibratorRegistry(fs::path base_dir, RegistryOptions options)
    : base_(std::move(base_dir)),
      options_(std::move(options)),
      cache_(std::make_unique<ModelCache>(options_.cache_capacity)) {
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

auto CalibratorRegistry::open(fs::path base_dir, RegistryOptions options)
    -> std::expected<CalibratorRegistry, core::error> {
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) return io_error("cannot create registry directory", base_dir, ec);
    if (!fs::is_directory(base_dir, ec)) {
        return core::make_error(core::error_code::io_failed,
                                "registry path is not a directory: " + base_dir.string(), kComponent);
    }
    return CalibratorRegistry(std::move(base_dir), std::move(options));
}

auto CalibratorRegistry::open_default(RegistryOptions options)
    -> std::expected<CalibratorRegistry, core::error> {
    fs::path base = "./calibrators";
    if (auto env = core::safe_getenv("CALIBET_REGISTRY_DIR"); env && !env->empty()) {
        base = *env;
    }
    return open(std::move(base), std::move(options));
}

auto CalibratorRegistry::version_dir(std::string_view name, std::string_view version_id) const
    -> std::expected<fs::path, core::error> {
    auto dir_name = safe_name(name);
    if (!dir_name) return std::unexpected(dir_name.error());
    if (!is_version_id(version_id)) {
        return core::make_error(core::error_code::not_found,
            "no version \"" + std::string(version_id) + "\" of \"" + std::string(name) + "\"", kComponent);
    }
    return base_ / *dir_name / kVersionsDir / std::string(version_id);
}

auto CalibratorRegistry::register_calibrator(std::string_view name,
                                             const calibration::Calibrator& calibrator,
                                             const nlohmann::json& metadata)
    -> std::expected<CalibratorRecord, core::error> {
    auto dir_name = safe_name(name);
    if (!dir_name) return std::unexpected(dir_name.error());

    CalibratorRecord rec;
    rec.name = std::string(name);
    rec.metadata = metadata.is_null() ? nlohmann::json::object() : metadata;

    const fs::path versions = base_ / *dir_name / kVersionsDir;
    std::error_code ec;
    fs::create_directories(versions, ec);
    if (ec) return io_error("cannot create versions directory", versions, ec);

    // created_at has microsecond resolution; on a version id collision the
    // timestamp moves forward so the existing version stays untouched.
    auto stamp = std::chrono::time_point_cast<std::chrono::microseconds>(options_.clock());
    fs::path dir;
    for (int attempt = 0;; ++attempt) {
        rec.created_at = format_timestamp(stamp);
        auto vid = make_version_id(rec.name, rec.metadata, rec.created_at);
        if (!vid) return std::unexpected(vid.error());
        rec.version_id = std::move(*vid);

        dir = versions / rec.version_id;
        const bool created = fs::create_directory(dir, ec);
        if (ec) return io_error("cannot create version directory", dir, ec);
        if (created) break;
        if (attempt + 1 >= kMaxVersionCollisions) {
            return core::make_error(core::error_code::data_integrity,
                "version " + rec.version_id + " of \"" + rec.name + "\" already exists", kComponent);
        }
        core::log(core::log_level::debug, kComponent,
                  "version id collision for " + rec.name + " at " + rec.created_at + ", retrying");
        const auto now = std::chrono::time_point_cast<std::chrono::microseconds>(options_.clock());
        stamp = std::max(now, stamp + std::chrono::microseconds{1});
    }

    // A half-written version must not be visible to list/latest.
    auto discard = [&dir] {
        std::error_code rec_ec;
        (void)fs::remove_all(dir, rec_ec);
    };

    rec.calibrator_path = fs::absolute(dir / kBlobFile, ec);
    if (ec) rec.calibrator_path = dir / kBlobFile;

    if (auto w = core::write_file_atomic(dir / kBlobFile, calibration::serialize(calibrator),
                                         options_.durable); !w) {
        discard();
        return std::unexpected(w.error());
    }
    std::string sidecar;
    try {
        sidecar = to_json(rec).dump(2);
    } catch (const nlohmann::json::exception& e) {
        discard();
        return core::make_error(core::error_code::invalid_argument,
                                std::string("metadata is not serializable: ") + e.what(), kComponent);
    }
    if (auto w = core::write_file_atomic(dir / kSidecarFile, sidecar, options_.durable); !w) {
        discard();
        return std::unexpected(w.error());
    }

    cache_->put(*dir_name + "/" + rec.version_id,
                std::make_shared<const calibration::Calibrator>(calibrator));
    if (core::log_enabled(core::log_level::info)) {
        core::log(core::log_level::info, kComponent,
                  "registered " + rec.name + " version " + rec.version_id +
                  " (" + std::string(calibration::to_string(calibrator.kind())) + ")");
    }
    return rec;
}

auto CalibratorRegistry::list_names() const -> std::expected<std::vector<std::string>, core::error> {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(base_, ec);
    if (ec) return io_error("cannot list registry", base_, ec);
    for (const auto& entry : it) {
        std::error_code st_ec;
        if (entry.is_directory(st_ec) && fs::is_directory(entry.path() / kVersionsDir, st_ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

auto CalibratorRegistry::list_versions(std::string_view name) const
    -> std::expected<std::vector<std::string>, core::error> {
    auto dir_name = safe_name(name);
    if (!dir_name) return std::unexpected(dir_name.error());
    const fs::path versions = base_ / *dir_name / kVersionsDir;
    std::error_code ec;
    if (!fs::is_directory(versions, ec)) {
        return core::make_error(core::error_code::not_found,
                                "no calibrator named \"" + std::string(name) + "\"", kComponent);
    }
    std::vector<std::string> ids;
    fs::directory_iterator it(versions, ec);
    if (ec) return io_error("cannot list versions", versions, ec);
    for (const auto& entry : it) {
        std::error_code st_ec;
        auto id = entry.path().filename().string();
        if (entry.is_directory(st_ec) && is_version_id(id)) ids.push_back(std::move(id));
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto CalibratorRegistry::get_record(std::string_view name, std::string_view version_id) const
    -> std::expected<CalibratorRecord, core::error> {
    auto dir = version_dir(name, version_id);
    if (!dir) return std::unexpected(dir.error());
    std::error_code ec;
    if (!fs::is_directory(*dir, ec)) {
        return core::make_error(core::error_code::not_found,
            "no version \"" + std::string(version_id) + "\" of \"" + std::string(name) + "\"", kComponent);
    }
    auto rec = read_sidecar(*dir);
    if (!rec && rec.error().code == core::error_code::not_found) {
        return core::make_error(core::error_code::data_integrity,
                                "version directory without sidecar: " + dir->string(), kComponent);
    }
    return rec;
}

auto CalibratorRegistry::latest_record(std::string_view name) const
    -> std::expected<CalibratorRecord, core::error> {
    auto ids = list_versions(name);
    if (!ids) return std::unexpected(ids.error());

    std::optional<CalibratorRecord> best;
    for (const auto& id : *ids) {
        auto rec = get_record(name, id);
        if (!rec) {
            core::log(core::log_level::warn, kComponent,
                      "skipping unreadable version " + id + ": " + rec.error().message);
            continue;
        }
        if (!best || rec->created_at > best->created_at ||
            (rec->created_at == best->created_at && rec->version_id > best->version_id)) {
            best = std::move(*rec);
        }
    }
    if (!best) {
        return core::make_error(core::error_code::not_found,
                                "no readable versions of \"" + std::string(name) + "\"", kComponent);
    }
    return std::move(*best);
}

auto CalibratorRegistry::load(std::string_view name, std::string_view version_id)
    -> std::expected<ModelCache::Value, core::error> {
    auto dir = version_dir(name, version_id);
    if (!dir) return std::unexpected(dir.error());
    // version_dir validated the name, so safe_name cannot fail here.
    const std::string key = safe_name(name).value() + "/" + std::string(version_id);
    if (auto hit = cache_->get(key)) return *hit;

    auto text = core::read_file(*dir / kBlobFile);
    if (!text) {
        if (text.error().code == core::error_code::not_found) {
            return core::make_error(core::error_code::not_found,
                "no version \"" + std::string(version_id) + "\" of \"" + std::string(name) + "\"", kComponent);
        }
        return std::unexpected(text.error());
    }
    auto model = calibration::deserialize(*text);
    if (!model) {
        auto err = model.error();
        err.message = (*dir / kBlobFile).string() + ": " + err.message;
        return std::unexpected(std::move(err));
    }
    auto value = std::make_shared<const calibration::Calibrator>(std::move(*model));
    cache_->put(key, value);
    return value;
}

auto CalibratorRegistry::load_latest(std::string_view name)
    -> std::expected<ModelCache::Value, core::error> {
    auto rec = latest_record(name);
    if (!rec) return std::unexpected(rec.error());
    return load(name, rec->version_id);
}

} // namespace calibet::registry

/** \file calibrator_registry_test.cpp
 *  \brief Versioned calibrator store: round trip, latest resolution, write-once and errors.
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "calibet/registry/calibrator_registry.hpp"
#include "calibet/registry/content_hash.hpp"

using namespace calibet;
using namespace calibet::registry;
using calibet::calibration::Calibrator;
using calibet::calibration::IsotonicModel;
using calibet::calibration::PlattModel;

namespace {

namespace fs = std::filesystem;

fs::path temp_dir(const std::string& name) {
    std::random_device rd;
    auto dir = fs::temp_directory_path() / ("calibet_" + name + "_" + std::to_string(rd()));
    fs::remove_all(dir);
    return dir;
}

struct TempDirGuard {
    fs::path path;
    ~TempDirGuard() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::chrono::system_clock::time_point at_seconds(std::int64_t s, std::int64_t us = 0) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{s} + std::chrono::microseconds{us}};
}

RegistryOptions fixed_clock(std::chrono::system_clock::time_point tp) {
    RegistryOptions o;
    o.durable = false;
    o.clock = [tp] { return tp; };
    return o;
}

} // namespace

TEST_CASE("timestamps are UTC ISO-8601 with microseconds", "[registry]") {
    // 2024-01-02T03:04:05 UTC
    REQUIRE(format_timestamp(at_seconds(1704164645, 6)) == "2024-01-02T03:04:05.000006Z");
    REQUIRE(format_timestamp(at_seconds(0)) == "1970-01-01T00:00:00.000000Z");
}

TEST_CASE("calibrator names map to directory names", "[registry]") {
    REQUIRE(safe_name("LeBron James").value() == "LeBron_James");
    REQUIRE(safe_name("points-over").value() == "points-over");
    for (const char* bad : {"", "a/b", "a\\b", "..", "../up", "tab\there"}) {
        auto r = safe_name(bad);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::invalid_argument);
    }
}

TEST_CASE("version ids are content addressed", "[registry]") {
    const nlohmann::json meta{{"method", "platt"}, {"n_samples", 10}};
    auto a = make_version_id("x", meta, "2024-01-01T00:00:00.000000Z");
    auto b = make_version_id("x", meta, "2024-01-01T00:00:00.000000Z");
    auto c = make_version_id("x", meta, "2024-01-01T00:00:00.000001Z");
    REQUIRE(a.has_value());
    REQUIRE(is_version_id(*a));
    REQUIRE(*a == *b);
    REQUIRE(*a != *c);

    // SHA-1("abc")
    REQUIRE(sha1_hex("abc").value() == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("register and load round trip", "[registry]") {
    TempDirGuard guard{temp_dir("roundtrip")};
    auto reg = CalibratorRegistry::open(guard.path, fixed_clock(at_seconds(1704164645, 6)));
    REQUIRE(reg.has_value());

    IsotonicModel iso;
    iso.xs = {0.1, 0.4, 0.8};
    iso.ys = {0.05, 0.5, 0.9};
    const Calibrator original(iso);

    const nlohmann::json meta{{"method", "isotonic"}};
    auto rec = reg->register_calibrator("Test Player", original, meta);
    REQUIRE(rec.has_value());
    REQUIRE(rec->name == "Test Player");
    REQUIRE(rec->created_at == "2024-01-02T03:04:05.000006Z");
    REQUIRE(rec->version_id == make_version_id("Test Player", meta, rec->created_at).value());
    REQUIRE(fs::exists(guard.path / "Test_Player" / "versions" / rec->version_id / "calibrator.txt"));
    REQUIRE(fs::exists(guard.path / "Test_Player" / "versions" / rec->version_id / "metadata.json"));

    // A fresh registry has a cold cache and must read from disk.
    auto reopened = CalibratorRegistry::open(guard.path, fixed_clock(at_seconds(0)));
    REQUIRE(reopened.has_value());
    auto loaded = reopened->load("Test Player", rec->version_id);
    REQUIRE(loaded.has_value());
    for (double p : {0.0, 0.1, 0.25, 0.6, 0.8, 1.0}) {
        REQUIRE((*loaded)->apply(p) == original.apply(p));
    }

    auto got = reopened->get_record("Test Player", rec->version_id);
    REQUIRE(got.has_value());
    REQUIRE(got->metadata == meta);
    REQUIRE(got->created_at == rec->created_at);

    auto again = reopened->load("Test Player", rec->version_id);
    REQUIRE(again.has_value());
    REQUIRE(reopened->cache_stats().hits >= 1);

    auto names = reopened->list_names();
    REQUIRE(names.has_value());
    REQUIRE(*names == std::vector<std::string>{"Test_Player"});
}

TEST_CASE("latest is resolved by created_at", "[registry]") {
    TempDirGuard guard{temp_dir("latest")};
    auto now = at_seconds(1700000000);
    RegistryOptions opts;
    opts.durable = false;
    opts.clock = [&now] { return now; };
    auto reg = CalibratorRegistry::open(guard.path, opts);
    REQUIRE(reg.has_value());

    auto first = reg->register_calibrator("m", Calibrator(PlattModel{1.0, 0.0}));
    now = at_seconds(1700000100);
    auto second = reg->register_calibrator("m", Calibrator(PlattModel{2.0, -1.0}));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->version_id != second->version_id);

    auto versions = reg->list_versions("m");
    REQUIRE(versions.has_value());
    REQUIRE(versions->size() == 2);

    auto latest = reg->latest_record("m");
    REQUIRE(latest.has_value());
    REQUIRE(latest->version_id == second->version_id);

    auto model = reg->load_latest("m");
    REQUIRE(model.has_value());
    REQUIRE((*model)->apply(0.5) == Calibrator(PlattModel{2.0, -1.0}).apply(0.5));

    SECTION("unreadable sidecars are skipped") {
        std::ofstream(guard.path / "m" / "versions" / second->version_id / "metadata.json") << "{not json";
        auto fallback = reg->latest_record("m");
        REQUIRE(fallback.has_value());
        REQUIRE(fallback->version_id == first->version_id);

        auto broken = reg->get_record("m", second->version_id);
        REQUIRE_FALSE(broken.has_value());
        REQUIRE(broken.error().code == core::error_code::data_integrity);
    }
}

TEST_CASE("versions are write-once", "[registry]") {
    TempDirGuard guard{temp_dir("writeonce")};
    auto reg = CalibratorRegistry::open(guard.path, fixed_clock(at_seconds(1700000000)));
    REQUIRE(reg.has_value());

    auto first = reg->register_calibrator("m", Calibrator(PlattModel{1.0, 0.0}));
    REQUIRE(first.has_value());
    REQUIRE(first->created_at == "2023-11-14T22:13:20.000000Z");

    // Same name, metadata and clock reading: the second registration moves to
    // the next microsecond instead of touching the first version.
    auto second = reg->register_calibrator("m", Calibrator(PlattModel{5.0, 5.0}));
    REQUIRE(second.has_value());
    REQUIRE(second->version_id != first->version_id);
    REQUIRE(second->created_at == "2023-11-14T22:13:20.000001Z");

    auto fresh = CalibratorRegistry::open(guard.path, fixed_clock(at_seconds(0)));
    REQUIRE(fresh.has_value());
    auto loaded = fresh->load("m", first->version_id);
    REQUIRE(loaded.has_value());
    REQUIRE((*loaded)->apply(0.3) == Calibrator(PlattModel{1.0, 0.0}).apply(0.3));

    auto latest = fresh->latest_record("m");
    REQUIRE(latest.has_value());
    REQUIRE(latest->version_id == second->version_id);
    REQUIRE(fresh->list_versions("m")->size() == 2);
}

TEST_CASE("loaded calibrators are cached per registry", "[registry]") {
    TempDirGuard guard{temp_dir("cache")};
    auto now = at_seconds(1700000000);
    RegistryOptions opts;
    opts.durable = false;
    opts.cache_capacity = 1;
    opts.clock = [&now] { return now; };
    auto writer = CalibratorRegistry::open(guard.path, opts);
    REQUIRE(writer.has_value());
    auto a = writer->register_calibrator("a", Calibrator(PlattModel{1.0, 0.0}));
    now = at_seconds(1700000001);
    auto b = writer->register_calibrator("b", Calibrator(PlattModel{2.0, 0.0}));
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    auto reg = CalibratorRegistry::open(guard.path, opts);
    REQUIRE(reg.has_value());
    REQUIRE(reg->load("a", a->version_id).has_value());
    REQUIRE(reg->load("a", a->version_id).has_value());
    REQUIRE(reg->load("b", b->version_id).has_value());

    const auto stats = reg->cache_stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 2);
    REQUIRE(stats.inserts == 2);
    REQUIRE(stats.evictions == 1);

    SECTION("zero capacity disables caching") {
        RegistryOptions off = opts;
        off.cache_capacity = 0;
        auto uncached = CalibratorRegistry::open(guard.path, off);
        REQUIRE(uncached.has_value());
        REQUIRE(uncached->load("a", a->version_id).has_value());
        REQUIRE(uncached->load("a", a->version_id).has_value());
        REQUIRE(uncached->cache_stats().hits == 0);
        REQUIRE(uncached->cache_stats().inserts == 0);
    }
}

TEST_CASE("registry lookup errors", "[registry]") {
    TempDirGuard guard{temp_dir("errors")};
    auto reg = CalibratorRegistry::open(guard.path, fixed_clock(at_seconds(1700000000)));
    REQUIRE(reg.has_value());

    auto missing_name = reg->latest_record("nobody");
    REQUIRE_FALSE(missing_name.has_value());
    REQUIRE(missing_name.error().code == core::error_code::not_found);

    auto rec = reg->register_calibrator("m", Calibrator(PlattModel{}));
    REQUIRE(rec.has_value());

    auto missing_version = reg->load("m", "0123456789ab");
    REQUIRE_FALSE(missing_version.has_value());
    REQUIRE(missing_version.error().code == core::error_code::not_found);

    auto malformed_version = reg->get_record("m", "../../etc");
    REQUIRE_FALSE(malformed_version.has_value());
    REQUIRE(malformed_version.error().code == core::error_code::not_found);

    auto bad_name = reg->register_calibrator("a/b", Calibrator(PlattModel{}));
    REQUIRE_FALSE(bad_name.has_value());
    REQUIRE(bad_name.error().code == core::error_code::invalid_argument);

    std::ofstream(guard.path / "m" / "versions" / rec->version_id / "calibrator.txt") << "garbage\n";
    auto fresh = CalibratorRegistry::open(guard.path, fixed_clock(at_seconds(0)));
    REQUIRE(fresh.has_value());
    auto corrupt = fresh->load("m", rec->version_id);
    REQUIRE_FALSE(corrupt.has_value());
    REQUIRE(corrupt.error().code == core::error_code::data_integrity);
}

// tests/atomic_file_tests.cpp
//
// Coverage for eldritch::io::write_atomic/read_all, the persistence path for
// objective and achievement saves.

#include <doctest/doctest.h>

#include "eldritch/io/AtomicFile.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

fs::path make_unique_temp_dir(const char* tag)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = base / ("eldritch_tests_io_" + std::string(tag) + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    return dir;
}

} // namespace

TEST_CASE("io::write_atomic round-trips bytes and keeps a backup")
{
    const fs::path dir = make_unique_temp_dir("roundtrip");
    const fs::path p = dir / "atomic_io_roundtrip.txt";

    INFO("path: ", p.string());

    std::string err;
    CHECK(eldritch::io::write_atomic(p, "hello\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    std::string read;
    CHECK(eldritch::io::read_all(p, read, &err));
    CHECK(read == "hello\n");

    // Overwrite preserves the prior version as .bak
    CHECK(eldritch::io::write_atomic(p, "world\n", &err, /*make_backup=*/true));
    read.clear();
    CHECK(eldritch::io::read_all(p, read, &err));
    CHECK(read == "world\n");

    fs::path bak = p;
    bak += ".bak";
    std::string bak_read;
    CHECK(eldritch::io::read_all(bak, bak_read, &err));
    CHECK(bak_read == "hello\n");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("io::write_atomic creates missing parent directories")
{
    const fs::path dir = make_unique_temp_dir("parents");
    const fs::path p = dir / "saves" / "slot1" / "objectives.json";

    std::string err;
    REQUIRE(eldritch::io::write_atomic(p, "{}", &err));
    CHECK(fs::exists(p));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("io::read_all reports a missing file")
{
    const fs::path dir = make_unique_temp_dir("missing");
    std::string out = "untouched";
    std::string err;

    CHECK_FALSE(eldritch::io::read_all(dir / "does_not_exist.json", out, &err));
    CHECK_FALSE(err.empty());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

#include <catch2/catch_test_macros.hpp>
#include "audit/file_sink.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace piishield;

namespace {

std::string read_file_contents(const std::string& path) {
    std::ifstream ifs(path);
    return std::string(std::istreambuf_iterator<char>(ifs),
                       std::istreambuf_iterator<char>());
}

void cleanup_rotation_files(const std::string& base, int max_files) {
    std::filesystem::remove(base);
    for (int i = 1; i <= max_files + 2; ++i) {
        std::filesystem::remove(base + "." + std::to_string(i));
    }
}

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // anonymous namespace

TEST_CASE("FileSink: appends lines", "[audit][file_sink]") {
    const auto path = temp_path("piishield_sink_append.jsonl");
    cleanup_rotation_files(path, 2);

    {
        FileSink::Config cfg;
        cfg.output_file = path;
        FileSink sink(cfg);

        CHECK(sink.write("{\"a\":1}\n"));
        CHECK(sink.write("{\"b\":2}\n"));
        CHECK(sink.current_file_size() == 16);
        CHECK(sink.lines_written() == 2);
        CHECK(sink.name() == "file:" + path);
    }

    CHECK(read_file_contents(path) == "{\"a\":1}\n{\"b\":2}\n");
    cleanup_rotation_files(path, 2);
}

TEST_CASE("FileSink: size-based rotation shifts files", "[audit][file_sink][rotation]") {
    const auto path = temp_path("piishield_sink_rotation.jsonl");
    cleanup_rotation_files(path, 3);

    FileSink::Config cfg;
    cfg.output_file = path;
    cfg.max_file_size_bytes = 100;
    cfg.max_files = 3;

    std::string line(60, 'a');
    line += '\n';

    {
        FileSink sink(cfg);
        (void)sink.write(line);     // 61 bytes
        (void)sink.write(line);     // would exceed 100 -> rotate first
        CHECK(sink.rotation_count() == 1);
        (void)sink.write(line);     // rotate again
        CHECK(sink.rotation_count() == 2);
    }

    CHECK(std::filesystem::exists(path));
    CHECK(std::filesystem::exists(path + ".1"));
    CHECK(std::filesystem::exists(path + ".2"));
    CHECK(read_file_contents(path) == line);
    CHECK(read_file_contents(path + ".1") == line);

    cleanup_rotation_files(path, 3);
}

TEST_CASE("FileSink: oldest file dropped past max_files", "[audit][file_sink][rotation]") {
    const auto path = temp_path("piishield_sink_retention.jsonl");
    cleanup_rotation_files(path, 2);

    FileSink::Config cfg;
    cfg.output_file = path;
    cfg.max_file_size_bytes = 10;
    cfg.max_files = 2;

    {
        FileSink sink(cfg);
        for (int i = 0; i < 6; ++i) {
            (void)sink.write("0123456789\n");
        }
        CHECK(sink.rotation_count() == 5);
    }

    CHECK(std::filesystem::exists(path + ".1"));
    CHECK(std::filesystem::exists(path + ".2"));
    CHECK_FALSE(std::filesystem::exists(path + ".3"));

    cleanup_rotation_files(path, 2);
}

TEST_CASE("FileSink: existing file size is resumed", "[audit][file_sink]") {
    const auto path = temp_path("piishield_sink_resume.jsonl");
    cleanup_rotation_files(path, 1);
    {
        std::ofstream out(path);
        out << "0123456789\n";
    }

    FileSink::Config cfg;
    cfg.output_file = path;
    FileSink sink(cfg);
    CHECK(sink.current_file_size() == 11);

    sink.shutdown();
    cleanup_rotation_files(path, 1);
}

TEST_CASE("FileSink: missing newline is supplied", "[audit][file_sink]") {
    const auto path = temp_path("piishield_sink_newline.jsonl");
    cleanup_rotation_files(path, 1);

    {
        FileSink::Config cfg;
        cfg.output_file = path;
        FileSink sink(cfg);
        CHECK(sink.write("{\"a\":1}"));
        CHECK(sink.current_file_size() == 8);
    }

    CHECK(read_file_contents(path) == "{\"a\":1}\n");
    cleanup_rotation_files(path, 1);
}

TEST_CASE("FileSink: files are owner read/write only", "[audit][file_sink]") {
    const auto path = temp_path("piishield_sink_perms.jsonl");
    cleanup_rotation_files(path, 2);

    FileSink::Config cfg;
    cfg.output_file = path;
    cfg.max_file_size_bytes = 10;
    cfg.max_files = 2;

    {
        FileSink sink(cfg);
        (void)sink.write("0123456789\n");
        (void)sink.write("0123456789\n");
        REQUIRE(sink.rotation_count() == 1);
    }

    const auto expected = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
    CHECK(std::filesystem::status(path).permissions() == expected);
    CHECK(std::filesystem::status(path + ".1").permissions() == expected);

    cleanup_rotation_files(path, 2);
}

TEST_CASE("FileSink: zero max_files keeps no history", "[audit][file_sink][rotation]") {
    const auto path = temp_path("piishield_sink_nohistory.jsonl");
    cleanup_rotation_files(path, 1);

    FileSink::Config cfg;
    cfg.output_file = path;
    cfg.max_file_size_bytes = 10;
    cfg.max_files = 0;

    {
        FileSink sink(cfg);
        (void)sink.write("first_line\n");
        (void)sink.write("second_lin\n");
    }

    CHECK(read_file_contents(path) == "second_lin\n");
    CHECK_FALSE(std::filesystem::exists(path + ".1"));
    cleanup_rotation_files(path, 1);
}

TEST_CASE("FileSink: unopenable path throws", "[audit][file_sink]") {
    FileSink::Config cfg;
    cfg.output_file = "/nonexistent_dir_piishield/audit.jsonl";
    CHECK_THROWS_AS(FileSink(cfg), std::runtime_error);
}

/**
 * @file test_loader.cpp
 * @brief Loading configuration trees (Catch2)
 *
 * What a loaded tree must preserve for field decisions:
 * - explicit JSON nulls stay distinguishable from missing keys
 * - empty containers stay present
 * - JSON and TOML describing the same data give the same tree
 * Plus format detection and parse error positions.
 */

#include <catch2/catch_all.hpp>
#include "cfgbind/Emptiness.hpp"
#include "cfgbind/Errors.hpp"
#include "cfgbind/Loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace cfgbind;

namespace {

/**
 * @brief Config file that removes itself.
 */
class ScratchConfig {
public:
    ScratchConfig(const std::string& extension, const std::string& text)
        : path_(fs::temp_directory_path() /
                ("cfgbind_load_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << text;
    }

    ~ScratchConfig() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST_CASE("detect_format", "[loader]") {
    CHECK(detect_format("app.json") == ConfigFormat::json);
    CHECK(detect_format("conf/app.TOML") == ConfigFormat::toml);
    CHECK(detect_format("app.Json") == ConfigFormat::json);
    CHECK_FALSE(detect_format("app.yaml").has_value());
    CHECK_FALSE(detect_format("Makefile").has_value());
    CHECK(std::string(to_string(ConfigFormat::toml)) == "toml");
}

TEST_CASE("JSON trees keep the three raw states", "[loader][json]") {
    ScratchConfig file(".json", R"({
        "owner": null,
        "servers": [],
        "db": {"host": "db.local", "options": {}}
    })");

    ConfigTree tree = load_tree(file.path());

    SECTION("explicit null") {
        RawValue raw = tree.get_raw("owner");
        CHECK(raw.is_null());
        CHECK_FALSE(raw.is_absent());
    }

    SECTION("missing key") {
        CHECK(tree.get_raw("db.port").is_absent());
        CHECK(tree.get_raw("cache.size").is_absent());
    }

    SECTION("empty containers are present and empty") {
        RawValue servers = tree.get_raw("servers");
        RawValue options = tree.get_raw("db.options");
        CHECK(servers.is_present());
        CHECK(options.is_present());
        CHECK(is_empty(servers));
        CHECK(is_empty(options));
    }

    SECTION("present values") {
        RawValue host = tree.get_raw("db.host");
        REQUIRE(host.is_present());
        CHECK(host.value() == "db.local");
    }
}

TEST_CASE("TOML trees", "[loader][toml]") {
    ScratchConfig file(".toml", R"(
name = ""
tags = []
released = 2024-03-01

[limits]
timeout = 30
ratio = 0.5
)");

    ConfigTree tree = load_tree(file.path());

    SECTION("keys that are not written are absent") {
        CHECK(tree.get_raw("owner").is_absent());
        CHECK(tree.get_raw("limits.retries").is_absent());
    }

    SECTION("empty string and empty array are present and empty") {
        CHECK(tree.get_raw("name").is_present());
        CHECK(is_empty(tree.get_raw("name")));
        CHECK(is_empty(tree.get_raw("tags")));
    }

    SECTION("tables and scalars") {
        RawValue timeout = tree.get_raw("limits.timeout");
        RawValue ratio = tree.get_raw("limits.ratio");
        CHECK(timeout.value() == 30);
        CHECK(ratio.value() == 0.5);
    }

    SECTION("dates become strings") {
        RawValue released = tree.get_raw("released");
        REQUIRE(released.is_present());
        CHECK(released.value() == "2024-03-01");
    }
}

TEST_CASE("JSON and TOML give the same tree", "[loader]") {
    ScratchConfig json(".json", R"({
        "name": "svc",
        "servers": ["a", "b"],
        "db": {"host": "db.local", "port": 5432, "tls": true}
    })");
    ScratchConfig toml(".toml", R"(
name = "svc"
servers = ["a", "b"]

[db]
host = "db.local"
port = 5432
tls = true
)");

    CHECK(load_tree(json.path()).data() == load_tree(toml.path()).data());
}

TEST_CASE("parse_config reports error positions", "[loader]") {
    SECTION("JSON") {
        const std::string text = "{\n  \"a\": 1,\n  oops\n}";
        try {
            parse_config(text, ConfigFormat::json, "inline.json");
            FAIL("Should have thrown ConfigParseError");
        } catch (const ConfigParseError& e) {
            CHECK(e.file() == "inline.json");
            CHECK(e.line() == 3);
            CHECK(e.column() > 0);
        }
    }

    SECTION("TOML") {
        try {
            parse_config("a = 1\nb = [unclosed\n", ConfigFormat::toml, "inline.toml");
            FAIL("Should have thrown ConfigParseError");
        } catch (const ConfigParseError& e) {
            CHECK(e.file() == "inline.toml");
            CHECK(e.line() >= 2);
            CHECK_FALSE(e.details().empty());
        }
    }
}

TEST_CASE("load_tree failures", "[loader]") {
    SECTION("empty path gives an empty tree") {
        ConfigTree tree = load_tree("");
        CHECK(tree.data().is_object());
        CHECK(tree.data().empty());
    }

    SECTION("missing file") {
        CHECK_THROWS_AS(load_tree("/nonexistent/app.toml"), FileNotFoundError);
    }

    SECTION("unsupported extension") {
        ScratchConfig file(".yaml", "name: svc\n");
        CHECK_THROWS_AS(load_tree(file.path()), ConfigError);
    }

    SECTION("syntax error names the file") {
        ScratchConfig file(".json", R"({"name": "svc")");
        try {
            load_tree(file.path());
            FAIL("Should have thrown ConfigParseError");
        } catch (const ConfigParseError& e) {
            CHECK(e.file() == file.path());
        }
    }
}

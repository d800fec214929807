#include <catch2/catch_test_macros.hpp>

#include "credentials.hpp"
#include "tmp_dir.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

// Everything written to a tmpfile() stream, from the start.
std::string read_back(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

} // namespace

TEST_CASE("has_secure_permissions", "[credentials]") {
    using fs::perms;
    REQUIRE(has_secure_permissions(perms::owner_read | perms::owner_write));
    REQUIRE(has_secure_permissions(perms::owner_read));
    REQUIRE_FALSE(has_secure_permissions(perms::owner_read | perms::owner_write |
                                         perms::group_read | perms::others_read));
    REQUIRE_FALSE(has_secure_permissions(perms::owner_all));
    REQUIRE_FALSE(has_secure_permissions(perms::none));
}

TEST_CASE("load_api_key", "[credentials]") {
    TmpDir dir;

    SECTION("StripsWhitespace") {
        auto path = dir.write("api_key", "  abc-123 \n\tdef\n");
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write);

        auto key = load_api_key(path);
        REQUIRE(key);
        REQUIRE(*key == "abc-123def");
    }

    SECTION("InsecurePermissionsStillLoad") {
        auto path = dir.write("api_key", "secret\n");
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write |
                                  fs::perms::group_read | fs::perms::others_read);

        std::FILE* warn = std::tmpfile();
        REQUIRE(warn != nullptr);
        auto key = load_api_key(path, warn);
        auto text = read_back(warn);
        std::fclose(warn);

        REQUIRE(key);
        REQUIRE(*key == "secret");
        REQUIRE(text.find("insecure permissions (644)") != std::string::npos);
        REQUIRE(text.find("chmod 600 " + path) != std::string::npos);
    }

    SECTION("SecurePermissionsDoNotWarn") {
        auto path = dir.write("api_key", "secret\n");
        fs::permissions(path, fs::perms::owner_read);

        std::FILE* warn = std::tmpfile();
        REQUIRE(warn != nullptr);
        auto key = load_api_key(path, warn);
        auto text = read_back(warn);
        std::fclose(warn);

        REQUIRE(key);
        REQUIRE(text.empty());
    }

    SECTION("MissingFile") {
        auto key = load_api_key(dir.file("api_key"));
        REQUIRE_FALSE(key);
        REQUIRE(key.error().code == ErrorCode::ConfigError);
        REQUIRE(key.error().message.find("API key file not found") != std::string::npos);
    }

    SECTION("MissingFileHintsUseActualPath") {
        auto path = (dir.path / "custom" / "reka.key").string();
        auto key = load_api_key(path);
        REQUIRE_FALSE(key);

        const auto& msg = key.error().message;
        REQUIRE(msg.find("mkdir -p " + (dir.path / "custom").string()) != std::string::npos);
        REQUIRE(msg.find("> " + path) != std::string::npos);
        REQUIRE(msg.find("chmod 600 " + path) != std::string::npos);
        REQUIRE(msg.find("~/.config/reka") == std::string::npos);
    }

    SECTION("EmptyPath") {
        auto key = load_api_key("");
        REQUIRE_FALSE(key);
        REQUIRE(key.error().code == ErrorCode::ConfigError);
    }

    SECTION("WhitespaceOnlyIsEmpty") {
        auto path = dir.write("api_key", " \n\n");
        auto key = load_api_key(path);
        REQUIRE_FALSE(key);
        REQUIRE(key.error().code == ErrorCode::ConfigError);
        REQUIRE(key.error().message.find("empty") != std::string::npos);
    }

    SECTION("DirectoryIsNotAKey") {
        auto key = load_api_key(dir.path.string());
        REQUIRE_FALSE(key);
        REQUIRE(key.error().code == ErrorCode::ConfigError);
    }
}

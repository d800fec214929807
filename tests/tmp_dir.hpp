#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// RAII scratch directory for tests; removed with its contents.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        auto tmpl = (std::filesystem::temp_directory_path() / "rt_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = ::mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TmpDir(const TmpDir&) = delete;
    TmpDir& operator=(const TmpDir&) = delete;

    std::string write(const std::string& name, const std::string& content) const {
        auto p = path / name;
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p.string();
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

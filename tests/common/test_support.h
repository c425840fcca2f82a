#pragma once
// Shared helpers for the standalone test executables.
//
// Each test binary counts failures, prints "[name] OK" / "[name] FAIL: ..."
// lines and returns non-zero if anything failed.

#include <stdlib.h>

#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace test_support {

    inline int& failures() {
        static int n = 0;
        return n;
    }

    inline void check(bool ok, const std::string& name, const std::string& detail = "") {
        if (ok) {
            std::printf("[%s] OK\n", name.c_str());
        } else {
            std::fprintf(stderr, "[%s] FAIL%s%s\n", name.c_str(),
                         detail.empty() ? "" : ": ", detail.c_str());
            failures()++;
        }
    }

    inline bool near(double a, double b, double eps = 0.011) {
        return std::fabs(a - b) <= eps;
    }

    inline int finish(const char* suite) {
        if (failures()) {
            std::fprintf(stderr, "[%s] FAILURES: %d\n", suite, failures());
            return 1;
        }
        std::printf("[%s] ALL OK\n", suite);
        return 0;
    }

    // Fresh directory under $TMPDIR (or /tmp). Removed by ~TempDir.
    class TempDir {
    public:
        explicit TempDir(const std::string& prefix) {
            const char* base = std::getenv("TMPDIR");
            std::string tmpl = std::string(base && *base ? base : "/tmp") + "/" + prefix + "XXXXXX";
            std::vector<char> buf(tmpl.begin(), tmpl.end());
            buf.push_back('\0');
            if (::mkdtemp(buf.data())) path_ = buf.data();
        }
        ~TempDir() {
            if (path_.empty()) return;
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        bool ok() const { return !path_.empty(); }
        const std::string& path() const { return path_; }
        std::string sub(const std::string& rel) const { return path_ + "/" + rel; }

    private:
        std::string path_;
    };

    // Writes `text` to `path`, creating parent directories.
    inline bool write_text(const std::string& path, const std::string& text) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
        std::ofstream f(path, std::ios::trunc | std::ios::binary);
        if (!f.good()) return false;
        f << text;
        return f.good();
    }

    inline std::string read_text(const std::string& path) {
        std::ifstream f(path);
        std::string s((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return s;
    }

} // namespace test_support

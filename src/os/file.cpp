// src/os/file.cpp
#include <lcalc/os/File.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>


namespace lcalc {

    namespace fs = std::filesystem;

    namespace {

        using FileHandle = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

        void drop_bom_and_cr(std::string& s) {
            if (s.compare(0, 3, "\xEF\xBB\xBF") == 0) s.erase(0, 3);
            s.erase(std::remove(s.begin(), s.end(), '\r'), s.end());
        }

    } // namespace

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        FileHandle fp(std::fopen(path.c_str(), "rb"), &std::fclose);
        if (!fp) {
            out_error = "cannot open '" + path + "': " + std::strerror(errno);
            return false;
        }

        // 디렉터리 등은 fopen이 성공해도 크기를 믿을 수 없다
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            out_error = "cannot read '" + path + "': not a regular file";
            return false;
        }

        const auto sz = fs::file_size(path, ec);
        if (ec) {
            out_error = "cannot determine the size of '" + path + "': " + ec.message();
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        const size_t n = std::fread(out_content.data(), 1, out_content.size(), fp.get());
        if (n != out_content.size()) {
            out_error = "short read on '" + path + "'";
            out_content.clear();
            return false;
        }

        drop_bom_and_cr(out_content);
        return true;
    }

    std::string normalize_path(const std::string& path) {
        std::error_code ec;
        const fs::path p = fs::weakly_canonical(fs::path(path), ec);
        if (ec) return path;
        return p.string();
    }

} // namespace lcalc

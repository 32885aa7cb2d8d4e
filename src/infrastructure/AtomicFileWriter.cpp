/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace pioneer::infrastructure {

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned long> g_tempCounter{0};
}

bool AtomicFileWriter::Write(const fs::path& path, const std::string& content, std::string& error) {
    // Unique per operation: concurrent writers to different files never share a temp name.
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + "-" + std::to_string(g_tempCounter++) + ".tmp";

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            error = "cannot open temp file " + tempPath.string();
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "write failed for " + tempPath.string();
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        error = "rename to " + path.string() + " failed: " + ec.message();
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

bool AtomicFileWriter::Read(const fs::path& path, std::string& content) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    std::stringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return true;
}

} // namespace pioneer::infrastructure

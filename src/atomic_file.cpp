#include "atomic_file.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = boost::filesystem;

void write_file_atomically(const fs::path& path, const std::string& contents) {
    const fs::path tmp_path = path.parent_path() / ("." + path.filename().string() + ".tmp");
    {
        std::ofstream out(tmp_path.string(), std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Error opening temporary file for writing: " + tmp_path.string());
        }
        out << contents;
        out.flush();
        if (!out) {
            out.close();
            boost::system::error_code ignored;
            fs::remove(tmp_path, ignored);
            throw std::runtime_error("Error writing temporary file: " + tmp_path.string());
        }
    }

    boost::system::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        boost::system::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw std::runtime_error("Error renaming " + tmp_path.string() + " to " + path.string() + ": " + ec.message());
    }
}

std::string read_file(const fs::path& path) {
    boost::system::error_code ec;
    if (!fs::exists(path, ec)) return std::string();
    std::ifstream in(path.string(), std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Error opening file for reading: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void ensure_directory(const fs::path& dir) {
    boost::system::error_code ec;
    if (fs::is_directory(dir, ec)) return;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + dir.string() + " - " + ec.message());
    }
}

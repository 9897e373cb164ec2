#include "Filesystem.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace scanorch {

namespace fs = std::filesystem;

bool LocalFilesystem::createDirectories(const std::string& path, std::string& error) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        error = "create_directories(" + path + "): " + ec.message();
        return false;
    }
    return true;
}

bool LocalFilesystem::writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes,
                                std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "cannot open " + path + " for writing";
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        error = "short write to " + path;
        return false;
    }
    return true;
}

bool LocalFilesystem::writeText(const std::string& path, const std::string& text, std::string& error) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        error = "cannot open " + path + " for writing";
        return false;
    }
    out << text;
    if (!out) {
        error = "short write to " + path;
        return false;
    }
    return true;
}

bool LocalFilesystem::readFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "read error on " + path;
        return false;
    }
    return true;
}

bool LocalFilesystem::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFilesystem::remove(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::unique_ptr<std::ostream> LocalFilesystem::openOutput(const std::string& path, std::string& error) {
    auto out = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!*out) {
        error = "cannot open " + path + " for writing";
        return nullptr;
    }
    return out;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

std::string toFileUrl(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec) p = path;
    return "file://" + p.generic_string();
}

} // namespace scanorch

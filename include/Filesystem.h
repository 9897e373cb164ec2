#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace scanorch {

// File access used by the durable world-map tier and every artifact.
// Implementations must be safe to call from the background worker.
class Filesystem {
public:
    virtual ~Filesystem() = default;

    virtual bool createDirectories(const std::string& path, std::string& error) = 0;
    virtual bool writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes,
                           std::string& error) = 0;
    virtual bool writeText(const std::string& path, const std::string& text, std::string& error) = 0;
    virtual bool readFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& error) = 0;
    virtual bool exists(const std::string& path) const = 0;
    virtual bool remove(const std::string& path) = 0;

    // Binary, truncating, seekable. Null + error on failure.
    virtual std::unique_ptr<std::ostream> openOutput(const std::string& path, std::string& error) = 0;
};

class LocalFilesystem final : public Filesystem {
public:
    bool createDirectories(const std::string& path, std::string& error) override;
    bool writeFile(const std::string& path, const std::vector<std::uint8_t>& bytes,
                   std::string& error) override;
    bool writeText(const std::string& path, const std::string& text, std::string& error) override;
    bool readFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& error) override;
    bool exists(const std::string& path) const override;
    bool remove(const std::string& path) override;
    std::unique_ptr<std::ostream> openOutput(const std::string& path, std::string& error) override;
};

std::string joinPath(const std::string& dir, const std::string& name);

// "file://" + absolute path.
std::string toFileUrl(const std::string& path);

} // namespace scanorch

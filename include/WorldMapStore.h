#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "SessionTypes.h"

namespace spdlog { class logger; }

namespace scanorch {

class Filesystem;

// One storage provider for the world-map snapshot.
class WorldMapTier {
public:
    virtual ~WorldMapTier() = default;
    virtual const char* name() const = 0;
    virtual std::optional<WorldMapRecord> load() = 0;
    virtual bool store(const WorldMapRecord& record) = 0;
    virtual void clear() = 0;
};

class MemoryWorldMapTier final : public WorldMapTier {
public:
    const char* name() const override { return "memory"; }
    std::optional<WorldMapRecord> load() override { return record_; }
    bool store(const WorldMapRecord& record) override {
        record_ = record;
        return true;
    }
    void clear() override { record_.reset(); }

private:
    std::optional<WorldMapRecord> record_;
};

// ============================================================
// Durable tier: one binary file.
//
//   off  size  field
//   0    4     magic "SWMP"
//   4    4     version (u32, = 1)
//   8    4     anchor_count (i32)
//   12   8     saved_at_ms (i64)
//   20   8     snapshot size (u64)
//   28   4     crc32 of snapshot
//   32   n     snapshot bytes
//
// Host byte order. A file whose magic, version, size or CRC does not match is
// treated as absent.
// ============================================================
class FileWorldMapTier final : public WorldMapTier {
public:
    static constexpr std::uint32_t kVersion = 1;
    static constexpr std::size_t kHeaderBytes = 32;

    FileWorldMapTier(Filesystem& fs, std::string path, std::shared_ptr<spdlog::logger> log = nullptr);

    const char* name() const override { return "file"; }
    std::optional<WorldMapRecord> load() override;
    bool store(const WorldMapRecord& record) override;
    void clear() override;

    const std::string& path() const { return path_; }

    static std::vector<std::uint8_t> encode(const WorldMapRecord& record);
    static std::optional<WorldMapRecord> decode(const std::vector<std::uint8_t>& bytes, std::string& error);

private:
    Filesystem& fs_;
    std::string path_;
    std::shared_ptr<spdlog::logger> log_;
};

// ============================================================
// Process-scoped two-tier store, injected into the session.
// get() reads the volatile tier first, then the durable tier (promoting a
// durable hit into the volatile tier). put() writes both. Safe to call from
// the background worker.
// ============================================================
class WorldMapStore {
public:
    WorldMapStore(std::unique_ptr<WorldMapTier> volatile_tier, std::unique_ptr<WorldMapTier> durable_tier);

    std::optional<WorldMapRecord> get();

    // true if at least one tier accepted the record.
    bool put(const WorldMapRecord& record);

    // Clears the volatile tier; the durable tier only when asked.
    void clear(bool include_durable);

    bool hasVolatile();

private:
    std::mutex mutex_;
    std::unique_ptr<WorldMapTier> volatile_;
    std::unique_ptr<WorldMapTier> durable_;
};

} // namespace scanorch

#include "WorldMapStore.h"

#include "Checksum.h"
#include "Filesystem.h"

#include <cstring>

#include <spdlog/spdlog.h>

namespace scanorch {

namespace {

constexpr char kMagic[4] = {'S', 'W', 'M', 'P'};

template <typename T>
void putRaw(std::vector<std::uint8_t>& out, std::size_t off, T v) {
    std::memcpy(out.data() + off, &v, sizeof(T));
}

template <typename T>
T getRaw(const std::vector<std::uint8_t>& in, std::size_t off) {
    T v{};
    std::memcpy(&v, in.data() + off, sizeof(T));
    return v;
}

} // namespace

// ============================================================
// FileWorldMapTier
// ============================================================

FileWorldMapTier::FileWorldMapTier(Filesystem& fs, std::string path, std::shared_ptr<spdlog::logger> log)
    : fs_(fs), path_(std::move(path)), log_(std::move(log)) {}

std::vector<std::uint8_t> FileWorldMapTier::encode(const WorldMapRecord& record) {
    std::vector<std::uint8_t> out(kHeaderBytes + record.snapshot.size());
    std::memcpy(out.data(), kMagic, sizeof(kMagic));
    putRaw<std::uint32_t>(out, 4, kVersion);
    putRaw<std::int32_t>(out, 8, record.anchor_count);
    putRaw<std::int64_t>(out, 12, record.saved_at_ms);
    putRaw<std::uint64_t>(out, 20, static_cast<std::uint64_t>(record.snapshot.size()));
    putRaw<std::uint32_t>(out, 28, crc32_update(0u, record.snapshot.data(), record.snapshot.size()));
    if (!record.snapshot.empty()) {
        std::memcpy(out.data() + kHeaderBytes, record.snapshot.data(), record.snapshot.size());
    }
    return out;
}

std::optional<WorldMapRecord> FileWorldMapTier::decode(const std::vector<std::uint8_t>& bytes,
                                                       std::string& error) {
    if (bytes.size() < kHeaderBytes) {
        error = "truncated header";
        return std::nullopt;
    }
    if (std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
        error = "bad magic";
        return std::nullopt;
    }
    if (getRaw<std::uint32_t>(bytes, 4) != kVersion) {
        error = "unsupported version";
        return std::nullopt;
    }
    const auto size = getRaw<std::uint64_t>(bytes, 20);
    if (size != bytes.size() - kHeaderBytes) {
        error = "size mismatch";
        return std::nullopt;
    }

    WorldMapRecord record;
    record.anchor_count = getRaw<std::int32_t>(bytes, 8);
    record.saved_at_ms = getRaw<std::int64_t>(bytes, 12);
    record.snapshot.assign(bytes.begin() + kHeaderBytes, bytes.end());

    if (crc32_update(0u, record.snapshot.data(), record.snapshot.size()) != getRaw<std::uint32_t>(bytes, 28)) {
        error = "crc mismatch";
        return std::nullopt;
    }
    return record;
}

std::optional<WorldMapRecord> FileWorldMapTier::load() {
    if (!fs_.exists(path_)) return std::nullopt;

    std::vector<std::uint8_t> bytes;
    std::string error;
    if (!fs_.readFile(path_, bytes, error)) {
        if (log_) log_->warn("world map: {}", error);
        return std::nullopt;
    }
    auto record = decode(bytes, error);
    if (!record && log_) {
        log_->warn("world map: rejecting {} ({})", path_, error);
    }
    return record;
}

bool FileWorldMapTier::store(const WorldMapRecord& record) {
    std::string error;
    if (!fs_.writeFile(path_, encode(record), error)) {
        if (log_) log_->warn("world map: {}", error);
        return false;
    }
    return true;
}

void FileWorldMapTier::clear() {
    fs_.remove(path_);
}

// ============================================================
// WorldMapStore
// ============================================================

WorldMapStore::WorldMapStore(std::unique_ptr<WorldMapTier> volatile_tier,
                             std::unique_ptr<WorldMapTier> durable_tier)
    : volatile_(std::move(volatile_tier)), durable_(std::move(durable_tier)) {}

std::optional<WorldMapRecord> WorldMapStore::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (volatile_) {
        if (auto hit = volatile_->load()) return hit;
    }
    if (durable_) {
        if (auto hit = durable_->load()) {
            if (volatile_) volatile_->store(*hit);
            return hit;
        }
    }
    return std::nullopt;
}

bool WorldMapStore::put(const WorldMapRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool stored = false;
    if (volatile_) stored = volatile_->store(record) || stored;
    if (durable_) stored = durable_->store(record) || stored;
    return stored;
}

void WorldMapStore::clear(bool include_durable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (volatile_) volatile_->clear();
    if (include_durable && durable_) durable_->clear();
}

bool WorldMapStore::hasVolatile() {
    std::lock_guard<std::mutex> lock(mutex_);
    return volatile_ && volatile_->load().has_value();
}

} // namespace scanorch

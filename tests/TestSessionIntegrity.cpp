#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "EventLoop.h"
#include "Filesystem.h"
#include "Log.h"
#include "MediaEncoding.h"
#include "ScanSession.h"
#include "SessionConfig.h"
#include "TriggerDedup.h"
#include "WorldMapStore.h"

#include "../world/simulated_rig.h"

using namespace scanorch;

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

constexpr double kDt = 0.05;

static std::string makeTempDir(const std::string& tag) {
    namespace fs = std::filesystem;
    const fs::path p = fs::temp_directory_path() / ("scanorch_test_" + tag);
    std::error_code ec;
    fs::remove_all(p, ec);
    fs::create_directories(p, ec);
    return p.string();
}

static bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

static std::vector<std::uint8_t> readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

template <typename T>
static T readAt(const std::vector<std::uint8_t>& bytes, std::size_t off) {
    T v{};
    std::memcpy(&v, bytes.data() + off, sizeof(T));
    return v;
}

// ------------------------------------------------------------
// Event stream helpers
// ------------------------------------------------------------

template <typename T>
static int countEvents(const std::vector<SessionEvent>& evs, std::size_t from = 0) {
    int n = 0;
    for (std::size_t i = from; i < evs.size(); ++i) {
        if (std::holds_alternative<T>(evs[i])) ++n;
    }
    return n;
}

static int countStatus(const std::vector<SessionEvent>& evs, StatusKind kind, std::size_t from = 0) {
    int n = 0;
    for (std::size_t i = from; i < evs.size(); ++i) {
        const auto* s = std::get_if<StatusEvent>(&evs[i]);
        if (s && s->kind == kind) ++n;
    }
    return n;
}

static int countAudioStatus(const std::vector<SessionEvent>& evs, AudioStatus status) {
    int n = 0;
    for (const auto& e : evs) {
        const auto* a = std::get_if<AudioEvent>(&e);
        if (a && a->status == status) ++n;
    }
    return n;
}

template <typename T>
static const T* lastEvent(const std::vector<SessionEvent>& evs) {
    for (std::size_t i = evs.size(); i > 0; --i) {
        if (const auto* e = std::get_if<T>(&evs[i - 1])) return e;
    }
    return nullptr;
}

template <typename T>
static int firstIndex(const std::vector<SessionEvent>& evs, std::size_t from = 0) {
    for (std::size_t i = from; i < evs.size(); ++i) {
        if (std::holds_alternative<T>(evs[i])) return static_cast<int>(i);
    }
    return -1;
}

static const StatusEvent* lastError(const std::vector<SessionEvent>& evs) {
    for (std::size_t i = evs.size(); i > 0; --i) {
        const auto* s = std::get_if<StatusEvent>(&evs[i - 1]);
        if (s && s->kind == StatusKind::Error) return s;
    }
    return nullptr;
}

// ------------------------------------------------------------
// One session wired to the simulated rig, on a private temp directory.
// ------------------------------------------------------------
struct Harness {
    explicit Harness(const std::string& tag, SessionConfigV1 base = SessionConfigV1{})
        : dir(makeTempDir(tag)),
          rig(loop),
          maps(std::make_unique<MemoryWorldMapTier>(),
               std::make_unique<FileWorldMapTier>(fs, dir + "/worldmap.bin", makeNullLogger())) {
        base.export_dir = dir + "/Export";
        base.world_map_file = dir + "/worldmap.bin";
        cfg = base;

        SessionDeps deps{loop, bg, rig.capture, rig.rooms, rig.structures, rig.tracking,
                         rig.audio, rig.permissions, fs, maps};
        session = std::make_unique<ScanSession>(deps, cfg, makeNullLogger());
        session->setListener([this](const SessionEvent& e) { events.push_back(e); });
        session->photoController().setClock([this] { return loop.nowMs(); });
    }

    ~Harness() {
        session.reset();
        bg.waitForCompletion();
        loop.drain();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    // Runs posted work and background work until both are quiet.
    void pump() {
        for (;;) {
            bg.waitForCompletion();
            if (loop.drain() == 0) return;
        }
    }

    void advance(double seconds) {
        const long steps = std::lround(seconds / kDt);
        for (long i = 0; i < steps; ++i) {
            loop.step(kDt);
            pump();
        }
    }

    void submit(Command c) {
        session->submit(std::move(c));
        pump();
    }

    void trigger(const TriggerSnapshot& s) {
        session->applyTriggers(s);
        pump();
    }

    template <typename S>
    bool in() const { return std::holds_alternative<S>(session->state()); }

    std::string exportPath(const std::string& file) const { return dir + "/Export/" + file; }

    std::string dir;
    SessionConfigV1 cfg;
    EventLoop loop;
    BackgroundTask bg;
    LocalFilesystem fs;
    world::SimulatedRig rig;
    WorldMapStore maps;
    std::unique_ptr<ScanSession> session;
    std::vector<SessionEvent> events;
};

// Start, let room 1 accumulate frames, then stop it with AddRoom and wait for the build.
static void captureFirstRoom(Harness& h) {
    h.submit(cmd::Start{});
    h.advance(1.0);
    h.submit(cmd::AddRoom{});
    h.advance(1.0);
    REQUIRE(h.session->roomCount() == 1, "first room did not build");
}

// Start, capture for a second, Pause and wait for room + snapshot.
static void pauseWithMap(Harness& h) {
    h.submit(cmd::Start{});
    h.advance(1.0);
    h.submit(cmd::Pause{});
    h.advance(1.5);
    REQUIRE(h.in<state::Paused>(), "not Paused after Pause");
}

} // namespace

// =======================
// Primitives
// =======================

static void runEventLoopOrdering() {
    EventLoop loop;
    std::vector<int> order;

    TimerHandle a = loop.schedule(0.3, [&] { order.push_back(3); });
    TimerHandle b = loop.schedule(0.1, [&] { order.push_back(1); });
    TimerHandle c = loop.schedule(0.2, [&] { order.push_back(2); });
    TimerHandle d = loop.schedule(0.2, [&] { order.push_back(99); });
    d.cancel();
    {
        TimerHandle dropped = loop.schedule(0.1, [&] { order.push_back(98); });
    }

    loop.step(0.5);
    REQUIRE(order.size() == 3, "expected exactly three timers to fire");
    REQUIRE(order[0] == 1 && order[1] == 2 && order[2] == 3, "timers fired out of deadline order");
    REQUIRE(!a.armed() && !b.armed(), "fired one-shot timers still armed");

    int ticks = 0;
    TimerHandle r = loop.scheduleRepeating(0.1, [&] { ++ticks; });
    loop.step(1.05);
    REQUIRE(ticks == 10, "repeating timer tick count");
    r.cancel();
    loop.step(1.0);
    REQUIRE(ticks == 10, "cancelled repeating timer kept firing");

    REQUIRE(!loop.scheduleRepeating(0.0, [] {}).armed(), "zero period accepted");

    const double t0 = loop.now_s();
    loop.step(-1.0);
    loop.step(std::nan(""));
    REQUIRE(loop.now_s() == t0, "invalid dt advanced the clock");

    std::atomic<int> posted{0};
    std::thread producer([&] {
        for (int i = 0; i < 5; ++i) loop.post([&] { ++posted; });
    });
    producer.join();
    REQUIRE(loop.drain() == 5, "cross-thread posts not drained");
    REQUIRE(posted.load() == 5, "posted tasks did not run");

    std::cout << "[PASS] event loop: deadline order, cancel, repeat, invalid dt, cross-thread post\n";
}

static void runBackgroundTaskCompletion() {
    std::atomic<int> done{0};
    BackgroundTask bg;
    for (int i = 0; i < 100; ++i) bg.schedule([&] { ++done; });
    bg.waitForCompletion();
    REQUIRE(done.load() == 100, "waitForCompletion returned early");
    std::cout << "[PASS] background task runs everything before waitForCompletion returns\n";
}

static void runTriggerDedup() {
    REQUIRE(!shouldFire(std::nullopt, std::nullopt), "absent token fired");
    REQUIRE(shouldFire(std::nullopt, 1.0), "first token did not fire");
    REQUIRE(!shouldFire(1.0, 1.0), "repeated token fired");
    REQUIRE(shouldFire(1.0, 2.0), "new token did not fire");
    REQUIRE(!shouldFire(2.0, std::nullopt), "cleared token fired");

    TriggerDedup dedup;
    int fired = 0;
    for (int i = 0; i < 5; ++i) {
        if (dedup.accept(TriggerChannel::Export, 7.0)) ++fired;
    }
    REQUIRE(fired == 1, "same token fired more than once");
    REQUIRE(dedup.last(TriggerChannel::Export) == 7.0, "last token not recorded");
    REQUIRE(!dedup.last(TriggerChannel::Finish).has_value(), "channels not independent");

    // Re-entrant delivery of the same snapshot from inside the bound action.
    std::vector<std::string> names;
    TriggerSnapshot snap;
    snap.finish = 1.0;
    TriggerInputs* self = nullptr;
    int depth = 0;
    TriggerInputs inputs([&](const Command& c) {
        names.push_back(commandName(c));
        if (std::holds_alternative<cmd::Finish>(c) && self && depth == 0) {
            ++depth;
            self->apply(snap);
            --depth;
        }
    });
    self = &inputs;
    inputs.apply(snap);
    REQUIRE(names.size() == 1, "re-entrant delivery fired twice");
    self = nullptr;

    // Booleans fire on change only; an initial false does nothing.
    names.clear();
    TriggerSnapshot b;
    b.running = false;
    inputs.apply(b);
    REQUIRE(names.empty(), "initial running=false emitted a command");
    b.running = true;
    inputs.apply(b);
    inputs.apply(b);
    b.running = false;
    inputs.apply(b);
    REQUIRE(names.size() == 2 && names[0] == "Start" && names[1] == "Cancel", "running edge detection");

    // Dispatch order within one snapshot.
    inputs.forgetBooleans();
    names.clear();
    TriggerSnapshot all;
    all.running = true;
    all.audio_running = true;
    all.finish = 2.0;
    all.add_room = 1.0;
    all.export_scan = 1.0;
    all.capture_photo = 1.0;
    all.pause = 1.0;
    all.resume = 1.0;
    inputs.apply(all);
    const std::vector<std::string> expected = {"Start", "StartAudio", "Finish", "AddRoom",
                                               "Export", "CapturePhoto", "Pause", "Resume"};
    REQUIRE(names == expected, "trigger dispatch order");

    std::cout << "[PASS] trigger dedup: pure edge test, re-entrancy, boolean edges, dispatch order\n";
}

static void runWorldMapStoreTiers() {
    const std::string dir = makeTempDir("worldmap");
    const std::string path = dir + "/map.bin";
    LocalFilesystem fs;

    WorldMapRecord rec;
    rec.anchor_count = 9;
    rec.saved_at_ms = 123456;
    rec.snapshot = {1, 2, 3, 4, 5, 6, 7, 8};

    {
        WorldMapStore store(std::make_unique<MemoryWorldMapTier>(),
                            std::make_unique<FileWorldMapTier>(fs, path));
        REQUIRE(!store.get().has_value(), "empty store returned a map");
        REQUIRE(store.put(rec), "put failed");
        REQUIRE(store.hasVolatile(), "volatile tier not written");
        REQUIRE(fileExists(path), "durable tier not written");

        store.clear(false);
        REQUIRE(!store.hasVolatile(), "volatile tier survived clear");
        auto hit = store.get();
        REQUIRE(hit && hit->anchor_count == 9 && hit->snapshot == rec.snapshot, "durable fallback");
        REQUIRE(store.hasVolatile(), "durable hit not promoted");
    }

    {
        // A new process sees the durable copy.
        WorldMapStore store(std::make_unique<MemoryWorldMapTier>(),
                            std::make_unique<FileWorldMapTier>(fs, path));
        auto hit = store.get();
        REQUIRE(hit && hit->saved_at_ms == 123456, "durable map lost across store instances");
        store.clear(true);
        REQUIRE(!fileExists(path), "durable clear left the file behind");
        REQUIRE(!store.get().has_value(), "map survived full clear");
    }

    std::string error;
    auto bytes = FileWorldMapTier::encode(rec);
    REQUIRE(bytes.size() == FileWorldMapTier::kHeaderBytes + rec.snapshot.size(), "encoded size");
    REQUIRE(FileWorldMapTier::decode(bytes, error).has_value(), "clean decode failed");

    auto corrupt = bytes;
    corrupt.back() ^= 0xFFu;
    REQUIRE(!FileWorldMapTier::decode(corrupt, error) && error == "crc mismatch", "crc not checked");

    auto magic = bytes;
    magic[0] = 'X';
    REQUIRE(!FileWorldMapTier::decode(magic, error) && error == "bad magic", "magic not checked");

    std::vector<std::uint8_t> shortBytes(bytes.begin(), bytes.begin() + 10);
    REQUIRE(!FileWorldMapTier::decode(shortBytes, error) && error == "truncated header", "truncation");

    auto longer = bytes;
    longer.push_back(0);
    REQUIRE(!FileWorldMapTier::decode(longer, error) && error == "size mismatch", "size not checked");

    REQUIRE(fs.writeFile(path, corrupt, error), "writing corrupt file");
    FileWorldMapTier tier(fs, path);
    REQUIRE(!tier.load().has_value(), "corrupt durable file accepted");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "[PASS] world map store: volatile first, durable fallback + promotion, CRC rejection\n";
}

static void runWavHeader() {
    const std::string dir = makeTempDir("wav");
    const std::string path = dir + "/t.wav";
    LocalFilesystem fs;
    std::string error;

    auto out = fs.openOutput(path, error);
    REQUIRE(out != nullptr, "openOutput failed: " << error);
    WavWriter wav(std::move(out), 16000, 1);
    REQUIRE(wav.ok(), "writer not ok after open");
    REQUIRE(wav.append(std::vector<std::int16_t>(100, 1000)), "append 1");
    REQUIRE(wav.append(std::vector<std::int16_t>(60, -1000)), "append 2");
    REQUIRE(wav.dataBytes() == 320, "data byte count");
    REQUIRE(wav.finalize(), "finalize failed");
    REQUIRE(!wav.append(std::vector<std::int16_t>(10, 0)), "append after finalize accepted");

    const auto bytes = readAll(path);
    REQUIRE(bytes.size() == WavWriter::kHeaderBytes + 320, "file size");
    REQUIRE(std::memcmp(bytes.data(), "RIFF", 4) == 0, "RIFF tag");
    REQUIRE(std::memcmp(bytes.data() + 8, "WAVE", 4) == 0, "WAVE tag");
    REQUIRE(std::memcmp(bytes.data() + 36, "data", 4) == 0, "data tag");
    REQUIRE(readAt<std::uint32_t>(bytes, 4) == 36u + 320u, "RIFF size not patched");
    REQUIRE(readAt<std::uint32_t>(bytes, 40) == 320u, "data size not patched");
    REQUIRE(readAt<std::uint16_t>(bytes, 22) == 1u, "channel count");
    REQUIRE(readAt<std::uint32_t>(bytes, 24) == 16000u, "sample rate");
    REQUIRE(readAt<std::uint32_t>(bytes, 28) == 32000u, "byte rate");
    REQUIRE(readAt<std::int16_t>(bytes, 44) == 1000, "first sample");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "[PASS] WAV header sizes patched on finalize\n";
}

static void runYCbCrConversion() {
    RgbImage img;

    Frame gray = world::makeSolidFrame(4, 4, 128, 128, 128);
    REQUIRE(convertYCbCr420ToRgb(gray, img), "gray conversion failed");
    REQUIRE(img.width == 4 && img.height == 4 && img.rgb.size() == 48, "image dimensions");
    REQUIRE(img.rgb[0] == 128 && img.rgb[1] == 128 && img.rgb[2] == 128, "mid gray");

    Frame red = world::makeSolidFrame(2, 2, 76, 85, 255);
    REQUIRE(convertYCbCr420ToRgb(red, img), "red conversion failed");
    REQUIRE(img.rgb[0] >= 250 && img.rgb[1] <= 2 && img.rgb[2] <= 2, "red maps to red");

    Frame white = world::makeSolidFrame(2, 2, 255, 128, 128);
    REQUIRE(convertYCbCr420ToRgb(white, img), "white conversion failed");
    REQUIRE(img.rgb[0] == 255 && img.rgb[1] == 255 && img.rgb[2] == 255, "white");

    Frame broken = world::makeSolidFrame(4, 4, 10, 10, 10);
    broken.chroma.resize(3);
    RgbImage untouched;
    REQUIRE(!convertYCbCr420ToRgb(broken, untouched), "mismatched planes accepted");
    REQUIRE(untouched.rgb.empty(), "output touched on failure");

    REQUIRE(convertYCbCr420ToRgb(gray, img), "gray again");
    const auto ppm = encodePpm(img);
    const std::string header = "P6\n4 4\n255\n";
    REQUIRE(ppm.size() == header.size() + 48, "ppm size");
    REQUIRE(std::string(ppm.begin(), ppm.begin() + header.size()) == header, "ppm header");

    std::cout << "[PASS] YCbCr 4:2:0 -> RGB on known colors, PPM encoding\n";
}

static void runConfigHashAndJson() {
    SessionConfigV1 a;
    SessionConfigV1 b;
    REQUIRE(computeConfigHash(a) == computeConfigHash(b), "hash not deterministic");
    b.scan_name = "Kitchen";
    REQUIRE(computeConfigHash(a) != computeConfigHash(b), "hash ignores scan_name");

    SessionConfigV1 bad;
    bad.audio_sample_rate_hz = 5;
    bad.relocalization_timeout_s = -1.0;
    bad.scan_name.clear();
    REQUIRE(sanitizeConfig(bad) == 3, "sanitize fix count");
    REQUIRE(bad.audio_sample_rate_hz == 16000 && bad.scan_name == "Room", "sanitize defaults");
    REQUIRE(bad.fnv_hash_u32 == computeConfigHash(bad), "sanitize did not refresh hash");

    const int need = exportConfigText(a, nullptr, 0);
    REQUIRE(need > 0, "exportConfigText size query");
    std::vector<char> buf(static_cast<std::size_t>(need) + 1);
    REQUIRE(exportConfigText(a, buf.data(), static_cast<int>(buf.size())) == need, "exportConfigText length");
    REQUIRE(std::string(buf.data()).find("scan_name=Room\n") != std::string::npos, "config text content");

    const std::string dir = makeTempDir("config");
    const std::string path = dir + "/session.json";
    {
        std::ofstream out(path);
        out << R"({"scan_name": "Kitchen", "export_type": "MESH", "audio_chunk_frames": "big",
                  "finish_policy": "complete", "auto_photo_interval_s": 2.5, "unknown_key": 1})";
    }
    SessionConfigV1 cfg;
    std::string error;
    REQUIRE(loadSessionConfig(path, cfg, error), "load failed: " << error);
    REQUIRE(cfg.scan_name == "Kitchen", "scan_name");
    REQUIRE(exportModeOf(cfg) == ExportMode::Mesh, "export_type mapping");
    REQUIRE(cfg.audio_chunk_frames == 4096, "wrongly typed key not skipped");
    REQUIRE(cfg.finish_policy == FinishPolicy::Complete, "finish_policy");
    REQUIRE(cfg.auto_photo_interval_s == 2.5, "interval");
    REQUIRE(cfg.fnv_hash_u32 == computeConfigHash(cfg), "loaded hash");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    SessionConfigV1 keep;
    keep.scan_name = "Keep";
    REQUIRE(!loadSessionConfig(path, keep, error), "malformed JSON accepted");
    REQUIRE(keep.scan_name == "Keep", "cfg modified on parse failure");

    {
        std::ofstream out(path);
        out << "[1, 2, 3]";
    }
    REQUIRE(!loadSessionConfig(path, keep, error), "non-object root accepted");
    REQUIRE(!loadSessionConfig(dir + "/missing.json", keep, error), "missing file accepted");

    REQUIRE(exportModeFromString("MODEL") == ExportMode::Model, "MODEL");
    REQUIRE(exportModeFromString("whatever") == ExportMode::Parametric, "fallback parametric");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "[PASS] config: hash stability, sanitize, text export, JSON load\n";
}

// =======================
// Session scenarios
// =======================

static void runScenarioFinishExports() {
    Harness h("scenario_a");
    h.submit(cmd::Start{});
    REQUIRE(h.in<state::Running>(), "Start did not enter Running");
    REQUIRE(h.rig.capture.isRunning(), "capture engine not running");
    REQUIRE(h.rig.tracking.lastRunConfig().reset_tracking, "tracking not reset on Start");

    h.advance(1.0);
    h.submit(cmd::Finish{});
    REQUIRE(h.in<state::FinishPending>(), "Finish did not enter FinishPending");
    REQUIRE(h.rig.capture.lastStopKeptTracking(), "Finish stopped tracking");

    h.advance(2.5);
    const int preview = firstIndex<PreviewEvent>(h.events);
    const int exported = firstIndex<ExportedEvent>(h.events);
    REQUIRE(preview >= 0 && exported > preview, "Preview must precede Exported");
    REQUIRE(countEvents<ExportedEvent>(h.events) == 1, "exactly one export");

    const auto* ex = lastEvent<ExportedEvent>(h.events);
    REQUIRE(ex->room_count == 1, "export room count");
    REQUIRE(ex->result.scan_url && *ex->result.scan_url == toFileUrl(h.exportPath("Room.usdz")), "scan url");
    REQUIRE(ex->result.json_url && *ex->result.json_url == toFileUrl(h.exportPath("Room.json")), "json url");
    REQUIRE(fileExists(h.exportPath("Room.usdz")) && fileExists(h.exportPath("Room.json")), "artifacts");

    REQUIRE(h.in<state::Paused>(), "finish policy pause should leave the session Paused");
    const auto* paused = lastEvent<PausedEvent>(h.events);
    REQUIRE(paused && paused->world_map_saved, "Paused without a saved map");
    REQUIRE(fileExists(h.dir + "/worldmap.bin"), "durable map not written");
    REQUIRE(countStatus(h.events, StatusKind::Error) == 0, "unexpected error");

    std::cout << "[PASS] scenario A: Start -> Finish -> Preview -> Exported{scanUrl, jsonUrl}\n";
}

static void runScenarioExportBeforeReady() {
    Harness h("scenario_b");
    h.submit(cmd::Start{});
    h.submit(cmd::Export{});
    REQUIRE(h.session->pendingExport(), "Export with zero rooms not queued");
    REQUIRE(h.events.empty(), "Export with zero rooms emitted an event");

    h.advance(1.0);
    h.submit(cmd::Finish{});
    h.advance(3.0);
    REQUIRE(countEvents<PreviewEvent>(h.events) == 1, "one preview");
    REQUIRE(countEvents<ExportedEvent>(h.events) == 1, "queued export fired twice");
    REQUIRE(!h.session->pendingExport(), "pending export not consumed");
    REQUIRE(countStatus(h.events, StatusKind::Error) == 0, "queued export produced an error");
    REQUIRE(h.rig.structures.merges() == 1, "merge count");

    std::cout << "[PASS] scenario B: Export before any room -> Finish -> exactly one Exported\n";
}

static void runQueuedExportFiresOnFirstRoom() {
    Harness h("queued_export");
    h.submit(cmd::Start{});
    h.advance(1.0);
    h.submit(cmd::Export{});
    REQUIRE(h.events.empty(), "queued export emitted");
    h.submit(cmd::Pause{});
    h.advance(2.0);

    REQUIRE(countEvents<ExportedEvent>(h.events) == 1, "queued export did not fire once");
    REQUIRE(h.in<state::Paused>(), "export did not return to Paused");
    h.advance(3.0);
    REQUIRE(countEvents<ExportedEvent>(h.events) == 1, "queued export fired again");

    std::cout << "[PASS] queued export fires exactly once when the first room arrives\n";
}

static void runScenarioPauseResumeMultiRoom() {
    Harness h("scenario_c");
    h.submit(cmd::Start{});
    h.advance(1.0);
    h.submit(cmd::Finish{});
    h.advance(2.5);
    REQUIRE(h.in<state::Paused>(), "not Paused after Finish");
    REQUIRE(countEvents<ExportedEvent>(h.events) == 1, "first finish export");

    h.submit(cmd::Pause{});
    REQUIRE(h.in<state::Paused>(), "Pause while Paused changed state");

    const std::size_t mark = h.events.size();
    h.submit(cmd::Resume{});
    REQUIRE(h.in<state::Relocalizing>(), "Resume with a map did not relocalize");
    REQUIRE(countStatus(h.events, StatusKind::Relocalizing, mark) == 1, "relocalizing status");
    REQUIRE(h.rig.tracking.lastRunConfig().initial_world_map.has_value(), "tracking not given the map");

    h.advance(1.5);
    REQUIRE(countStatus(h.events, StatusKind::Relocated, mark) == 1, "relocated status");
    REQUIRE(h.in<state::Running>(), "not Running after relocation");
    const auto* resumed = lastEvent<ResumedEvent>(h.events);
    REQUIRE(resumed && resumed->relocalized, "Resumed{relocalized}");
    REQUIRE(h.session->roomCount() == 1, "rooms lost across pause/resume");
    REQUIRE(!h.maps.get().has_value(), "map not consumed by relocation");

    h.advance(1.0);
    h.submit(cmd::AddRoom{});
    h.submit(cmd::Finish{});
    h.advance(3.0);

    REQUIRE(countEvents<ExportedEvent>(h.events) == 2, "second export");
    const auto* ex = lastEvent<ExportedEvent>(h.events);
    REQUIRE(ex->room_count == 2, "merged room count");
    REQUIRE(h.rig.structures.lastMergedRooms() == 2, "structure merged from two rooms");
    REQUIRE(h.session->rooms()[1].sequence == 2, "room sequence numbering");

    std::ifstream in(h.exportPath("Room.json"));
    const nlohmann::json doc = nlohmann::json::parse(in);
    REQUIRE(doc.at("room_count").get<int>() == 2, "JSON room_count");

    std::cout << "[PASS] scenario C: Finish -> Resume -> relocated -> AddRoom -> Finish merges 2 rooms\n";
}

static void runScenarioPhotos() {
    Harness h("scenario_d");
    h.submit(cmd::Start{});
    h.advance(0.5);

    TriggerSnapshot s;
    for (double token : {1.0, 2.0, 2.0, 3.0, 3.0}) {
        s.capture_photo = token;
        h.trigger(s);
    }
    REQUIRE(countEvents<PhotoEvent>(h.events) == 3, "photo count");
    for (const auto& e : h.events) {
        if (const auto* p = std::get_if<PhotoEvent>(&e)) {
            REQUIRE(!p->error && !p->url.empty(), "photo event without url");
        }
    }
    REQUIRE(h.session->photos().size() == 3, "photo artifacts");

    h.advance(0.5);
    h.submit(cmd::Finish{});
    h.advance(2.5);
    const auto* ex = lastEvent<ExportedEvent>(h.events);
    REQUIRE(ex && ex->result.photo_urls.size() == 3, "Exported.photoUrls");
    for (const auto& p : h.session->photos()) {
        const std::string path = p.file_url.substr(std::string("file://").size());
        REQUIRE(fileExists(path), "photo file missing: " << path);
    }

    std::cout << "[PASS] scenario D: three distinct photo tokens -> 3 Photo events, 3 photoUrls\n";
}

static void runTriggerTokensDriveSession() {
    Harness h("session_triggers");
    TriggerSnapshot s;
    s.running = true;
    h.trigger(s);
    REQUIRE(h.in<state::Running>(), "running=true did not Start");

    h.advance(1.0);
    s.finish = 7.0;
    h.trigger(s);
    h.trigger(s);
    h.advance(2.5);
    h.trigger(s);
    REQUIRE(countEvents<PreviewEvent>(h.events) == 1, "repeated finish token fired again");
    REQUIRE(countEvents<ExportedEvent>(h.events) == 1, "repeated finish token exported again");

    // Reset forgets the running edge but not the consumed finish token.
    h.submit(cmd::Reset{false});
    REQUIRE(h.in<state::Idle>(), "Reset did not return to Idle");
    REQUIRE(h.session->triggers().dedup().last(TriggerChannel::Finish) == 7.0, "Reset dropped finish token");
    h.trigger(s);
    REQUIRE(h.in<state::Running>(), "running=true after Reset did not Start");
    h.advance(1.0);
    h.trigger(s);
    REQUIRE(h.in<state::Running>(), "finish token from before Reset fired again");
    REQUIRE(countEvents<PreviewEvent>(h.events) == 1, "old finish token produced a second Preview");

    s.finish = 8.0;
    h.trigger(s);
    REQUIRE(h.in<state::FinishPending>() || h.in<state::Paused>(), "new finish token after Reset ignored");

    std::cout << "[PASS] session triggers: repeated token acts once, even across Reset\n";
}

static void runAddRoomMonotonic() {
    Harness h("add_room");
    h.submit(cmd::Start{});
    std::size_t last = 0;
    for (int i = 0; i < 3; ++i) {
        h.advance(1.0);
        h.submit(cmd::AddRoom{});
        REQUIRE(h.session->roomCount() >= last, "AddRoom decreased rooms");
        last = h.session->roomCount();
    }
    h.advance(1.0);
    REQUIRE(h.session->roomCount() == 3, "three AddRooms -> three rooms");
    REQUIRE(h.in<state::Running>(), "AddRoom left Running");
    REQUIRE(countStatus(h.events, StatusKind::OK) == 3, "Status OK per room build");

    // Back to back: the second capture saw no frames and adds nothing.
    h.submit(cmd::AddRoom{});
    h.submit(cmd::AddRoom{});
    h.advance(1.0);
    REQUIRE(h.session->roomCount() == 4, "empty capture changed the room count");

    std::cout << "[PASS] AddRoom never decreases accumulated rooms\n";
}

static void runResumeWithoutMap() {
    Harness h("no_map");
    h.rig.tracking.failNextSnapshot("not enough features");
    pauseWithMap(h);
    const auto* paused = lastEvent<PausedEvent>(h.events);
    REQUIRE(paused && !paused->world_map_saved, "snapshot failure reported as saved");

    const std::size_t mark = h.events.size();
    h.submit(cmd::Resume{});
    REQUIRE(countStatus(h.events, StatusKind::NoWorldMap, mark) == 1, "no_worldmap status");
    REQUIRE(countEvents<RelocalizationStatusEvent>(h.events, mark) == 0, "relocalization attempted");
    REQUIRE(h.in<state::Running>(), "fresh capture not started");
    REQUIRE(h.rig.capture.isRunning(), "capture engine idle after resume");
    const auto* resumed = lastEvent<ResumedEvent>(h.events);
    REQUIRE(resumed && !resumed->relocalized, "Resumed{fresh}");
    REQUIRE(h.session->roomCount() == 1, "rooms lost");

    std::cout << "[PASS] Resume with no stored map -> no_worldmap + fresh capture\n";
}

static void runRelocalizationTimeout() {
    Harness h("reloc_timeout");
    h.rig.tracking.setRelocalizeScript(world::SimTrackingSession::RelocalizeScript::Never);
    pauseWithMap(h);

    h.submit(cmd::Resume{});
    REQUIRE(h.in<state::Relocalizing>(), "not Relocalizing");
    h.submit(cmd::Resume{});
    REQUIRE(h.session->relocalization().attempt() == 1, "second Resume started another attempt");

    h.advance(5.0);
    REQUIRE(h.in<state::Relocalizing>(), "gave up before the timeout");
    h.advance(1.5);
    REQUIRE(countStatus(h.events, StatusKind::RelocalizationTimeout) == 1, "timeout status");
    REQUIRE(h.in<state::Running>(), "fresh capture not started after timeout");
    REQUIRE(!h.maps.get().has_value(), "map not cleared after timeout");
    REQUIRE(!fileExists(h.dir + "/worldmap.bin"), "durable map not cleared after timeout");
    REQUIRE(!h.rig.tracking.lastRunConfig().initial_world_map.has_value(), "fresh tracking run expected");
    const auto* resumed = lastEvent<ResumedEvent>(h.events);
    REQUIRE(resumed && !resumed->relocalized, "Resumed{fresh} after timeout");

    std::cout << "[PASS] relocalization timeout -> relocalization_timeout, map cleared, fresh capture\n";
}

static void runStaleTimeoutIgnored() {
    Harness h("reloc_stale");
    pauseWithMap(h);
    h.submit(cmd::Resume{});
    h.advance(1.5);
    REQUIRE(countStatus(h.events, StatusKind::Relocated) == 1, "not relocated");
    h.advance(7.0);
    REQUIRE(countStatus(h.events, StatusKind::RelocalizationTimeout) == 0, "stale timeout fired");
    REQUIRE(countEvents<ResumedEvent>(h.events) == 1, "resumed twice");
    REQUIRE(h.in<state::Running>(), "left Running");

    std::cout << "[PASS] relocalization timeout after success is a no-op\n";
}

static void runTrackingUnavailable() {
    Harness h("reloc_unavailable");
    h.rig.tracking.setRelocalizeScript(world::SimTrackingSession::RelocalizeScript::Unavailable);
    pauseWithMap(h);
    h.submit(cmd::Resume{});
    h.advance(1.5);

    REQUIRE(countStatus(h.events, StatusKind::RelocalizationFailed) == 1, "relocalization_failed status");
    const auto* phase = lastEvent<RelocalizationStatusEvent>(h.events);
    REQUIRE(phase && phase->phase == RelocalizationPhase::Unavailable, "phase unavailable");
    REQUIRE(h.in<state::Running>(), "fresh capture not started");
    REQUIRE(!h.maps.get().has_value(), "map not cleared after failure");

    std::cout << "[PASS] tracking unavailable while relocalizing -> relocalization_failed\n";
}

static void runDurableFallbackAndCorruption() {
    {
        Harness h("durable_fallback");
        pauseWithMap(h);
        h.maps.clear(false);
        h.submit(cmd::Resume{});
        REQUIRE(h.in<state::Relocalizing>(), "durable map not used");
        h.advance(1.5);
        REQUIRE(countStatus(h.events, StatusKind::Relocated) == 1, "durable map did not relocate");
    }
    {
        Harness h("durable_corrupt");
        pauseWithMap(h);
        h.maps.clear(false);
        auto bytes = readAll(h.dir + "/worldmap.bin");
        REQUIRE(bytes.size() > FileWorldMapTier::kHeaderBytes, "durable file too small");
        bytes.back() ^= 0x5Au;
        std::string error;
        REQUIRE(h.fs.writeFile(h.dir + "/worldmap.bin", bytes, error), "rewrite failed");

        h.submit(cmd::Resume{});
        REQUIRE(countStatus(h.events, StatusKind::NoWorldMap) == 1, "corrupt map was loaded");
        REQUIRE(h.in<state::Running>(), "not Running");
    }
    std::cout << "[PASS] resume falls back to the durable tier and rejects a corrupt file\n";
}

static void runEngineFailureKeepsRooms() {
    Harness h("engine_failure");
    captureFirstRoom(h);
    h.rig.capture.injectFailure("lidar lost");
    h.pump();

    const auto* err = lastError(h.events);
    REQUIRE(err && err->error == ErrorKind::EngineFailure, "EngineFailure error");
    REQUIRE(h.in<state::Idle>(), "failure did not return to Idle");
    REQUIRE(h.session->roomCount() == 1, "failure discarded rooms");

    h.submit(cmd::Start{});
    REQUIRE(h.in<state::Running>(), "Start after failure");
    REQUIRE(h.session->roomCount() == 1, "restart discarded rooms");

    std::cout << "[PASS] capture engine failure -> Error, Idle, rooms kept, retryable\n";
}

static void runRoomBuildFailure() {
    Harness h("build_failure");
    h.rig.rooms.failNext("degenerate geometry");
    h.submit(cmd::Start{});
    h.advance(1.0);
    h.submit(cmd::AddRoom{});
    h.advance(1.0);

    const auto* err = lastError(h.events);
    REQUIRE(err && err->error == ErrorKind::RoomBuildFailure, "RoomBuildFailure error");
    REQUIRE(h.in<state::Idle>(), "build failure did not return to Idle");
    REQUIRE(!h.rig.capture.isRunning(), "capture left running");

    Harness empty("empty_finish");
    empty.submit(cmd::Start{});
    empty.submit(cmd::Finish{});
    empty.advance(1.0);
    const auto* none = lastError(empty.events);
    REQUIRE(none && none->error == ErrorKind::RoomBuildFailure, "empty finish should report no room");
    REQUIRE(empty.in<state::Idle>(), "empty finish state");

    std::cout << "[PASS] room build failure and empty finish -> RoomBuildFailure, Idle\n";
}

static void runDoubleExport() {
    Harness h("double_export");
    captureFirstRoom(h);
    h.submit(cmd::Export{});
    REQUIRE(h.in<state::Exporting>(), "Export did not enter Exporting");
    h.submit(cmd::Export{});
    h.submit(cmd::Export{});
    REQUIRE(h.session->deferredCommands() == 1, "more than one export re-run queued");

    h.advance(2.0);
    REQUIRE(countEvents<ExportedEvent>(h.events) == 2, "Export while Exporting should run exactly twice");
    REQUIRE(h.rig.structures.merges() == 2, "merge count");
    REQUIRE(h.in<state::Running>(), "export did not return to Running");
    REQUIRE(h.session->deferredCommands() == 0, "deferred queue not drained");

    std::cout << "[PASS] Export while Exporting runs exactly twice\n";
}

static void runDeferredCommandOrder() {
    Harness h("deferred_order");
    captureFirstRoom(h);
    const auto runs_before = h.rig.capture.runs();

    h.submit(cmd::Export{});
    h.submit(cmd::AddRoom{});
    h.submit(cmd::Pause{});
    REQUIRE(h.session->deferredCommands() == 2, "commands not deferred during export");
    REQUIRE(h.in<state::Exporting>(), "deferred command changed state");

    h.advance(2.0);
    REQUIRE(h.rig.capture.runs() == runs_before + 1, "AddRoom did not replay before Pause");
    REQUIRE(h.in<state::Paused>(), "Pause did not replay");
    REQUIRE(h.session->roomCount() == 2, "AddRoom replay did not keep the room");
    REQUIRE(countEvents<PausedEvent>(h.events) == 1, "Paused event");

    std::cout << "[PASS] commands deferred while Exporting replay in FIFO order\n";
}

static void runCameraPermission() {
    {
        Harness h("camera_prompt");
        h.rig.permissions.setStatus(CameraAuthorization::NotDetermined);
        h.submit(cmd::Start{});
        REQUIRE(h.rig.permissions.requests() == 1, "permission not requested");
        REQUIRE(h.in<state::Idle>(), "started before the grant");
        h.submit(cmd::Start{});
        REQUIRE(h.rig.permissions.requests() == 1, "duplicate permission request");
        h.advance(0.2);
        REQUIRE(h.in<state::Running>(), "grant did not start the scan");
    }
    {
        Harness h("camera_refused");
        h.rig.permissions.setStatus(CameraAuthorization::NotDetermined);
        h.rig.permissions.setGrantOnRequest(false);
        h.submit(cmd::Start{});
        h.advance(0.2);
        const auto* err = lastError(h.events);
        REQUIRE(err && err->error == ErrorKind::PermissionDenied, "refusal not reported");
        REQUIRE(h.in<state::Idle>(), "refusal state");
    }
    {
        Harness h("camera_restricted");
        h.rig.permissions.setStatus(CameraAuthorization::Restricted);
        h.submit(cmd::Start{});
        const auto* err = lastError(h.events);
        REQUIRE(err && err->error == ErrorKind::PermissionDenied, "restricted not reported");
        REQUIRE(h.rig.capture.runs() == 0, "capture ran without permission");
    }
    {
        Harness h("unsupported");
        h.rig.capture.setSupported(false);
        h.submit(cmd::Start{});
        const auto* err = lastError(h.events);
        REQUIRE(err && err->error == ErrorKind::DeviceUnsupported, "DeviceUnsupported");
        REQUIRE(h.in<state::Idle>() && h.rig.capture.runs() == 0, "unsupported device started");
    }
    std::cout << "[PASS] Start: camera prompt, refusal, restriction, unsupported device\n";
}

static void runCancel() {
    Harness h("cancel");
    h.submit(cmd::Start{});
    h.advance(1.0);
    h.submit(cmd::Cancel{});
    REQUIRE(h.in<state::Idle>(), "Cancel state");
    REQUIRE(countStatus(h.events, StatusKind::Canceled) == 1, "Canceled status");
    h.advance(3.0);
    REQUIRE(countEvents<ExportedEvent>(h.events) == 0, "export after cancel");
    REQUIRE(h.session->roomCount() == 0, "cancelled capture produced a room");

    std::cout << "[PASS] Cancel -> Status{Canceled}, Idle, nothing exported\n";
}

static void driveTo(Harness& h, const std::string& target) {
    if (target == "Idle") return;
    if (target == "Running") {
        h.submit(cmd::Start{});
        h.submit(cmd::SetAutoPhotoInterval{0.5});
        h.advance(1.2);
    } else if (target == "FinishPending") {
        h.submit(cmd::Start{});
        h.advance(1.0);
        h.submit(cmd::Export{});
        h.submit(cmd::Finish{});
    } else if (target == "Paused") {
        pauseWithMap(h);
    } else if (target == "Relocalizing") {
        pauseWithMap(h);
        h.submit(cmd::Resume{});
    } else if (target == "Exporting") {
        captureFirstRoom(h);
        h.submit(cmd::CapturePhoto{});
        h.submit(cmd::Export{});
        h.submit(cmd::Pause{});
    } else if (target == "Terminal") {
        h.submit(cmd::Start{});
        h.advance(1.0);
        h.submit(cmd::Finish{});
        h.advance(2.0);
    }
    REQUIRE(std::string(h.session->stateName()) == target, "could not reach " << target << ", got "
                                                                                 << h.session->stateName());
}

static void runResetFromEveryState() {
    const char* targets[] = {"Idle", "Running", "FinishPending", "Paused", "Relocalizing", "Exporting", "Terminal"};
    for (const char* target : targets) {
        SessionConfigV1 cfg;
        cfg.audio_enabled = true;
        cfg.audio_autostart_delay_s = 0.2;
        if (std::string(target) == "Terminal") {
            cfg.export_on_finish = false;
            cfg.finish_policy = FinishPolicy::Complete;
        }
        Harness h(std::string("reset_") + target, cfg);
        driveTo(h, target);

        const bool had_map = fileExists(h.dir + "/worldmap.bin");
        h.submit(cmd::Reset{false});
        REQUIRE(h.in<state::Idle>(), "Reset from " << target << " not Idle");
        REQUIRE(h.session->roomCount() == 0, "rooms survived Reset from " << target);
        REQUIRE(h.session->photos().empty(), "photos survived Reset from " << target);
        REQUIRE(!h.session->pendingExport(), "pending export survived Reset from " << target);
        REQUIRE(h.session->deferredCommands() == 0, "deferred commands survived Reset from " << target);
        REQUIRE(h.session->buildsInFlight() == 0, "builds survived Reset from " << target);
        REQUIRE(!h.session->captureOpen(), "capture open after Reset from " << target);
        REQUIRE(!h.session->audioController().artifact().has_value(), "audio artifact survived Reset");
        REQUIRE(!h.session->audioController().isRecording(), "audio recording after Reset");
        REQUIRE(!h.session->photoController().intervalArmed(), "photo timer armed after Reset");
        REQUIRE(!h.maps.hasVolatile(), "volatile map survived Reset");
        REQUIRE(fileExists(h.dir + "/worldmap.bin") == had_map, "Reset(false) touched the durable map");

        const std::size_t mark = h.events.size();
        h.advance(8.0);
        REQUIRE(h.in<state::Idle>(), "late completion moved state after Reset from " << target);
        REQUIRE(h.events.size() == mark, "late completion emitted after Reset from " << target);

        h.submit(cmd::Reset{true});
        REQUIRE(!fileExists(h.dir + "/worldmap.bin"), "Reset(true) kept the durable map");
    }
    std::cout << "[PASS] Reset from every state -> Idle, empty lists, no pending flags, no late events\n";
}

static void runAudioRecording() {
    SessionConfigV1 cfg;
    cfg.audio_enabled = true;
    Harness h("audio", cfg);

    h.submit(cmd::Start{});
    h.advance(0.5);
    REQUIRE(countEvents<AudioEvent>(h.events) == 0, "audio started before the auto-start delay");
    h.advance(0.7);
    const auto* started = lastEvent<AudioEvent>(h.events);
    REQUIRE(started && started->status == AudioStatus::Started && started->url, "audio auto-start");
    const std::string url = *started->url;

    h.advance(1.0);
    const int chunks = countEvents<AudioDataEvent>(h.events);
    REQUIRE(chunks >= 3, "too few audio chunks: " << chunks);
    const auto* data = lastEvent<AudioDataEvent>(h.events);
    REQUIRE(data->sample_rate_hz == 16000 && data->chunk.size() == 4096, "chunk format");

    h.submit(cmd::StopAudio{});
    const auto* stopped = lastEvent<AudioEvent>(h.events);
    REQUIRE(stopped && stopped->status == AudioStatus::Stopped && stopped->url == url, "audio stopped");
    REQUIRE(h.in<state::Running>(), "audio affected the scan state");

    const auto wav = readAll(h.exportPath("Room.wav"));
    const std::uint32_t data_bytes = static_cast<std::uint32_t>(countEvents<AudioDataEvent>(h.events)) * 4096u * 2u;
    REQUIRE(wav.size() == WavWriter::kHeaderBytes + data_bytes, "wav size vs streamed chunks");
    REQUIRE(readAt<std::uint32_t>(wav, 40) == data_bytes, "wav data size");

    // Restart, then Finish stops it and the export carries the url.
    h.submit(cmd::StartAudio{});
    h.advance(0.5);
    h.submit(cmd::Finish{});
    h.advance(2.5);
    const auto* ex = lastEvent<ExportedEvent>(h.events);
    REQUIRE(ex && ex->result.audio_url && *ex->result.audio_url == url, "export audio url");
    REQUIRE(!h.session->audioController().isRecording(), "finish did not stop audio");

    std::cout << "[PASS] audio: delayed auto-start, chunk stream, WAV finalize, stop on finish\n";
}

static void runAudioStopThenStartBackToBack() {
    Harness h("audio_restart");
    h.submit(cmd::Start{});
    h.submit(cmd::StartAudio{});
    h.advance(1.0);
    REQUIRE(countAudioStatus(h.events, AudioStatus::Started) == 1, "audio did not start");

    // Both commands are queued before the loop runs either of them.
    h.session->submit(cmd::StopAudio{});
    h.session->submit(cmd::StartAudio{});
    h.pump();
    REQUIRE(countAudioStatus(h.events, AudioStatus::Stopped) == 1, "StopAudio lost behind StartAudio");
    const auto* stopped = lastEvent<AudioEvent>(h.events);
    REQUIRE(stopped && stopped->status == AudioStatus::Stopped && stopped->url, "Stopped without url");

    const auto wav = readAll(h.exportPath("Room.wav"));
    const std::uint32_t first_bytes =
        static_cast<std::uint32_t>(countEvents<AudioDataEvent>(h.events)) * 4096u * 2u;
    REQUIRE(first_bytes > 0, "no audio before the stop");
    REQUIRE(readAt<std::uint32_t>(wav, 40) == first_bytes, "first recording not finalized");
    REQUIRE(readAt<std::uint32_t>(wav, 4) == first_bytes + 36u, "first recording RIFF size");

    h.advance(0.5);
    REQUIRE(countAudioStatus(h.events, AudioStatus::Started) == 2, "queued StartAudio did not run");
    REQUIRE(h.session->audioController().isRecording(), "audio not recording after restart");
    const int chunks_before = countEvents<AudioDataEvent>(h.events);
    h.advance(1.0);
    h.submit(cmd::StopAudio{});
    REQUIRE(countAudioStatus(h.events, AudioStatus::Stopped) == 2, "second stop not reported");
    const auto wav2 = readAll(h.exportPath("Room.wav"));
    const std::uint32_t second_bytes =
        static_cast<std::uint32_t>(countEvents<AudioDataEvent>(h.events) - chunks_before) * 4096u * 2u;
    REQUIRE(wav2.size() == WavWriter::kHeaderBytes + second_bytes, "second recording size");
    REQUIRE(readAt<std::uint32_t>(wav2, 40) == second_bytes, "second recording data size");

    // Stop, Start, Stop in one batch ends stopped with a single Stopped event.
    h.submit(cmd::StartAudio{});
    h.advance(0.5);
    h.session->submit(cmd::StopAudio{});
    h.session->submit(cmd::StartAudio{});
    h.session->submit(cmd::StopAudio{});
    h.pump();
    h.advance(0.5);
    REQUIRE(countAudioStatus(h.events, AudioStatus::Stopped) == 3, "stop/start/stop Stopped count");
    REQUIRE(countAudioStatus(h.events, AudioStatus::Started) == 3, "cancelled restart still started");
    REQUIRE(!h.session->audioController().isRecording(), "stop/start/stop left audio recording");

    std::cout << "[PASS] audio: StopAudio then StartAudio finalizes the file before restarting\n";
}

static void runAudioFailures() {
    Harness h("audio_fail");
    h.rig.audio.setPermissionGranted(false);
    h.submit(cmd::StartAudio{});
    h.advance(0.2);
    const auto* denied = lastEvent<AudioEvent>(h.events);
    REQUIRE(denied && denied->status == AudioStatus::Error && denied->error, "mic denial not reported");
    REQUIRE(countStatus(h.events, StatusKind::Error) == 0, "audio failure leaked into session status");

    h.rig.audio.setPermissionGranted(true);
    h.submit(cmd::Start{});
    h.submit(cmd::StartAudio{});
    h.advance(0.5);
    REQUIRE(h.session->audioController().isRecording(), "audio not recording");
    h.rig.audio.injectFailure("device unplugged");
    h.pump();
    const auto* failed = lastEvent<AudioEvent>(h.events);
    REQUIRE(failed && failed->status == AudioStatus::Error, "engine failure not reported");
    REQUIRE(h.in<state::Running>(), "audio failure changed scan state");

    std::cout << "[PASS] audio failures stay on the audio channel\n";
}

static void runPhotoTimerAndMissingFrame() {
    Harness h("photo_timer");
    h.submit(cmd::Start{});
    h.advance(0.5);
    const std::uint32_t hash_before = h.session->config().fnv_hash_u32;
    h.submit(cmd::SetAutoPhotoInterval{0.5});
    REQUIRE(h.session->photoController().intervalArmed(), "interval timer not armed while Running");
    REQUIRE(h.session->config().auto_photo_interval_s == 0.5, "interval not recorded in config");
    REQUIRE(h.session->config().fnv_hash_u32 != hash_before, "config hash not refreshed");
    h.advance(1.75);
    REQUIRE(h.session->photos().size() == 3, "interval photo count: " << h.session->photos().size());

    h.submit(cmd::Pause{});
    REQUIRE(!h.session->photoController().intervalArmed(), "interval timer armed while Paused");
    h.advance(2.0);
    REQUIRE(h.session->photos().size() == 3, "photos taken while Paused");

    h.rig.tracking.setFramesAvailable(false);
    h.submit(cmd::CapturePhoto{});
    const auto* p = lastEvent<PhotoEvent>(h.events);
    REQUIRE(p && p->error, "missing frame not reported");
    REQUIRE(h.in<state::Paused>(), "photo failure changed state");

    std::cout << "[PASS] photo interval timer only while capturing; missing frame is non-fatal\n";
}

int main() {
    // =======================
    // Primitives
    // =======================
    runEventLoopOrdering();
    runBackgroundTaskCompletion();
    runTriggerDedup();
    runWorldMapStoreTiers();
    runWavHeader();
    runYCbCrConversion();
    runConfigHashAndJson();

    // =======================
    // Scenarios
    // =======================
    runScenarioFinishExports();
    runScenarioExportBeforeReady();
    runQueuedExportFiresOnFirstRoom();
    runScenarioPauseResumeMultiRoom();
    runScenarioPhotos();
    runTriggerTokensDriveSession();

    // =======================
    // Session properties
    // =======================
    runAddRoomMonotonic();
    runResumeWithoutMap();
    runRelocalizationTimeout();
    runStaleTimeoutIgnored();
    runTrackingUnavailable();
    runDurableFallbackAndCorruption();
    runEngineFailureKeepsRooms();
    runRoomBuildFailure();
    runDoubleExport();
    runDeferredCommandOrder();
    runCameraPermission();
    runCancel();
    runResetFromEveryState();

    // =======================
    // Audio / photo side channels
    // =======================
    runAudioRecording();
    runAudioStopThenStartBackToBack();
    runAudioFailures();
    runPhotoTimerAndMissingFrame();

    return 0;
}

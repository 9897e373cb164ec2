#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Collaborators.h"
#include "EventLoop.h"

namespace spdlog { class logger; }

namespace scanorch {

class Filesystem;

struct ExportRequest {
    std::string export_dir;
    std::string scan_name = "Room";
    std::string model_extension = "usdz";
    ExportMode mode = ExportMode::Parametric;
    bool send_file_loc = true;
    std::optional<std::string> audio_url;
    std::vector<std::string> photo_urls;
};

// ============================================================
// Accumulated rooms across add-room cycles, the export-before-ready flag,
// and the export pipeline:
//   merge (StructureSynthesizer) -> <dir>/<scan>.json + <dir>/<scan>.<ext>
// File writing runs on the background worker. Every completion is delivered
// on the loop; invalidate() drops everything still in flight.
// ============================================================
class RoomAggregator {
public:
    using BuildDone = std::function<void(const Outcome<ProcessedRoom>&)>;
    using ExportDone = std::function<void(const Outcome<ExportResult>&)>;

    RoomAggregator(EventLoop& loop,
                   BackgroundTask& background,
                   RoomSynthesizer& rooms,
                   StructureSynthesizer& structures,
                   Filesystem& fs,
                   std::shared_ptr<spdlog::logger> log);

    RoomAggregator(const RoomAggregator&) = delete;
    RoomAggregator& operator=(const RoomAggregator&) = delete;

    // On success the room is appended before done runs.
    void build(RawRoomData raw, BuildDone done);
    int buildsInFlight() const { return builds_in_flight_; }

    const std::vector<ProcessedRoom>& rooms() const { return rooms_; }
    std::size_t roomCount() const { return rooms_.size(); }

    bool pendingExport() const { return pending_export_; }
    void setPendingExport(bool pending) { pending_export_ = pending; }

    void exportRooms(ExportRequest request, ExportDone done);
    bool exportInFlight() const { return export_in_flight_; }

    void invalidate();

    // invalidate() + rooms + pending flag.
    void clear();

    // Writes both artifacts for an already merged structure.
    static Outcome<ExportResult> writeArtifacts(Filesystem& fs, const Structure& structure,
                                                const ExportRequest& request);

private:
    void onBuilt(std::uint64_t gen, Outcome<ProcessedRoom> outcome, const BuildDone& done);
    void onMerged(std::uint64_t gen, Outcome<StructurePtr> merged, ExportRequest request, ExportDone done);

    EventLoop& loop_;
    BackgroundTask& background_;
    RoomSynthesizer& room_synth_;
    StructureSynthesizer& structure_synth_;
    Filesystem& fs_;
    std::shared_ptr<spdlog::logger> log_;

    std::shared_ptr<int> life_ = std::make_shared<int>(0);
    std::uint64_t generation_ = 0;
    int builds_in_flight_ = 0;
    bool export_in_flight_ = false;
    bool pending_export_ = false;
    std::vector<ProcessedRoom> rooms_;
};

} // namespace scanorch

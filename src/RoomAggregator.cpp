#include "RoomAggregator.h"

#include "Filesystem.h"

#include <spdlog/spdlog.h>

namespace scanorch {

RoomAggregator::RoomAggregator(EventLoop& loop,
                               BackgroundTask& background,
                               RoomSynthesizer& rooms,
                               StructureSynthesizer& structures,
                               Filesystem& fs,
                               std::shared_ptr<spdlog::logger> log)
    : loop_(loop),
      background_(background),
      room_synth_(rooms),
      structure_synth_(structures),
      fs_(fs),
      log_(std::move(log)) {}

// ============================================================
// Room builds
// ============================================================

void RoomAggregator::build(RawRoomData raw, BuildDone done) {
    const std::uint64_t gen = generation_;
    ++builds_in_flight_;
    log_->debug("rooms: building capture {} ({} frames), {} in flight", raw.capture_id, raw.frame_count,
                builds_in_flight_);

    EventLoop& loop = loop_;
    std::weak_ptr<int> guard = life_;
    room_synth_.buildRoom(std::move(raw), [this, &loop, guard, gen, done](Outcome<ProcessedRoom> outcome) {
        loop.post(guardTask(guard, [this, gen, done, outcome = std::move(outcome)]() mutable {
            onBuilt(gen, std::move(outcome), done);
        }));
    });
}

void RoomAggregator::onBuilt(std::uint64_t gen, Outcome<ProcessedRoom> outcome, const BuildDone& done) {
    if (gen != generation_) {
        log_->debug("rooms: stale build result dropped");
        return;
    }
    --builds_in_flight_;

    if (outcome.ok()) {
        outcome.value->sequence = static_cast<std::uint32_t>(rooms_.size() + 1);
        rooms_.push_back(*outcome.value);
        log_->info("rooms: room {} built ({:.1f} m2, {} walls), {} total", outcome.value->sequence,
                   outcome.value->floor_area_m2, outcome.value->wall_count, rooms_.size());
    }
    if (done) done(outcome);
}

// ============================================================
// Export
// ============================================================

void RoomAggregator::exportRooms(ExportRequest request, ExportDone done) {
    const std::uint64_t gen = generation_;
    export_in_flight_ = true;
    log_->info("export: merging {} room(s) as {}", rooms_.size(), exportModeName(request.mode));

    EventLoop& loop = loop_;
    std::weak_ptr<int> guard = life_;
    structure_synth_.merge(rooms_, [this, &loop, guard, gen, request = std::move(request),
                                    done = std::move(done)](Outcome<StructurePtr> merged) {
        loop.post(guardTask(guard, [this, gen, merged = std::move(merged), request, done]() mutable {
            onMerged(gen, std::move(merged), std::move(request), std::move(done));
        }));
    });
}

void RoomAggregator::onMerged(std::uint64_t gen, Outcome<StructurePtr> merged, ExportRequest request,
                              ExportDone done) {
    if (gen != generation_) return;

    if (!merged.ok() || !*merged.value) {
        export_in_flight_ = false;
        const std::string msg = merged.error.message.empty() ? "Structure merge failed" : merged.error.message;
        if (done) done(Outcome<ExportResult>::failure(ErrorKind::ExportFailure, msg));
        return;
    }

    StructurePtr structure = *merged.value;
    Filesystem& fs = fs_;
    EventLoop& loop = loop_;
    std::weak_ptr<int> guard = life_;
    background_.schedule([this, &fs, &loop, guard, gen, structure, request = std::move(request),
                          done = std::move(done)] {
        auto result = writeArtifacts(fs, *structure, request);
        loop.post(guardTask(guard, [this, gen, result, done] {
            if (gen != generation_) return;
            export_in_flight_ = false;
            if (done) done(result);
        }));
    });
}

Outcome<ExportResult> RoomAggregator::writeArtifacts(Filesystem& fs, const Structure& structure,
                                                     const ExportRequest& request) {
    std::string error;
    if (!fs.createDirectories(request.export_dir, error)) {
        return Outcome<ExportResult>::failure(ErrorKind::ExportFailure, error);
    }

    const std::string json_path = joinPath(request.export_dir, request.scan_name + ".json");
    const std::string model_path = joinPath(request.export_dir, request.scan_name + "." + request.model_extension);

    if (!fs.writeText(json_path, structure.serialize(), error)) {
        return Outcome<ExportResult>::failure(ErrorKind::ExportFailure, error);
    }

    auto out = fs.openOutput(model_path, error);
    if (!out) {
        return Outcome<ExportResult>::failure(ErrorKind::ExportFailure, error);
    }
    if (!structure.exportModel(*out, request.mode, error)) {
        return Outcome<ExportResult>::failure(ErrorKind::ExportFailure, "Model export: " + error);
    }
    out->flush();
    if (!*out) {
        return Outcome<ExportResult>::failure(ErrorKind::ExportFailure, "short write to " + model_path);
    }

    ExportResult result;
    if (request.send_file_loc) {
        result.scan_url = toFileUrl(model_path);
        result.json_url = toFileUrl(json_path);
    }
    result.audio_url = request.audio_url;
    result.photo_urls = request.photo_urls;
    return Outcome<ExportResult>::success(std::move(result));
}

void RoomAggregator::invalidate() {
    ++generation_;
    builds_in_flight_ = 0;
    export_in_flight_ = false;
}

void RoomAggregator::clear() {
    invalidate();
    rooms_.clear();
    pending_export_ = false;
}

} // namespace scanorch

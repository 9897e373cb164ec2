#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "SessionTypes.h"

namespace scanorch {

// ============================================================
// PCM16 WAV writer. The RIFF and data sizes are written as 0 on open and
// patched by finalize().
// ============================================================
class WavWriter {
public:
    static constexpr std::size_t kHeaderBytes = 44;

    WavWriter(std::unique_ptr<std::ostream> out, int sample_rate_hz, int channels);

    bool ok() const { return out_ && static_cast<bool>(*out_); }

    bool append(const std::vector<std::int16_t>& samples);

    // Patches the header sizes and flushes. Further appends are ignored.
    bool finalize();

    std::uint32_t dataBytes() const { return data_bytes_; }
    int sampleRateHz() const { return sample_rate_hz_; }

private:
    void writeHeader(std::uint32_t data_size);

    std::unique_ptr<std::ostream> out_;
    int sample_rate_hz_ = 16000;
    int channels_ = 1;
    std::uint32_t data_bytes_ = 0;
    bool finalized_ = false;
};

// ============================================================
// Still image conversion
// ============================================================

struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> rgb; // width*height*3, row-major
};

// Full-range BT.601 biplanar 4:2:0 to RGB. Returns false (out untouched) if
// the plane sizes do not match the frame dimensions.
bool convertYCbCr420ToRgb(const Frame& frame, RgbImage& out);

// Binary PPM (P6).
std::vector<std::uint8_t> encodePpm(const RgbImage& image);

} // namespace scanorch

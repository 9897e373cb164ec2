#include "MediaEncoding.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace scanorch {

namespace {

template <typename T>
void writeLe(std::ostream& out, T v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

inline std::uint8_t clampByte(double v) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

} // namespace

// ============================================================
// WavWriter
// ============================================================

WavWriter::WavWriter(std::unique_ptr<std::ostream> out, int sample_rate_hz, int channels)
    : out_(std::move(out)), sample_rate_hz_(sample_rate_hz), channels_(std::max(1, channels)) {
    if (out_) writeHeader(0u);
}

void WavWriter::writeHeader(std::uint32_t data_size) {
    const std::uint16_t channels = static_cast<std::uint16_t>(channels_);
    const std::uint16_t bits_per_sample = 16u;
    const std::uint32_t sample_rate = static_cast<std::uint32_t>(sample_rate_hz_);
    const std::uint32_t byte_rate = sample_rate * channels * (bits_per_sample / 8u);
    const std::uint16_t block_align = static_cast<std::uint16_t>(channels * (bits_per_sample / 8u));
    const std::uint32_t chunk_size = 36u + data_size;
    const std::uint32_t fmt_size = 16u;
    const std::uint16_t audio_format = 1u; // PCM

    out_->write("RIFF", 4);
    writeLe(*out_, chunk_size);
    out_->write("WAVE", 4);
    out_->write("fmt ", 4);
    writeLe(*out_, fmt_size);
    writeLe(*out_, audio_format);
    writeLe(*out_, channels);
    writeLe(*out_, sample_rate);
    writeLe(*out_, byte_rate);
    writeLe(*out_, block_align);
    writeLe(*out_, bits_per_sample);
    out_->write("data", 4);
    writeLe(*out_, data_size);
}

bool WavWriter::append(const std::vector<std::int16_t>& samples) {
    if (finalized_ || !ok()) return false;
    if (samples.empty()) return true;
    const std::size_t bytes = samples.size() * sizeof(std::int16_t);
    out_->write(reinterpret_cast<const char*>(samples.data()), static_cast<std::streamsize>(bytes));
    if (!*out_) return false;
    data_bytes_ += static_cast<std::uint32_t>(bytes);
    return true;
}

bool WavWriter::finalize() {
    if (finalized_) return true;
    finalized_ = true;
    if (!ok()) return false;
    out_->seekp(0, std::ios::beg);
    writeHeader(data_bytes_);
    out_->seekp(0, std::ios::end);
    out_->flush();
    const bool good = static_cast<bool>(*out_);
    out_.reset();
    return good;
}

// ============================================================
// YCbCr 4:2:0 -> RGB, PPM
// ============================================================

bool convertYCbCr420ToRgb(const Frame& frame, RgbImage& out) {
    const int w = frame.width;
    const int h = frame.height;
    if (w <= 0 || h <= 0) return false;
    const int cw = (w + 1) / 2;
    const int ch = (h + 1) / 2;
    if (frame.luma.size() != static_cast<std::size_t>(w) * h) return false;
    if (frame.chroma.size() != static_cast<std::size_t>(cw) * ch * 2) return false;

    RgbImage img;
    img.width = w;
    img.height = h;
    img.rgb.resize(static_cast<std::size_t>(w) * h * 3);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const double Y = frame.luma[static_cast<std::size_t>(y) * w + x];
            const std::size_t ci = (static_cast<std::size_t>(y / 2) * cw + (x / 2)) * 2;
            const double Cb = frame.chroma[ci] - 128.0;
            const double Cr = frame.chroma[ci + 1] - 128.0;

            std::uint8_t* px = &img.rgb[(static_cast<std::size_t>(y) * w + x) * 3];
            px[0] = clampByte(Y + 1.402 * Cr);
            px[1] = clampByte(Y - 0.344136 * Cb - 0.714136 * Cr);
            px[2] = clampByte(Y + 1.772 * Cb);
        }
    }

    out = std::move(img);
    return true;
}

std::vector<std::uint8_t> encodePpm(const RgbImage& image) {
    const std::string header =
        "P6\n" + std::to_string(image.width) + " " + std::to_string(image.height) + "\n255\n";
    std::vector<std::uint8_t> out;
    out.reserve(header.size() + image.rgb.size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), image.rgb.begin(), image.rgb.end());
    return out;
}

} // namespace scanorch

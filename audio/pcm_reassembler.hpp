#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Audio {

// Raw stream format: mono, signed 16-bit little-endian
constexpr std::size_t kPcmFrameBytes = 2;

// int16 → [-1, 1]
inline float normalizeSample(std::int16_t sample) {
    float v = static_cast<float>(sample) / 32768.0f;
    if (v < -1.0f) return -1.0f;
    if (v > 1.0f) return 1.0f;
    return v;
}

/// PcmReassembler
/// Turns arbitrarily split network chunks into whole samples. A dangling
/// byte (odd total) is carried to the next chunk; the residual never holds
/// a full frame.
class PcmReassembler {
public:
    // Append samples decoded from residual + chunk to `out`; returns count appended
    std::size_t feed(const std::uint8_t* data, std::size_t size, std::vector<float>& out);
    std::vector<float> feed(const std::uint8_t* data, std::size_t size);

    // End of stream: forced pass with no extra input. Drops a dangling byte.
    // Returns true if a byte was discarded.
    bool flush();

    void reset() { residualSize_ = 0; }
    std::size_t residualSize() const { return residualSize_; }

private:
    std::uint8_t residual_[kPcmFrameBytes - 1]{};
    std::size_t residualSize_ = 0;
};

} // namespace Audio

#include "pcm_reassembler.hpp"

namespace Audio {

static inline std::int16_t readLe16(std::uint8_t lo, std::uint8_t hi) {
    return static_cast<std::int16_t>(static_cast<std::uint16_t>(lo) |
                                     (static_cast<std::uint16_t>(hi) << 8));
}

std::size_t PcmReassembler::feed(const std::uint8_t* data, std::size_t size,
                                 std::vector<float>& out) {
    if (!data) size = 0;

    const std::size_t total  = residualSize_ + size;
    const std::size_t usable = (total / kPcmFrameBytes) * kPcmFrameBytes;
    const std::size_t before = out.size();
    out.reserve(before + usable / kPcmFrameBytes);

    std::size_t pos = 0; // index into data
    if (residualSize_ > 0 && size > 0) {
        // The carried byte is always the low byte of the next sample
        out.push_back(normalizeSample(readLe16(residual_[0], data[0])));
        pos = 1;
        residualSize_ = 0;
    }

    while (pos + kPcmFrameBytes <= size) {
        out.push_back(normalizeSample(readLe16(data[pos], data[pos + 1])));
        pos += kPcmFrameBytes;
    }

    // Carry what is left (0 or 1 byte)
    if (pos < size) {
        residual_[residualSize_] = data[pos];
        ++residualSize_;
    }
    return out.size() - before;
}

std::vector<float> PcmReassembler::feed(const std::uint8_t* data, std::size_t size) {
    std::vector<float> out;
    feed(data, size, out);
    return out;
}

bool PcmReassembler::flush() {
    std::vector<float> tail;
    feed(nullptr, 0, tail);
    const bool dropped = residualSize_ > 0;
    residualSize_ = 0;
    return dropped;
}

} // namespace Audio

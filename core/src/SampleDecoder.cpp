#include "voicescope/SampleDecoder.h"
#include "voicescope/Errors.h"

#include <string>

namespace voicescope {

SampleDecoder::SampleDecoder(int sampleRate) : sampleRate_(sampleRate) {}

SampleBuffer SampleDecoder::decode(const std::vector<std::uint8_t>& rawBytes) const {
    return decode(rawBytes.data(), rawBytes.size());
}

SampleBuffer SampleDecoder::decode(const std::uint8_t* data, std::size_t size) const {
    if (data == nullptr || size == 0) {
        throw DecodeError("empty PCM buffer");
    }
    if (size % contract::PCM_BYTES_PER_SAMPLE != 0) {
        throw DecodeError("PCM buffer length " + std::to_string(size) + " is not a whole number of 16-bit samples");
    }

    SampleBuffer buffer;
    buffer.sampleRate = sampleRate_;
    buffer.channels = 1;

    const std::size_t N = size / contract::PCM_BYTES_PER_SAMPLE;
    buffer.samples.resize(N);
    for (std::size_t i = 0; i < N; ++i) {
        const auto lo = static_cast<std::uint16_t>(data[2 * i]);
        const auto hi = static_cast<std::uint16_t>(data[2 * i + 1]);
        const auto value = static_cast<std::int16_t>(static_cast<std::uint16_t>(lo | (hi << 8)));
        buffer.samples[i] = static_cast<float>(static_cast<double>(value) / contract::PCM16_SCALE);
    }
    return buffer;
}

}  // namespace voicescope

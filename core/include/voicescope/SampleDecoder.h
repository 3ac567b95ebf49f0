#pragma once

#include "voicescope/DeliveryTypes.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voicescope {

/**
 * SampleDecoder: raw 16-bit little-endian mono PCM -> normalized SampleBuffer
 *
 * No container parsing. The sample rate is taken from configuration.
 */
class SampleDecoder {
  public:
    explicit SampleDecoder(int sampleRate = contract::DEFAULT_SAMPLE_RATE_HZ);

    /**
     * Decode a PCM byte buffer
     * @param rawBytes Even, non-empty byte sequence
     * @return SampleBuffer with rawBytes.size()/2 samples in [-1,1)
     * @throws DecodeError on empty or odd-length input
     */
    SampleBuffer decode(const std::vector<std::uint8_t>& rawBytes) const;
    SampleBuffer decode(const std::uint8_t* data, std::size_t size) const;

  private:
    int sampleRate_;
};

}  // namespace voicescope

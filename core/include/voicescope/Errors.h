#pragma once

#include "voicescope/DeliveryTypes.h"

#include <stdexcept>
#include <string>

namespace voicescope {

// Input bytes cannot be framed as 16-bit PCM (empty or odd length).
class DecodeError : public std::runtime_error {
  public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

// A numeric stage could not produce a measurement from the samples it was given.
class AnalysisError : public std::runtime_error {
  public:
    AnalysisError(AnalysisStage stage, const std::string& message)
        : std::runtime_error(message), stage_(stage) {}

    AnalysisStage stage() const noexcept { return stage_; }

  private:
    AnalysisStage stage_;
};

}  // namespace voicescope

#pragma once

#include "voicescope/DeliveryTypes.h"

#include <vector>

namespace voicescope {

// Rule-based observations over a finished report. Issues never change scores.
class DiagnosticsEngine {
  public:
    std::vector<DeliveryIssue> detect(const DeliveryReport& report) const;
};

}  // namespace voicescope

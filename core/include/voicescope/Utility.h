#pragma once

#include "voicescope/DeliveryTypes.h"

#include <string>
#include <utility>
#include <vector>

namespace voicescope {

std::string metric_kind_to_string(MetricKind kind);
MetricKind metric_kind_from_string(const std::string& value);

std::string analysis_stage_to_string(AnalysisStage stage);

// (kind, value) pairs in declaration order, for persistence and display
std::vector<std::pair<MetricKind, double>> metric_values(const DeliveryMetrics& metrics);
void set_metric_value(DeliveryMetrics& metrics, MetricKind kind, double value);

}

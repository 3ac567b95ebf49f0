#include "voicescope_bridge.h"

#include "voicescope/CoreContract.h"
#include "voicescope/DeliveryEngine.h"
#include "voicescope/Log.h"
#include "voicescope/MetricEngine.h"
#include "voicescope/SQLiteStore.h"

#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kComponent = "Bridge";

void to_c(const voicescope::DeliveryMetrics& m, VoiceScopeDeliveryMetrics* out) {
    if (!out) return;
    out->pace = m.pace;
    out->volume = m.volume;
    out->clarity = m.clarity;
    out->pause_duration = m.pauseDuration;
    out->tonal_variation = m.tonalVariation;
    out->confidence = m.confidence;
    out->enthusiasm = m.enthusiasm;
}

voicescope::AnalysisConfig from_c(const VoiceScopeConfig& c) {
    voicescope::AnalysisConfig config;
    config.sampleRate = c.sample_rate;
    config.speechWindowSeconds = c.speech_window_seconds;
    config.speechEnergyThreshold = c.speech_energy_threshold;
    config.silenceWindowSeconds = c.silence_window_seconds;
    config.silenceEnergyThreshold = c.silence_energy_threshold;
    config.minPauseSeconds = c.min_pause_seconds;
    config.spectralFrameSize = c.spectral_frame_size;
    config.pitchWindowSeconds = c.pitch_window_seconds;
    config.pitchMinHz = c.pitch_min_hz;
    config.pitchMaxHz = c.pitch_max_hz;
    config.pitchPeakRatio = c.pitch_peak_ratio;
    return config;
}

// A null pointer with zero length is an empty clip, handled by the decoder.
std::vector<std::uint8_t> copy_bytes(const uint8_t* bytes, size_t len) {
    if (!bytes || len == 0) return {};
    return std::vector<std::uint8_t>(bytes, bytes + len);
}

char* dup_string(const std::string& s) {
    char* out = new char[s.size() + 1];
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

int analyze_with(const voicescope::AnalysisConfig& config,
                 const uint8_t* bytes,
                 size_t len,
                 VoiceScopeDeliveryMetrics* out) {
    if (!bytes && len > 0) {
        to_c(voicescope::MetricEngine::fallback(), out);
        return VOICESCOPE_INVALID_ARGUMENT;
    }
    try {
        const voicescope::DeliveryEngine engine(config);
        const auto report = engine.analyze(copy_bytes(bytes, len));
        to_c(report.metrics, out);
        return report.usedFallback ? VOICESCOPE_FALLBACK : VOICESCOPE_OK;
    } catch (const std::invalid_argument& e) {
        voicescope::log_error(kComponent, std::string("invalid config: ") + e.what());
        to_c(voicescope::MetricEngine::fallback(), out);
        return VOICESCOPE_INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        voicescope::log_error(kComponent, std::string("analysis aborted: ") + e.what());
    }
    to_c(voicescope::MetricEngine::fallback(), out);
    return VOICESCOPE_FALLBACK;
}

void fill_item(const voicescope::ClipSummary& clip, VoiceScopeClipSummary& item) {
    item.clip_id = dup_string(clip.clipId);
    item.clip_name = dup_string(clip.clipName);
    item.duration_seconds = clip.durationSeconds;
    item.delivery_average = clip.deliveryAverage;
    item.used_fallback = clip.usedFallback ? 1 : 0;
    item.created_at = dup_string(clip.createdAt);
}

} // namespace

extern "C" {

int voicescope_compute_delivery_metrics(const uint8_t* bytes, size_t len, VoiceScopeDeliveryMetrics* out) {
    return analyze_with(voicescope::AnalysisConfig{}, bytes, len, out);
}

int voicescope_compute_delivery_metrics_with_config(const uint8_t* bytes,
                                                    size_t len,
                                                    const VoiceScopeConfig* config,
                                                    VoiceScopeDeliveryMetrics* out) {
    if (!config) {
        to_c(voicescope::MetricEngine::fallback(), out);
        return VOICESCOPE_INVALID_ARGUMENT;
    }
    return analyze_with(from_c(*config), bytes, len, out);
}

void voicescope_default_config(VoiceScopeConfig* out) {
    if (!out) return;
    const voicescope::AnalysisConfig d;
    out->sample_rate = d.sampleRate;
    out->speech_window_seconds = d.speechWindowSeconds;
    out->speech_energy_threshold = d.speechEnergyThreshold;
    out->silence_window_seconds = d.silenceWindowSeconds;
    out->silence_energy_threshold = d.silenceEnergyThreshold;
    out->min_pause_seconds = d.minPauseSeconds;
    out->spectral_frame_size = d.spectralFrameSize;
    out->pitch_window_seconds = d.pitchWindowSeconds;
    out->pitch_min_hz = d.pitchMinHz;
    out->pitch_max_hz = d.pitchMaxHz;
    out->pitch_peak_ratio = d.pitchPeakRatio;
}

int voicescope_analyze_and_store(const char* db_path,
                                 const char* clip_id,
                                 const char* clip_name,
                                 const uint8_t* bytes,
                                 size_t len,
                                 VoiceScopeDeliveryMetrics* out) {
    if (!db_path || !clip_id || clip_id[0] == '\0' || (!bytes && len > 0)) {
        to_c(voicescope::MetricEngine::fallback(), out);
        return VOICESCOPE_INVALID_ARGUMENT;
    }

    voicescope::DeliveryReport report;
    try {
        voicescope::DeliveryAnalysisRequest request;
        request.clipId = clip_id;
        request.clipName = clip_name ? clip_name : "";
        request.rawBytes = copy_bytes(bytes, len);

        const voicescope::DeliveryEngine engine;
        report = engine.analyze(request);
    } catch (const std::exception& e) {
        voicescope::log_error(kComponent, std::string("analysis of clip '") + clip_id + "' aborted: " + e.what());
        to_c(voicescope::MetricEngine::fallback(), out);
        return VOICESCOPE_FALLBACK;
    }
    to_c(report.metrics, out);

    try {
        voicescope::SQLiteStore store(db_path);
        store.initialize();
        store.save_report(report);
    } catch (const std::exception& e) {
        voicescope::log_error(kComponent, std::string("failed to store clip '") + clip_id + "': " + e.what());
        return VOICESCOPE_STORAGE_ERROR;
    }
    return report.usedFallback ? VOICESCOPE_FALLBACK : VOICESCOPE_OK;
}

int voicescope_load_metrics(const char* db_path, const char* clip_id, VoiceScopeDeliveryMetrics* out) {
    if (!db_path || !clip_id || !out) return VOICESCOPE_INVALID_ARGUMENT;
    try {
        voicescope::SQLiteStore store(db_path);
        store.initialize();
        const auto metrics = store.load_metrics(clip_id);
        if (!metrics) return VOICESCOPE_NOT_FOUND;
        to_c(*metrics, out);
        return VOICESCOPE_OK;
    } catch (const std::exception& e) {
        voicescope::log_error(kComponent, std::string("failed to load clip '") + clip_id + "': " + e.what());
        return VOICESCOPE_STORAGE_ERROR;
    }
}

int voicescope_list_clips(const char* db_path, VoiceScopeClipList* out_list) {
    if (!db_path || !out_list) return VOICESCOPE_INVALID_ARGUMENT;
    out_list->items = nullptr;
    out_list->count = 0;

    std::vector<voicescope::ClipSummary> clips;
    try {
        voicescope::SQLiteStore store(db_path);
        store.initialize();
        clips = store.list_clips();
    } catch (const std::exception& e) {
        voicescope::log_error(kComponent, std::string("failed to list clips: ") + e.what());
        return VOICESCOPE_STORAGE_ERROR;
    }
    if (clips.empty()) return VOICESCOPE_OK;

    // Items start zeroed so a partial list can be released with voicescope_free_clip_list.
    VoiceScopeClipList list{nullptr, 0};
    try {
        list.items = new VoiceScopeClipSummary[clips.size()]();
        list.count = clips.size();
        for (size_t i = 0; i < clips.size(); ++i) {
            fill_item(clips[i], list.items[i]);
        }
    } catch (const std::exception& e) {
        voicescope_free_clip_list(&list);
        voicescope::log_error(kComponent, std::string("failed to copy clip list: ") + e.what());
        return VOICESCOPE_INTERNAL_ERROR;
    }
    *out_list = list;
    return VOICESCOPE_OK;
}

int voicescope_delete_clip(const char* db_path, const char* clip_id) {
    if (!db_path || !clip_id) return VOICESCOPE_INVALID_ARGUMENT;
    try {
        voicescope::SQLiteStore store(db_path);
        store.initialize();
        return store.delete_clip(clip_id) ? VOICESCOPE_OK : VOICESCOPE_NOT_FOUND;
    } catch (const std::exception& e) {
        voicescope::log_error(kComponent, std::string("failed to delete clip '") + clip_id + "': " + e.what());
        return VOICESCOPE_STORAGE_ERROR;
    }
}

void voicescope_free_clip_list(VoiceScopeClipList* list) {
    if (!list || !list->items) return;
    for (size_t i = 0; i < list->count; ++i) {
        delete[] list->items[i].clip_id;
        delete[] list->items[i].clip_name;
        delete[] list->items[i].created_at;
    }
    delete[] list->items;
    list->items = nullptr;
    list->count = 0;
}

const char* voicescope_version(void) {
    return voicescope::contract::CORE_CONTRACT_VERSION;
}

}  // extern "C"

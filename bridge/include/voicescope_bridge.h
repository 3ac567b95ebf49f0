#pragma once

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Status codes
// ============================================================================
// Every analysis entry point fills `out` with a usable record whenever `out` is
// non-null, including on VOICESCOPE_FALLBACK and VOICESCOPE_INVALID_ARGUMENT.
#define VOICESCOPE_OK 0
#define VOICESCOPE_FALLBACK 1            // analysis failed; fixed default scores returned
#define VOICESCOPE_INVALID_ARGUMENT -1   // null pointer or unusable config
#define VOICESCOPE_STORAGE_ERROR -2      // history database could not be read or written
#define VOICESCOPE_NOT_FOUND -3          // no stored clip with this id
#define VOICESCOPE_INTERNAL_ERROR -4     // result could not be copied out (out of memory)

// ============================================================================
// VoiceScopeDeliveryMetrics - Delivery Scores
// ============================================================================
//
// All seven scores lie in [1,5]. confidence and enthusiasm are rounded to one
// decimal place.
// ============================================================================

typedef struct {
    double pace;
    double volume;
    double clarity;
    double pause_duration;
    double tonal_variation;
    double confidence;
    double enthusiasm;
} VoiceScopeDeliveryMetrics;

// ============================================================================
// VoiceScopeConfig - Analysis Parameters
// ============================================================================
//
// Obtain defaults with voicescope_default_config() and change individual
// fields; the defaults describe 16-bit mono PCM at 44.1 kHz.
// ============================================================================

typedef struct {
    int sample_rate;                  // Hz
    double speech_window_seconds;     // energy window for speech detection
    double speech_energy_threshold;   // mean square energy; above = speech
    double silence_window_seconds;    // energy window for silence detection
    double silence_energy_threshold;  // mean square energy; below = silence
    double min_pause_seconds;         // shorter silences are ignored
    int spectral_frame_size;          // leading samples used for clarity
    double pitch_window_seconds;      // autocorrelation window
    double pitch_min_hz;
    double pitch_max_hz;
    double pitch_peak_ratio;          // (0,1]; 1.0 selects the strongest lag
} VoiceScopeConfig;

// ============================================================================
// Evaluation history
// ============================================================================
//
// MEMORY OWNERSHIP:
//   - Strings and items are allocated by Bridge on read
//   - Caller must use voicescope_free_clip_list() to deallocate
// ============================================================================

typedef struct {
    const char* clip_id;              // Caller-chosen logical id
    const char* clip_name;
    double duration_seconds;
    double delivery_average;          // mean of pace, tonal variation, clarity, confidence, enthusiasm
    int used_fallback;                // 1 if the stored scores are the default record
    const char* created_at;           // SQLite CURRENT_TIMESTAMP text
} VoiceScopeClipSummary;

typedef struct {
    VoiceScopeClipSummary* items;
    size_t count;
} VoiceScopeClipList;

// Analysis -----------------------------------------------------------------

// bytes: little-endian signed 16-bit mono PCM; len in bytes
int voicescope_compute_delivery_metrics(const uint8_t* bytes,
                                        size_t len,
                                        VoiceScopeDeliveryMetrics* out);

int voicescope_compute_delivery_metrics_with_config(const uint8_t* bytes,
                                                    size_t len,
                                                    const VoiceScopeConfig* config,
                                                    VoiceScopeDeliveryMetrics* out);

void voicescope_default_config(VoiceScopeConfig* out);

// Analyze and record the result under clip_id (replacing a previous entry).
// Returns VOICESCOPE_STORAGE_ERROR if the database fails; `out` still holds the scores.
int voicescope_analyze_and_store(const char* db_path,
                                 const char* clip_id,
                                 const char* clip_name,
                                 const uint8_t* bytes,
                                 size_t len,
                                 VoiceScopeDeliveryMetrics* out);

// Data access --------------------------------------------------------------

// Returns VOICESCOPE_NOT_FOUND (and leaves `out` untouched) if clip_id was never stored.
int voicescope_load_metrics(const char* db_path, const char* clip_id, VoiceScopeDeliveryMetrics* out);

int voicescope_list_clips(const char* db_path, VoiceScopeClipList* out_list);

// Returns VOICESCOPE_NOT_FOUND if clip_id was never stored.
int voicescope_delete_clip(const char* db_path, const char* clip_id);

void voicescope_free_clip_list(VoiceScopeClipList* list);

// Core contract version, e.g. "1.0.0"
const char* voicescope_version(void);

#ifdef __cplusplus
}
#endif

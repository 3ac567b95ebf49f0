#pragma once

/**
 * CoreContract.h - VoiceScope Core System Constants
 *
 * This file defines all contract-level constants for the VoiceScope scoring model.
 * These constants are PART OF THE SYSTEM CONTRACT and should NOT be changed
 * without understanding the implications for:
 *   - Comparability of stored evaluation history
 *   - Score reproducibility across versions
 *   - Downstream combination with content scores
 *
 * VERSION: 1.0.0
 */

namespace voicescope {
namespace contract {

// ============================================================================
// Input Framing
// ============================================================================

/**
 * DEFAULT_SAMPLE_RATE_HZ - Assumed rate of the raw PCM stream
 *
 * The decoder does not parse container headers; upstream conversion delivers
 * 16-bit little-endian mono PCM at this rate.
 */
constexpr int DEFAULT_SAMPLE_RATE_HZ = 44100;

constexpr int PCM_BYTES_PER_SAMPLE = 2;
constexpr double PCM16_SCALE = 32768.0;

// ============================================================================
// Segmentation
// ============================================================================

constexpr double SPEECH_WINDOW_SEC = 0.02;
constexpr double SPEECH_ENERGY_THRESHOLD = 0.001;

constexpr double SILENCE_WINDOW_SEC = 0.01;
constexpr double SILENCE_ENERGY_THRESHOLD = 0.01;

/**
 * MIN_PAUSE_SEC - Silence runs shorter than this are not pauses
 */
constexpr double MIN_PAUSE_SEC = 0.2;

// ============================================================================
// Spectral Analysis
// ============================================================================

/**
 * SPECTRAL_FRAME_SIZE - Maximum number of leading samples fed to the FFT
 *
 * Longer clips are truncated, not downsampled. At 44.1 kHz this covers ~23 ms.
 */
constexpr int SPECTRAL_FRAME_SIZE = 1024;

constexpr double SPEECH_BAND_LO_HZ = 300.0;
constexpr double SPEECH_BAND_HI_HZ = 3400.0;
constexpr double NOISE_BAND_HI_HZ = 8000.0;

/**
 * SCORE_EPS - Guards log10(0) and 0/0 in loudness and clarity ratios
 */
constexpr double SCORE_EPS = 1e-10;

// ============================================================================
// Pitch Tracking
// ============================================================================

constexpr double PITCH_WINDOW_SEC = 0.02;
constexpr double PITCH_MIN_HZ = 80.0;
constexpr double PITCH_MAX_HZ = 800.0;

/**
 * PITCH_PEAK_RATIO - Key-maximum acceptance ratio
 *
 * The chosen lag is the shortest local peak of the autocorrelation whose value is
 * at least PITCH_PEAK_RATIO * max. 1.0 selects the global maximum.
 */
constexpr double PITCH_PEAK_RATIO = 0.9;

// ============================================================================
// Score Range and Fallback Record
// ============================================================================

constexpr double SCORE_MIN = 1.0;
constexpr double SCORE_MAX = 5.0;

constexpr double FALLBACK_PACE = 3.5;
constexpr double FALLBACK_VOLUME = 4.0;
constexpr double FALLBACK_CLARITY = 3.8;
constexpr double FALLBACK_PAUSE_DURATION = 2.1;
constexpr double FALLBACK_TONAL_VARIATION = 3.2;
constexpr double FALLBACK_CONFIDENCE = 3.7;
constexpr double FALLBACK_ENTHUSIASM = 3.4;

// ============================================================================
// Diagnostics
// ============================================================================

/**
 * CLIPPING_RISK_DB - Whole-clip loudness at or above this is flagged as clipping risk
 */
constexpr double CLIPPING_RISK_DB = -1.0;

// ============================================================================
// Version Tracking
// ============================================================================

/**
 * CORE_CONTRACT_VERSION - Semantic version of this contract
 *
 * Stored with every persisted evaluation so history rows can be compared only
 * against rows produced by the same scoring model.
 */
constexpr const char* CORE_CONTRACT_VERSION = "1.0.0";

} // namespace contract
} // namespace voicescope

#include "voicescope/features/SpectralFeatures.h"
#include "voicescope/Errors.h"

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace voicescope {
namespace features {

namespace {

// fftw planner calls are not thread-safe; fftw_execute is.
std::mutex& planner_mutex() {
    static std::mutex m;
    return m;
}

// Buffers and plan for one real-to-complex transform of length n.
class RealFFT {
  public:
    explicit RealFFT(std::size_t n) : n_(n) {
        in_ = fftw_alloc_real(n_);
        out_ = fftw_alloc_complex(n_ / 2 + 1);
        if (!in_ || !out_) {
            release();
            throw AnalysisError(AnalysisStage::Spectral, "fftw_alloc failed");
        }
        {
            std::lock_guard<std::mutex> lock(planner_mutex());
            plan_ = fftw_plan_dft_r2c_1d(static_cast<int>(n_), in_, out_, FFTW_ESTIMATE);
        }
        if (!plan_) {
            release();
            throw AnalysisError(AnalysisStage::Spectral, "fftw_plan_dft_r2c_1d failed");
        }
    }

    ~RealFFT() { release(); }

    RealFFT(const RealFFT&) = delete;
    RealFFT& operator=(const RealFFT&) = delete;

    double* input() { return in_; }
    const fftw_complex* output() const { return out_; }
    void execute() { fftw_execute(plan_); }

  private:
    void release() {
        if (plan_) {
            std::lock_guard<std::mutex> lock(planner_mutex());
            fftw_destroy_plan(plan_);
            plan_ = nullptr;
        }
        if (in_) fftw_free(in_);
        if (out_) fftw_free(out_);
        in_ = nullptr;
        out_ = nullptr;
    }

    std::size_t n_;
    double* in_{nullptr};
    fftw_complex* out_{nullptr};
    fftw_plan plan_{nullptr};
};

} // namespace

SpectralFrame SpectralAnalyzer::analyze(const std::vector<float>& samples, int sampleRate, int frameSize) const {
    if (sampleRate <= 0) {
        throw AnalysisError(AnalysisStage::Spectral, "spectral analysis needs a positive sample rate");
    }
    if (frameSize < 2) {
        throw AnalysisError(AnalysisStage::Spectral, "spectral frame must hold at least two samples");
    }

    const std::size_t N = std::min<std::size_t>(static_cast<std::size_t>(frameSize), samples.size());
    if (N < 2) {
        throw AnalysisError(AnalysisStage::Spectral, "not enough samples for a spectrum");
    }

    RealFFT fft(N);
    double* x = fft.input();
    for (std::size_t n = 0; n < N; ++n) {
        x[n] = static_cast<double>(samples[n]);
        if (!std::isfinite(x[n])) {
            throw AnalysisError(AnalysisStage::Spectral, "non-finite sample in spectral frame");
        }
    }
    fft.execute();

    // r2c yields N/2+1 bins; only the first N/2 are kept (for odd N that is floor(N/2)).
    const std::size_t bins = N / 2;
    SpectralFrame frame;
    frame.magnitudes.resize(bins, 0.0);
    frame.binWidthHz = static_cast<double>(sampleRate) / (2.0 * static_cast<double>(bins));

    const fftw_complex* X = fft.output();
    for (std::size_t k = 0; k < bins; ++k) {
        frame.magnitudes[k] = std::hypot(X[k][0], X[k][1]);
    }

    return frame;
}

double SpectralAnalyzer::bandEnergy(const SpectralFrame& frame, double loHz, double hiHz) const {
    if (frame.magnitudes.empty() || !(frame.binWidthHz > 0.0)) return 0.0;

    const double lo = std::floor(std::max(0.0, loHz) / frame.binWidthHz);
    const double hi = std::floor(std::max(0.0, hiHz) / frame.binWidthHz);
    const double last = static_cast<double>(frame.magnitudes.size() - 1);
    if (lo > last || hi < lo) return 0.0;

    const std::size_t binMin = static_cast<std::size_t>(lo);
    const std::size_t binMax = static_cast<std::size_t>(std::min(hi, last));

    double energy = 0.0;
    for (std::size_t k = binMin; k <= binMax; ++k) energy += frame.magnitudes[k];
    return energy;
}

double SpectralAnalyzer::clarityRatio(const SpectralFrame& frame) const {
    const double speech = bandEnergy(frame, contract::SPEECH_BAND_LO_HZ, contract::SPEECH_BAND_HI_HZ);
    const double noise = bandEnergy(frame, 0.0, contract::SPEECH_BAND_LO_HZ) +
                         bandEnergy(frame, contract::SPEECH_BAND_HI_HZ, contract::NOISE_BAND_HI_HZ);
    const double ratio = speech / (speech + noise + contract::SCORE_EPS);
    if (!std::isfinite(ratio)) {
        throw AnalysisError(AnalysisStage::Spectral, "clarity ratio is not finite");
    }
    return ratio;
}

double SpectralAnalyzer::scoreClarity(double clarityRatio) const {
    if (clarityRatio > 0.8) return 5.0;
    if (clarityRatio > 0.6) return 4.0;
    if (clarityRatio > 0.4) return 3.0;
    if (clarityRatio > 0.2) return 2.0;
    return 1.0;
}

}  // namespace features
}  // namespace voicescope

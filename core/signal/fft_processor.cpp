#include "signal/fft_processor.hpp"
#include "signal/normalization.hpp"
#include "common/errors.hpp"

#include <unsupported/Eigen/FFT>

#include <fmt/format.h>

#include <cmath>
#include <complex>

namespace fraudscope {

FFTProcessor::FFTProcessor(double sample_rate) : sample_rate_(sample_rate) {
    if (!(sample_rate > 0.0)) {
        throw ConfigurationError(fmt::format("FFT sample rate must be positive, got {}", sample_rate));
    }
}

std::vector<double> magnitudeSpectrum(const std::vector<double>& signal) {
    if (signal.empty()) return {};
    // A one-point DFT is the point itself; kissfft has no radix-1 stage.
    if (signal.size() == 1) return {std::abs(signal[0])};

    Eigen::FFT<double> fft;
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, signal);

    std::vector<double> magnitudes;
    magnitudes.reserve(spectrum.size());
    for (const auto& bin : spectrum) {
        magnitudes.push_back(std::abs(bin));
    }
    return magnitudes;
}

std::vector<double> FFTProcessor::process(const TransactionDataset& dataset) const {
    return magnitudeSpectrum(zScoreNormalize(dataset.getAmounts()));
}

double FFTProcessor::frequencyResolution(size_t n) const {
    if (n == 0) return 0.0;
    return sample_rate_ / static_cast<double>(n);
}

} // namespace fraudscope

#include "signal/wavelet_processor.hpp"
#include "signal/normalization.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace fraudscope {

WaveletProcessor::WaveletProcessor(const std::string& wavelet_type, int level)
    : wavelet_(Wavelet::byName(wavelet_type)), level_(level) {
    if (level < 1) {
        throw ConfigurationError("Wavelet level must be at least 1, got " + std::to_string(level));
    }
}

std::vector<double> WaveletProcessor::process(const TransactionDataset& dataset) const {
    return denoise(zScoreNormalize(dataset.getAmounts()));
}

std::vector<double> WaveletProcessor::denoise(const std::vector<double>& normalized) const {
    WaveletCoefficients coeffs = wavedec(normalized, wavelet_, level_);

    // Keep only the approximation band
    for (auto& band : coeffs.details) {
        band.clear();
    }

    std::vector<double> filtered = waverec(coeffs, wavelet_);
    filtered.resize(normalized.size(), 0.0);
    logger()->debug("Wavelet {} level {} reconstructed {} samples",
                    wavelet_.name, level_, filtered.size());
    return filtered;
}

} // namespace fraudscope

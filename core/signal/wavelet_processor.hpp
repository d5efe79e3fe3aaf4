#pragma once

#include "signal/signal_processor.hpp"
#include "signal/wavelet.hpp"

namespace fraudscope {

/// Low-pass denoiser: decomposes the z-normalized amounts into `level`
/// bands, zeroes every detail band and reconstructs from the
/// approximation alone, truncated or zero-padded to the input length.
class WaveletProcessor : public SignalProcessor {
public:
    /// Throws ConfigurationError for an unknown wavelet or level < 1.
    explicit WaveletProcessor(const std::string& wavelet_type = "db4", int level = 5);

    /// Throws ConfigurationError if the series is too short for `level`.
    std::vector<double> process(const TransactionDataset& dataset) const override;
    std::string name() const override { return "Wavelet Transform (" + wavelet_.name + ")"; }

    const std::string& waveletType() const { return wavelet_.name; }
    int level() const { return level_; }

    /// The same filter applied to an already normalized series.
    std::vector<double> denoise(const std::vector<double>& normalized) const;

private:
    Wavelet wavelet_;
    int level_;
};

} // namespace fraudscope

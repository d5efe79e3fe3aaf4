#pragma once

#include "signal/signal_processor.hpp"

namespace fraudscope {

/// Magnitude spectrum of the z-normalized amount series, one bin per
/// transaction.
class FFTProcessor : public SignalProcessor {
public:
    /// Throws ConfigurationError if sample_rate is not positive.
    explicit FFTProcessor(double sample_rate = 1000.0);

    std::vector<double> process(const TransactionDataset& dataset) const override;
    std::string name() const override { return "Fast Fourier Transform"; }

    double sampleRate() const { return sample_rate_; }

    /// Width of one frequency bin for a series of n samples (Hz).
    double frequencyResolution(size_t n) const;

private:
    double sample_rate_;
};

/// |DFT(signal)|, same length as the input.
std::vector<double> magnitudeSpectrum(const std::vector<double>& signal);

} // namespace fraudscope

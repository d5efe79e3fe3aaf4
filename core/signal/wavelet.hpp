#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fraudscope {

// ─── Wavelet filter bank ───────────────────────────────────────
// Orthogonal Daubechies family. Decomposition filters are the
// time-reversed reconstruction filters; high-pass filters are the
// quadrature mirrors of the low-pass ones.

struct Wavelet {
    std::string name;
    std::vector<double> dec_lo;
    std::vector<double> dec_hi;
    std::vector<double> rec_lo;
    std::vector<double> rec_hi;

    size_t filterLength() const { return rec_lo.size(); }

    /// "haar"/"db1", "db2", "db3", "db4". Throws ConfigurationError otherwise.
    static Wavelet byName(const std::string& name);
    static bool isSupported(const std::string& name);
};

/// One approximation band and `level` detail bands, coarsest first:
/// {cA_n, cD_n, cD_{n-1}, ..., cD_1}.
struct WaveletCoefficients {
    std::vector<double> approximation;
    std::vector<std::vector<double>> details;   // coarsest first
    std::vector<size_t> input_lengths;          // signal length entering each level, finest first
};

/// Deepest useful level: max L with (filter_length - 1) * 2^L <= n.
int maxDecompositionLevel(size_t signal_length, size_t filter_length);

/// Single-level DWT with symmetric (half-sample) boundary extension.
/// Output bands have length floor((n + F - 1) / 2).
void dwt(const std::vector<double>& signal, const Wavelet& wavelet,
         std::vector<double>& approximation, std::vector<double>& detail);

/// Inverse of dwt(). An empty detail band is treated as all zeros.
/// Output length is 2 * n - F + 2 for n coefficients.
std::vector<double> idwt(const std::vector<double>& approximation,
                         const std::vector<double>& detail, const Wavelet& wavelet);

/// Multi-level decomposition. Throws ConfigurationError if level < 1 or
/// level exceeds maxDecompositionLevel().
WaveletCoefficients wavedec(const std::vector<double>& signal, const Wavelet& wavelet, int level);

/// Multi-level reconstruction, trimming each level to the length that
/// entered the matching decomposition step.
std::vector<double> waverec(const WaveletCoefficients& coeffs, const Wavelet& wavelet);

} // namespace fraudscope

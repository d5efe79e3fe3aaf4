#include "signal/wavelet.hpp"
#include "common/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fraudscope {

namespace {

// Daubechies reconstruction low-pass filters.
const std::vector<double> kDb1 = {
    0.7071067811865476, 0.7071067811865476,
};
const std::vector<double> kDb2 = {
    0.48296291314469025, 0.836516303737469, 0.22414386804185735, -0.12940952255092145,
};
const std::vector<double> kDb3 = {
    0.3326705529509569, 0.8068915093133388, 0.4598775021193313,
    -0.13501102001039084, -0.08544127388224149, 0.035226291882100656,
};
const std::vector<double> kDb4 = {
    0.23037781330885523, 0.7148465705525415, 0.6308807679295904, -0.02798376941698385,
    -0.18703481171888114, 0.030841381835986965, 0.032883011666982945, -0.010597401784997278,
};

const std::vector<double>* lowPassFor(const std::string& name) {
    if (name == "haar" || name == "db1") return &kDb1;
    if (name == "db2") return &kDb2;
    if (name == "db3") return &kDb3;
    if (name == "db4") return &kDb4;
    return nullptr;
}

/// Half-sample symmetric extension: x[-1] = x[0], x[n] = x[n-1], ...
size_t reflectIndex(long long idx, size_t n) {
    const long long period = 2 * static_cast<long long>(n);
    long long k = ((idx % period) + period) % period;
    if (k >= static_cast<long long>(n)) k = period - 1 - k;
    return static_cast<size_t>(k);
}

std::vector<double> downsampleConvolve(const std::vector<double>& x,
                                       const std::vector<double>& filter) {
    const size_t n = x.size();
    const size_t f = filter.size();
    std::vector<double> out;
    out.reserve((n + f - 1) / 2);
    for (size_t i = 1; i < n + f - 1; i += 2) {
        double sum = 0.0;
        for (size_t j = 0; j < f; j++) {
            sum += filter[j] * x[reflectIndex(static_cast<long long>(i) - static_cast<long long>(j), n)];
        }
        out.push_back(sum);
    }
    return out;
}

/// Upsample by two and keep only the fully-overlapped part of the
/// convolution, accumulating into `out`.
void upsampleConvolveValid(const std::vector<double>& coeffs,
                           const std::vector<double>& filter, std::vector<double>& out) {
    const size_t half = filter.size() / 2;
    size_t o = 0;
    for (size_t i = half - 1; i < coeffs.size(); i++, o += 2) {
        double even = 0.0;
        double odd = 0.0;
        for (size_t j = 0; j < half; j++) {
            even += filter[2 * j] * coeffs[i - j];
            odd += filter[2 * j + 1] * coeffs[i - j];
        }
        out[o] += even;
        out[o + 1] += odd;
    }
}

} // namespace

// ─── Wavelet ───────────────────────────────────────────────────

bool Wavelet::isSupported(const std::string& name) {
    return lowPassFor(name) != nullptr;
}

Wavelet Wavelet::byName(const std::string& name) {
    const std::vector<double>* lo = lowPassFor(name);
    if (!lo) {
        throw ConfigurationError("Unsupported wavelet: " + name);
    }

    Wavelet w;
    w.name = name;
    w.rec_lo = *lo;
    const size_t f = w.rec_lo.size();
    w.rec_hi.resize(f);
    for (size_t k = 0; k < f; k++) {
        double sign = (k % 2 == 0) ? 1.0 : -1.0;
        w.rec_hi[k] = sign * w.rec_lo[f - 1 - k];
    }
    w.dec_lo.assign(w.rec_lo.rbegin(), w.rec_lo.rend());
    w.dec_hi.assign(w.rec_hi.rbegin(), w.rec_hi.rend());
    return w;
}

// ─── Single level ──────────────────────────────────────────────

int maxDecompositionLevel(size_t signal_length, size_t filter_length) {
    if (filter_length < 2 || signal_length < filter_length - 1) return 0;
    int level = 0;
    while ((filter_length - 1) << (level + 1) <= signal_length) {
        level++;
    }
    return level;
}

void dwt(const std::vector<double>& signal, const Wavelet& wavelet,
         std::vector<double>& approximation, std::vector<double>& detail) {
    if (signal.empty()) {
        approximation.clear();
        detail.clear();
        return;
    }
    approximation = downsampleConvolve(signal, wavelet.dec_lo);
    detail = downsampleConvolve(signal, wavelet.dec_hi);
}

std::vector<double> idwt(const std::vector<double>& approximation,
                         const std::vector<double>& detail, const Wavelet& wavelet) {
    const size_t f = wavelet.filterLength();
    const size_t n = approximation.size();
    if (!detail.empty() && detail.size() != n) {
        throw std::invalid_argument(fmt::format(
            "Mismatched band lengths: approximation {} vs detail {}", n, detail.size()));
    }
    if (2 * n + 2 <= f) return {};

    std::vector<double> out(2 * n + 2 - f, 0.0);
    upsampleConvolveValid(approximation, wavelet.rec_lo, out);
    if (!detail.empty()) {
        upsampleConvolveValid(detail, wavelet.rec_hi, out);
    }
    return out;
}

// ─── Multi level ───────────────────────────────────────────────

WaveletCoefficients wavedec(const std::vector<double>& signal, const Wavelet& wavelet, int level) {
    int max_level = maxDecompositionLevel(signal.size(), wavelet.filterLength());
    if (level < 1 || level > max_level) {
        throw ConfigurationError(fmt::format(
            "Wavelet level {} invalid for {} samples with {} (maximum {})",
            level, signal.size(), wavelet.name, max_level));
    }

    WaveletCoefficients coeffs;
    std::vector<double> current = signal;
    for (int l = 0; l < level; l++) {
        std::vector<double> approx, detail;
        coeffs.input_lengths.push_back(current.size());
        dwt(current, wavelet, approx, detail);
        coeffs.details.push_back(std::move(detail));
        current = std::move(approx);
    }
    std::reverse(coeffs.details.begin(), coeffs.details.end());
    coeffs.approximation = std::move(current);
    return coeffs;
}

std::vector<double> waverec(const WaveletCoefficients& coeffs, const Wavelet& wavelet) {
    const size_t levels = coeffs.input_lengths.size();
    std::vector<double> current = coeffs.approximation;
    for (size_t j = levels; j-- > 0;) {
        const std::vector<double>& detail = coeffs.details.at(levels - 1 - j);
        current = idwt(current, detail, wavelet);
        current.resize(coeffs.input_lengths[j], 0.0);
    }
    return current;
}

} // namespace fraudscope

#include <gtest/gtest.h>
#include "signal/normalization.hpp"
#include "signal/fft_processor.hpp"
#include "signal/wavelet.hpp"
#include "signal/wavelet_processor.hpp"
#include "common/errors.hpp"

#include <cmath>

using namespace fraudscope;

namespace {

TransactionDataset datasetOf(const std::vector<double>& amounts) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < amounts.size(); i++) {
        lines.push_back(std::to_string(i) + "," + std::to_string(amounts[i]) + ",M,C");
    }
    return TransactionDataset::build(lines, DatasetType::CreditCard);
}

std::vector<double> ramp(size_t n) {
    std::vector<double> out;
    for (size_t i = 0; i < n; i++) {
        out.push_back(std::sin(0.7 * static_cast<double>(i)) + 0.1 * static_cast<double>(i));
    }
    return out;
}

} // namespace

// ─── Normalization ─────────────────────────────────────────────

TEST(NormalizationTest, PopulationStatistics) {
    SeriesStats s = computeStats({100, 250, 5000});
    EXPECT_NEAR(s.mean, 1783.3333, 1e-3);
    EXPECT_NEAR(s.stddev, 2275.3510, 1e-3);
    EXPECT_FALSE(s.degenerate());
}

TEST(NormalizationTest, ZScoresHaveZeroMeanUnitSpread) {
    std::vector<double> z = zScoreNormalize({100, 250, 5000, 42, 7});
    SeriesStats s = computeStats(z);
    EXPECT_NEAR(s.mean, 0.0, 1e-12);
    EXPECT_NEAR(s.stddev, 1.0, 1e-12);
}

TEST(NormalizationTest, ConstantSeriesMapsToZeros) {
    SeriesStats s = computeStats({0.1, 0.1, 0.1});
    EXPECT_TRUE(s.degenerate());
    EXPECT_EQ(zScoreNormalize({0.1, 0.1, 0.1}), (std::vector<double>{0, 0, 0}));
    EXPECT_TRUE(zScoreNormalize({}).empty());
}

// ─── FFT ───────────────────────────────────────────────────────

TEST(FFTProcessorTest, OutputLengthMatchesInput) {
    FFTProcessor fft;
    EXPECT_EQ(fft.process(datasetOf({100, 250, 5000})).size(), 3);
    EXPECT_EQ(fft.process(datasetOf({1, 2, 3, 4, 5, 6, 7})).size(), 7);
    EXPECT_EQ(fft.name(), "Fast Fourier Transform");
}

TEST(FFTProcessorTest, DcBinOfNormalizedSignalIsZero) {
    FFTProcessor fft;
    std::vector<double> spectrum = fft.process(datasetOf({100, 250, 5000}));
    EXPECT_NEAR(spectrum[0], 0.0, 1e-9);
    EXPECT_NEAR(spectrum[1], 2.1213203, 1e-6);
    EXPECT_NEAR(spectrum[2], spectrum[1], 1e-9);
    for (double m : spectrum) {
        EXPECT_GE(m, 0.0);
    }
}

TEST(FFTProcessorTest, MagnitudeSpectrumEdgeCases) {
    EXPECT_TRUE(magnitudeSpectrum({}).empty());
    EXPECT_EQ(magnitudeSpectrum({-3.0}), (std::vector<double>{3.0}));

    std::vector<double> spectrum = magnitudeSpectrum({1, 0, -1, 0});
    ASSERT_EQ(spectrum.size(), 4);
    EXPECT_NEAR(spectrum[0], 0.0, 1e-12);
    EXPECT_NEAR(spectrum[1], 2.0, 1e-12);
    EXPECT_NEAR(spectrum[2], 0.0, 1e-12);
    EXPECT_NEAR(spectrum[3], 2.0, 1e-12);
}

TEST(FFTProcessorTest, ConstantAmountsGiveZeroSpectrum) {
    FFTProcessor fft;
    for (double m : fft.process(datasetOf({50, 50, 50, 50}))) {
        EXPECT_DOUBLE_EQ(m, 0.0);
    }
}

TEST(FFTProcessorTest, SampleRateValidated) {
    EXPECT_THROW(FFTProcessor(0.0), ConfigurationError);
    EXPECT_THROW(FFTProcessor(-10.0), ConfigurationError);
    FFTProcessor fft(500.0);
    EXPECT_DOUBLE_EQ(fft.sampleRate(), 500.0);
    EXPECT_DOUBLE_EQ(fft.frequencyResolution(100), 5.0);
}

// ─── Wavelet filter bank ───────────────────────────────────────

TEST(WaveletTest, SupportedNames) {
    EXPECT_TRUE(Wavelet::isSupported("haar"));
    EXPECT_TRUE(Wavelet::isSupported("db4"));
    EXPECT_FALSE(Wavelet::isSupported("sym5"));
    EXPECT_EQ(Wavelet::byName("db1").filterLength(), 2);
    EXPECT_EQ(Wavelet::byName("db4").filterLength(), 8);
    EXPECT_THROW(Wavelet::byName("coif1"), ConfigurationError);
}

TEST(WaveletTest, FiltersAreOrthonormal) {
    for (const char* name : {"haar", "db2", "db3", "db4"}) {
        Wavelet w = Wavelet::byName(name);
        double energy = 0.0;
        double cross = 0.0;
        for (size_t k = 0; k < w.filterLength(); k++) {
            energy += w.rec_lo[k] * w.rec_lo[k];
            cross += w.rec_lo[k] * w.rec_hi[k];
        }
        EXPECT_NEAR(energy, 1.0, 1e-9) << name;
        EXPECT_NEAR(cross, 0.0, 1e-9) << name;
    }
}

TEST(WaveletTest, MaxDecompositionLevel) {
    EXPECT_EQ(maxDecompositionLevel(16, 4), 2);
    EXPECT_EQ(maxDecompositionLevel(3, 2), 1);
    EXPECT_EQ(maxDecompositionLevel(3, 8), 0);
    EXPECT_EQ(maxDecompositionLevel(1024, 8), 7);
}

TEST(WaveletTest, HaarSingleLevel) {
    Wavelet haar = Wavelet::byName("haar");
    std::vector<double> approx, detail;
    dwt({1, 3, 5, 7}, haar, approx, detail);
    ASSERT_EQ(approx.size(), 2);
    EXPECT_NEAR(approx[0], 4.0 / std::sqrt(2.0), 1e-12);
    EXPECT_NEAR(approx[1], 12.0 / std::sqrt(2.0), 1e-12);
    EXPECT_NEAR(detail[0], -2.0 / std::sqrt(2.0), 1e-12);
    EXPECT_NEAR(detail[1], -2.0 / std::sqrt(2.0), 1e-12);
}

TEST(WaveletTest, PerfectReconstructionWithDetails) {
    struct Case { const char* name; size_t n; int level; };
    for (const Case& c : {Case{"haar", 7, 2}, Case{"db2", 16, 2}, Case{"db3", 23, 2},
                          Case{"db4", 40, 2}}) {
        Wavelet w = Wavelet::byName(c.name);
        std::vector<double> signal = ramp(c.n);
        std::vector<double> rebuilt = waverec(wavedec(signal, w, c.level), w);
        ASSERT_EQ(rebuilt.size(), signal.size()) << c.name;
        for (size_t i = 0; i < signal.size(); i++) {
            EXPECT_NEAR(rebuilt[i], signal[i], 1e-9) << c.name << " at " << i;
        }
    }
}

TEST(WaveletTest, DecompositionShape) {
    Wavelet w = Wavelet::byName("db2");
    WaveletCoefficients c = wavedec(ramp(16), w, 2);
    ASSERT_EQ(c.details.size(), 2);
    EXPECT_EQ(c.input_lengths, (std::vector<size_t>{16, 9}));
    EXPECT_EQ(c.details[1].size(), 9);      // finest
    EXPECT_EQ(c.details[0].size(), 6);      // coarsest
    EXPECT_EQ(c.approximation.size(), 6);
}

TEST(WaveletTest, InvalidLevelRejected) {
    Wavelet db4 = Wavelet::byName("db4");
    EXPECT_THROW(wavedec({1, 2, 3}, db4, 1), ConfigurationError);
    EXPECT_THROW(wavedec(ramp(64), db4, 0), ConfigurationError);
    EXPECT_THROW(wavedec(ramp(64), db4, 4), ConfigurationError);
}

TEST(WaveletTest, IdwtRejectsMismatchedBands) {
    Wavelet haar = Wavelet::byName("haar");
    EXPECT_THROW(idwt({1, 2, 3}, {1, 2}, haar), std::invalid_argument);
}

// ─── WaveletProcessor ──────────────────────────────────────────

TEST(WaveletProcessorTest, Defaults) {
    WaveletProcessor p;
    EXPECT_EQ(p.waveletType(), "db4");
    EXPECT_EQ(p.level(), 5);
    EXPECT_EQ(p.name(), "Wavelet Transform (db4)");
}

TEST(WaveletProcessorTest, ConstructionValidated) {
    EXPECT_THROW(WaveletProcessor("morlet", 1), ConfigurationError);
    EXPECT_THROW(WaveletProcessor("db2", 0), ConfigurationError);
}

TEST(WaveletProcessorTest, HaarDenoiseAveragesPairs) {
    WaveletProcessor p("haar", 1);
    std::vector<double> out = p.denoise({1, 3, 5, 7});
    ASSERT_EQ(out.size(), 4);
    EXPECT_NEAR(out[0], 2.0, 1e-12);
    EXPECT_NEAR(out[1], 2.0, 1e-12);
    EXPECT_NEAR(out[2], 6.0, 1e-12);
    EXPECT_NEAR(out[3], 6.0, 1e-12);
}

TEST(WaveletProcessorTest, OutputLengthMatchesInput) {
    WaveletProcessor haar("haar", 1);
    EXPECT_EQ(haar.process(datasetOf({100, 250, 5000})).size(), 3);

    WaveletProcessor db4("db4", 2);
    std::vector<double> amounts(37);
    for (size_t i = 0; i < amounts.size(); i++) amounts[i] = 100.0 + 13.0 * (i % 5);
    EXPECT_EQ(db4.process(datasetOf(amounts)).size(), 37);
}

TEST(WaveletProcessorTest, ConstantSignalStaysFlat) {
    WaveletProcessor p("db2", 2);
    for (double v : p.process(datasetOf(std::vector<double>(16, 42.0)))) {
        EXPECT_NEAR(v, 0.0, 1e-12);
    }
}

TEST(WaveletProcessorTest, SeriesTooShortForLevel) {
    WaveletProcessor p("db4", 1);
    EXPECT_THROW(p.process(datasetOf({100, 250, 5000})), ConfigurationError);
}

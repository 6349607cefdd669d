#include "psd_estimator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <boost/math/constants/constants.hpp>

namespace {
constexpr size_t FFT_LEN = 64;

// Unit-amplitude complex tone exactly on FFT bin `k`.
std::vector<std::complex<float>> tone(size_t k) {
    const double two_pi = boost::math::constants::two_pi<double>();
    std::vector<std::complex<float>> data(FFT_LEN);
    for (size_t n = 0; n < FFT_LEN; ++n) {
        double phase = two_pi * static_cast<double>(k * n) / FFT_LEN;
        data[n] = std::complex<float>(static_cast<float>(std::cos(phase)), static_cast<float>(std::sin(phase)));
    }
    return data;
}
}

TEST(PsdEstimatorTest, ToneLandsOnShiftedBin) {
    PsdEstimator estimator(FFT_LEN, 1, "none");
    std::vector<double> psd;
    ASSERT_TRUE(estimator.process_block(tone(8), psd));
    ASSERT_EQ(psd.size(), FFT_LEN);

    // DC sits at FFT_LEN / 2 after the shift.
    const size_t expected = FFT_LEN / 2 + 8;
    size_t loudest = static_cast<size_t>(std::max_element(psd.begin(), psd.end()) - psd.begin());
    EXPECT_EQ(loudest, expected);
    EXPECT_NEAR(psd[expected], 0.0, 0.01);
    EXPECT_LT(psd[FFT_LEN / 2], -60.0);
}

TEST(PsdEstimatorTest, AveragesBeforeReporting) {
    PsdEstimator estimator(FFT_LEN, 3, "hann");
    std::vector<double> psd;
    EXPECT_FALSE(estimator.process_block(tone(4), psd));
    EXPECT_FALSE(estimator.process_block(tone(4), psd));
    EXPECT_EQ(estimator.pending_blocks(), 2u);
    EXPECT_TRUE(estimator.process_block(tone(4), psd));
    EXPECT_EQ(estimator.pending_blocks(), 0u);
    size_t loudest = static_cast<size_t>(std::max_element(psd.begin(), psd.end()) - psd.begin());
    EXPECT_EQ(loudest, FFT_LEN / 2 + 4);
}

TEST(PsdEstimatorTest, ResetDiscardsPartialAverage) {
    PsdEstimator estimator(FFT_LEN, 2, "hamming");
    std::vector<double> psd;
    estimator.process_block(tone(2), psd);
    estimator.reset();
    EXPECT_EQ(estimator.pending_blocks(), 0u);
    EXPECT_FALSE(estimator.process_block(tone(2), psd));
}

TEST(PsdEstimatorTest, RejectsBadInput) {
    EXPECT_THROW(PsdEstimator(FFT_LEN, 1, "kaiser"), std::runtime_error);
    EXPECT_THROW(PsdEstimator(0, 1, "hann"), std::runtime_error);
    EXPECT_THROW(PsdEstimator(FFT_LEN, 0, "hann"), std::runtime_error);

    PsdEstimator estimator(FFT_LEN, 1, "BlackmanHarris");
    std::vector<double> psd;
    EXPECT_THROW(estimator.process_block(std::vector<std::complex<float>>(FFT_LEN / 2), psd), std::invalid_argument);
}

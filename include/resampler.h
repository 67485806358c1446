#pragma once

#include <cstddef>
#include <vector>

namespace voicekit {

/**
 * @brief Streaming linear-interpolation resampler to RECOGNIZER_SAMPLE_RATE
 *
 * Keeps its phase and the previous block's last sample, so feeding a signal
 * in blocks gives the same output as feeding it at once. Input at the target
 * rate passes through unchanged. Not thread-safe.
 */
class LinearResampler {
public:
    explicit LinearResampler(double input_rate);

    /**
     * @brief Resample one block and append the result to out
     */
    void process(const float* in, size_t n, std::vector<float>& out);

private:
    double step_;
    double position_;  ///< Read position in the current block; -1 is the previous block's last sample
    float last_;
};

} // namespace voicekit

#include "resampler.h"
#include "common.h"
#include <cmath>

namespace voicekit {

LinearResampler::LinearResampler(double input_rate)
    : step_(input_rate / RECOGNIZER_SAMPLE_RATE), position_(0.0), last_(0.0f) {}

void LinearResampler::process(const float* in, size_t n, std::vector<float>& out) {
    if (n == 0) return;
    if (std::fabs(step_ - 1.0) < 1e-9) {
        out.insert(out.end(), in, in + n);
        return;
    }

    const double last_index = static_cast<double>(n) - 1.0;
    while (position_ <= last_index) {
        double floor_pos = std::floor(position_);
        long i = static_cast<long>(floor_pos);
        double frac = position_ - floor_pos;
        float a = i < 0 ? last_ : in[i];
        float b = (i + 1 < static_cast<long>(n)) ? in[i + 1] : a;
        out.push_back(static_cast<float>(a + (b - a) * frac));
        position_ += step_;
    }
    position_ -= static_cast<double>(n);
    last_ = in[n - 1];
}

} // namespace voicekit

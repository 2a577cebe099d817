#include <cmath>
#include <micrograd/data/moons.hpp>
#include <numbers>

namespace micrograd::data {

std::vector<std::vector<float>> Moons::rows() const {
    std::vector<std::vector<float>> result;
    result.reserve(size());

    for (std::size_t i = 0; i < size(); ++i)
        result.push_back({x1[i], x2[i]});

    return result;
}

std::vector<float> linspace(float lo, float hi, std::size_t n) {
    if (n == 0)
        return {};
    if (n == 1)
        return {lo};

    const float step = (hi - lo) / static_cast<float>(n - 1);

    std::vector<float> points;
    points.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        points.push_back(lo + step * static_cast<float>(i));

    points.back() = hi;
    return points;
}

Moons make_moons(std::size_t n_samples, bool shuffle, float noise,
                 std::mt19937& rng) {
    MICROGRAD_THROW_IF(noise < 0.0f, InvalidArgument,
                       "Noise must be non-negative, got {}", noise);

    const auto angles = linspace(0.0f, std::numbers::pi_v<float>, n_samples);

    Moons moons;
    moons.x1.reserve(2 * n_samples);
    moons.x2.reserve(2 * n_samples);
    moons.labels.reserve(2 * n_samples);

    for (float t : angles) {
        moons.x1.push_back(std::cos(t));
        moons.x2.push_back(std::sin(t));
        moons.labels.push_back(0.0f);
    }

    for (float t : angles) {
        moons.x1.push_back(1.0f - std::cos(t));
        moons.x2.push_back(0.5f - std::sin(t));
        moons.labels.push_back(1.0f);
    }

    if (shuffle)
        shuffle_together(rng, moons.x1, moons.x2, moons.labels);

    if (noise > 0.0f) {
        std::normal_distribution<float> gaussian(0.0f, noise);
        for (std::size_t i = 0; i < moons.size(); ++i) {
            moons.x1[i] += gaussian(rng);
            moons.x2[i] += gaussian(rng);
        }
    }

    return moons;
}

std::vector<float> to_signed_labels(const std::vector<float>& labels) {
    std::vector<float> result;
    result.reserve(labels.size());

    for (float label : labels)
        result.push_back(label * 2.0f - 1.0f);

    return result;
}

}  // namespace micrograd::data

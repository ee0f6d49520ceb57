#include "posescope/SeriesMath.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace posescope {

double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    const std::size_t n = v.size();
    std::nth_element(v.begin(), v.begin() + n/2, v.end());
    double med = v[n/2];
    if (n % 2 == 0) {
        auto it = std::max_element(v.begin(), v.begin() + n/2);
        med = 0.5 * (med + *it);
    }
    return med;
}

double quantile(std::vector<double> v, double q) {
    if (v.empty()) return 0.0;
    q = std::clamp(q, 0.0, 1.0);

    const double pos = q * (v.size() - 1);
    const std::size_t k = static_cast<std::size_t>(std::floor(pos));
    const std::size_t k2 = std::min(k + 1, v.size() - 1);
    const double frac = pos - static_cast<double>(k);

    std::nth_element(v.begin(), v.begin() + k, v.end());
    const double a = v[k];
    if (k2 == k) return a;

    std::nth_element(v.begin(), v.begin() + k2, v.end());
    const double b = v[k2];
    return a + frac * (b - a);
}

std::vector<double> masked_moving_average(const std::vector<double>& x,
                                          const std::vector<std::uint8_t>& valid,
                                          std::size_t window) {
    if (x.size() != valid.size()) throw std::invalid_argument("x/valid size mismatch");
    if (window == 0) throw std::invalid_argument("smoothing window must be >= 1");
    const std::size_t n = x.size();
    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> y(n, kNaN);
    // Even windows take the extra frame from the earlier side.
    const std::size_t before = window / 2;
    const std::size_t after = window - 1 - before;
    for (std::size_t i = 0; i < n; ++i) {
        if (!valid[i]) continue;
        if (window <= 1) { y[i] = x[i]; continue; }
        const std::size_t a = (i > before) ? (i - before) : 0;
        const std::size_t b = std::min(n - 1, i + after);
        double acc = 0.0;
        std::size_t cnt = 0;
        for (std::size_t j = a; j <= b; ++j) {
            if (!valid[j]) continue;
            acc += x[j];
            ++cnt;
        }
        y[i] = acc / static_cast<double>(cnt);
    }
    return y;
}

std::vector<double> moving_median(const std::vector<double>& x, std::size_t window) {
    if (window == 0) throw std::invalid_argument("median window must be >= 1");
    const std::size_t n = x.size();
    const std::size_t before = window / 2;
    const std::size_t after = window - 1 - before;
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t a = (i > before) ? (i - before) : 0;
        const std::size_t b = std::min(n - 1, i + after);
        out[i] = median(std::vector<double>(x.begin() + a, x.begin() + b + 1));
    }
    return out;
}

std::size_t count_moving_median_outliers(const std::vector<double>& x,
                                         std::size_t window,
                                         double madMultiplier,
                                         double zeroMadThreshold) {
    if (window == 0) throw std::invalid_argument("median window must be >= 1");
    if (x.size() < window) return 0;

    const std::vector<double> med = moving_median(x, window);
    std::vector<double> deviation(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) deviation[i] = std::abs(x[i] - med[i]);

    const double mad = median(deviation);
    const double threshold = (mad != 0.0) ? madMultiplier * mad : zeroMadThreshold;
    return static_cast<std::size_t>(
        std::count_if(deviation.begin(), deviation.end(), [&](double d) { return d > threshold; }));
}

std::vector<double> defined_values(const std::vector<MaybeValue>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (v) out.push_back(*v);
    }
    return out;
}

MaybeValue mean_of_defined(const std::vector<MaybeValue>& values) {
    double acc = 0.0;
    std::size_t cnt = 0;
    for (const auto& v : values) {
        if (!v) continue;
        acc += *v;
        ++cnt;
    }
    if (cnt == 0) return std::nullopt;
    return acc / static_cast<double>(cnt);
}

std::vector<MaybeValue> bin_means(const std::vector<MaybeValue>& values, std::size_t perBin) {
    if (perBin == 0) throw std::invalid_argument("bin size must be >= 1");
    std::vector<MaybeValue> out;
    out.reserve(values.size() / perBin + 1);
    for (std::size_t start = 0; start < values.size(); start += perBin) {
        const std::size_t end = std::min(values.size(), start + perBin);
        out.push_back(mean_of_defined(std::vector<MaybeValue>(values.begin() + start, values.begin() + end)));
    }
    return out;
}

} // namespace posescope

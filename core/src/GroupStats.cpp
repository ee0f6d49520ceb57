#include "posescope/GroupStats.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace posescope {

namespace {

struct Moments {
    std::size_t n{0};
    double mean{0.0};
    double variance{0.0};   // sample variance (n-1), 0 when n < 2
};

std::vector<double> finite_only(const std::vector<double>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) out.push_back(v);
    }
    return out;
}

Moments moments(const std::vector<double>& v) {
    Moments m;
    m.n = v.size();
    if (m.n == 0) return m;
    double acc = 0.0;
    for (double x : v) acc += x;
    m.mean = acc / static_cast<double>(m.n);
    if (m.n < 2) return m;
    double ss = 0.0;
    for (double x : v) ss += (x - m.mean) * (x - m.mean);
    m.variance = ss / static_cast<double>(m.n - 1);
    return m;
}

// Modified Lentz evaluation of the continued fraction for I_x(a, b)
double beta_continued_fraction(double a, double b, double x) {
    constexpr int kMaxIterations = 300;
    constexpr double kEps = 1e-15;
    constexpr double kTiny = 1e-300;

    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;
    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < kTiny) d = kTiny;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= kMaxIterations; ++m) {
        const double m2 = 2.0 * m;
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kTiny) d = kTiny;
        c = 1.0 + aa / c;
        if (std::abs(c) < kTiny) c = kTiny;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kTiny) d = kTiny;
        c = 1.0 + aa / c;
        if (std::abs(c) < kTiny) c = kTiny;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < kEps) break;
    }
    return h;
}

}  // namespace

double regularized_incomplete_beta(double a, double b, double x) {
    if (!(a > 0.0) || !(b > 0.0)) {
        throw std::invalid_argument("incomplete beta needs a > 0 and b > 0");
    }
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double lnFront = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                           a * std::log(x) + b * std::log1p(-x);
    const double front = std::exp(lnFront);

    // The fraction converges fast for x < (a+1)/(a+b+2); use symmetry otherwise.
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * beta_continued_fraction(a, b, x) / a;
    }
    return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
}

double student_t_two_tailed_p(double t, double df) {
    if (!(df > 0.0)) {
        throw std::invalid_argument("degrees of freedom must be > 0");
    }
    if (std::isinf(t)) return 0.0;
    const double x = df / (df + t * t);
    return std::clamp(regularized_incomplete_beta(0.5 * df, 0.5, x), 0.0, 1.0);
}

GroupSummary GroupwiseStatsEngine::describe(const std::string& label, const std::vector<double>& values) const {
    const Moments m = moments(finite_only(values));
    GroupSummary s;
    s.label = label;
    s.n = m.n;
    if (m.n >= 1) s.mean = m.mean;
    if (m.n >= 2) {
        s.standardDeviation = std::sqrt(m.variance);
        s.standardError = std::sqrt(m.variance / static_cast<double>(m.n));
    }
    return s;
}

GroupComparison GroupwiseStatsEngine::compare(const std::vector<double>& first,
                                              const std::vector<double>& second) const {
    GroupComparison c;
    const Moments a = moments(finite_only(first));
    const Moments b = moments(finite_only(second));
    if (a.n < 2 || b.n < 2) return c;

    const double va = a.variance / static_cast<double>(a.n);
    const double vb = b.variance / static_cast<double>(b.n);
    const double se2 = va + vb;
    if (!(se2 > 0.0)) return c;

    const double diff = a.mean - b.mean;
    const double t = diff / std::sqrt(se2);
    const double df = (se2 * se2) / (va * va / static_cast<double>(a.n - 1) + vb * vb / static_cast<double>(b.n - 1));

    c.tStatistic = t;
    c.degreesOfFreedom = df;
    c.pValue = student_t_two_tailed_p(t, df);
    c.effectSize = diff / std::sqrt(0.5 * (a.variance + b.variance));
    return c;
}

GroupStat GroupwiseStatsEngine::compareGroups(const std::string& firstLabel,
                                              const std::vector<double>& first,
                                              const std::string& secondLabel,
                                              const std::vector<double>& second) const {
    GroupStat stat;
    stat.first = describe(firstLabel, first);
    stat.second = describe(secondLabel, second);
    stat.comparison = compare(first, second);
    return stat;
}

}  // namespace posescope

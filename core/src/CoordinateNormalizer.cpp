#include "posescope/CoordinateNormalizer.h"
#include "posescope/CoreContract.h"
#include "posescope/SeriesMath.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace posescope {

namespace {

constexpr std::array<Point2, 4> kUnitCorners{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}}};

void check_threshold(double theta) {
    if (!(theta >= 0.0 && theta <= 1.0)) {
        throw std::invalid_argument("likelihood threshold must lie in [0,1]");
    }
}

bool sample_valid(const LandmarkTrack& lm, std::size_t f, double theta) {
    return std::isfinite(lm.x[f]) && std::isfinite(lm.y[f]) && lm.likelihood[f] >= theta;
}

}  // namespace

AffineTransform AffineTransform::fit(const std::vector<Point2>& from, const std::vector<Point2>& to) {
    if (from.size() != to.size()) {
        throw std::invalid_argument("affine fit: point count mismatch");
    }
    const std::size_t n = from.size();
    if (n < contract::ARENA_MIN_MARKERS) {
        throw std::invalid_argument("affine fit needs at least 3 points");
    }

    // Centre the sources so the normal equations split into a 2x2 system.
    double mx = 0.0, my = 0.0, mu = 0.0, mv = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        mx += from[i].x;
        my += from[i].y;
        mu += to[i].x;
        mv += to[i].y;
    }
    mx /= n;
    my /= n;
    mu /= n;
    mv /= n;

    double sxx = 0.0, sxy = 0.0, syy = 0.0;
    double sxu = 0.0, syu = 0.0, sxv = 0.0, syv = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = from[i].x - mx;
        const double dy = from[i].y - my;
        const double du = to[i].x - mu;
        const double dv = to[i].y - mv;
        sxx += dx * dx;
        sxy += dx * dy;
        syy += dy * dy;
        sxu += dx * du;
        syu += dy * du;
        sxv += dx * dv;
        syv += dy * dv;
    }

    const double det = sxx * syy - sxy * sxy;
    if (!(sxx > 0.0 && syy > 0.0) || det <= 1e-12 * sxx * syy) {
        throw std::invalid_argument("affine fit: points are collinear");
    }

    AffineTransform t;
    t.a_ = (sxu * syy - syu * sxy) / det;
    t.b_ = (syu * sxx - sxu * sxy) / det;
    t.c_ = mu - t.a_ * mx - t.b_ * my;
    t.d_ = (sxv * syy - syv * sxy) / det;
    t.e_ = (syv * sxx - sxv * sxy) / det;
    t.f_ = mv - t.d_ * mx - t.e_ * my;
    return t;
}

AffineTransform AffineTransform::fromBox(double xmin, double ymin, double xmax, double ymax) {
    if (!(xmax > xmin) || !(ymax > ymin)) {
        throw std::invalid_argument("arena box has no area");
    }
    AffineTransform t;
    t.a_ = 1.0 / (xmax - xmin);
    t.b_ = 0.0;
    t.c_ = -xmin * t.a_;
    t.d_ = 0.0;
    t.e_ = 1.0 / (ymax - ymin);
    t.f_ = -ymin * t.e_;
    return t;
}

Point2 AffineTransform::apply(const Point2& p) const {
    return {a_ * p.x + b_ * p.y + c_, d_ * p.x + e_ * p.y + f_};
}

std::optional<ArenaReference> arena_from_markers(const CoordinateTrack& track,
                                                 const std::vector<std::string>& cornerLandmarks,
                                                 double likelihoodThreshold) {
    check_threshold(likelihoodThreshold);
    if (cornerLandmarks.size() > kUnitCorners.size()) {
        throw std::invalid_argument("at most four corner landmarks are supported");
    }

    const std::size_t training = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::floor(track.frameCount * contract::ARENA_MARKER_TRAINING_FRACTION)));

    std::vector<Point2> from;
    std::vector<Point2> to;
    for (std::size_t i = 0; i < cornerLandmarks.size(); ++i) {
        const LandmarkTrack* lm = track.find(cornerLandmarks[i]);
        if (!lm) continue;
        std::vector<double> xs;
        std::vector<double> ys;
        const std::size_t end = std::min(training, track.frameCount);
        for (std::size_t f = 0; f < end; ++f) {
            if (!sample_valid(*lm, f, likelihoodThreshold)) continue;
            xs.push_back(lm->x[f]);
            ys.push_back(lm->y[f]);
        }
        if (xs.empty()) continue;
        from.push_back({median(std::move(xs)), median(std::move(ys))});
        to.push_back(kUnitCorners[i]);
    }

    if (from.size() < contract::ARENA_MIN_MARKERS) {
        return std::nullopt;
    }

    ArenaReference arena;
    arena.transform = AffineTransform::fit(from, to);
    arena.source = ArenaSource::Markers;
    arena.markersUsed = from.size();
    return arena;
}

std::optional<ArenaReference> arena_from_extent(const CoordinateTrack& track,
                                                const std::string& landmark,
                                                double likelihoodThreshold) {
    check_threshold(likelihoodThreshold);
    const LandmarkTrack* lm = track.find(landmark);
    if (!lm) return std::nullopt;

    std::vector<double> xs;
    std::vector<double> ys;
    for (std::size_t f = 0; f < track.frameCount; ++f) {
        if (!sample_valid(*lm, f, likelihoodThreshold)) continue;
        xs.push_back(lm->x[f]);
        ys.push_back(lm->y[f]);
    }
    if (xs.empty()) return std::nullopt;

    ArenaReference arena;
    arena.transform = AffineTransform::fromBox(quantile(xs, contract::ARENA_EXTENT_QUANTILE_LO),
                                               quantile(ys, contract::ARENA_EXTENT_QUANTILE_LO),
                                               quantile(xs, contract::ARENA_EXTENT_QUANTILE_HI),
                                               quantile(ys, contract::ARENA_EXTENT_QUANTILE_HI));
    arena.source = ArenaSource::Extent;
    return arena;
}

ArenaReference arena_from_bounds(double xmin, double ymin, double xmax, double ymax) {
    ArenaReference arena;
    arena.transform = AffineTransform::fromBox(xmin, ymin, xmax, ymax);
    arena.source = ArenaSource::Bounds;
    return arena;
}

std::optional<ArenaReference> resolve_arena(const CoordinateTrack& track,
                                            const std::vector<std::string>& cornerLandmarks,
                                            const std::string& extentLandmark,
                                            double likelihoodThreshold) {
    try {
        if (auto arena = arena_from_markers(track, cornerLandmarks, likelihoodThreshold)) {
            return arena;
        }
    } catch (const std::invalid_argument& e) {
        spdlog::warn("[Arena] Trial {}: corner markers unusable ({})", track.trialId, e.what());
    }

    if (extentLandmark.empty()) {
        return std::nullopt;
    }
    try {
        auto arena = arena_from_extent(track, extentLandmark, likelihoodThreshold);
        if (arena) {
            spdlog::info("[Arena] Trial {}: using {} extent as arena reference", track.trialId, extentLandmark);
        }
        return arena;
    } catch (const std::invalid_argument& e) {
        spdlog::warn("[Arena] Trial {}: {} extent unusable ({})", track.trialId, extentLandmark, e.what());
    }
    return std::nullopt;
}

NormalizedTrack CoordinateNormalizer::normalize(const CoordinateTrack& track,
                                                const ArenaReference& arena,
                                                double likelihoodThreshold) const {
    check_threshold(likelihoodThreshold);
    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    NormalizedTrack out;
    out.trialId = track.trialId;
    out.frameRate = track.frameRate;
    out.frameCount = track.frameCount;
    out.likelihoodThreshold = likelihoodThreshold;
    out.landmarks.reserve(track.landmarks.size());

    for (const auto& lm : track.landmarks) {
        NormalizedLandmark n;
        n.name = lm.name;
        n.x.assign(track.frameCount, kNaN);
        n.y.assign(track.frameCount, kNaN);
        n.valid.assign(track.frameCount, 0);
        for (std::size_t f = 0; f < track.frameCount; ++f) {
            if (!sample_valid(lm, f, likelihoodThreshold)) continue;
            const Point2 p = arena.transform.apply({lm.x[f], lm.y[f]});
            n.x[f] = p.x;
            n.y[f] = p.y;
            n.valid[f] = 1;
        }
        out.landmarks.push_back(std::move(n));
    }
    return out;
}

}  // namespace posescope

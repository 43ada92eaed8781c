#include "beamlab/piecewise_polynomial.hpp"
#include "beamlab/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace beamlab {

namespace {

double merge_tolerance(double length) {
    return 1e-9 * std::max(1.0, length);
}

double binomial(int n, int k) {
    double result = 1.0;
    for (int i = 1; i <= k; ++i) {
        result = result * (n - k + i) / i;
    }
    return result;
}

// c += k·(x − x0)^p expanded in powers of x
template <typename Vec>
void add_shifted_power(Vec& c, double k, double x0, int p) {
    for (int j = 0; j <= p; ++j) {
        c(j) += k * binomial(p, j) * std::pow(-x0, p - j);
    }
}

} // namespace

double SegmentPolynomial::shear_at(double x) const {
    return shear_(0) + x * (shear_(1) + x * shear_(2));
}

double SegmentPolynomial::moment_at(double x) const {
    return moment_(0) + x * (moment_(1) + x * (moment_(2) + x * moment_(3)));
}

std::string format_polynomial(const Eigen::VectorXd& coefficients) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    bool first = true;
    for (Eigen::Index p = coefficients.size() - 1; p >= 0; --p) {
        const double c = coefficients(p);
        if (std::abs(c) <= DISPLAY_COEFFICIENT_THRESHOLD) continue;

        if (first) {
            if (c < 0.0) oss << "-";
        } else {
            oss << (c < 0.0 ? " - " : " + ");
        }
        oss << std::abs(c);
        if (p == 1) {
            oss << "x";
        } else if (p > 1) {
            oss << "x^" << p;
        }
        first = false;
    }

    return first ? std::string("0.00") : oss.str();
}

std::vector<double> segment_boundaries(const BeamConfig& config,
                                       const std::vector<LoadDefinition>& loads,
                                       const ReactionSet& reactions) {
    const double L = config.length;
    std::vector<double> pts = {0.0, L};

    if (config.boundary != BoundaryCondition::Cantilever) {
        pts.push_back(reactions.support_a);
        pts.push_back(reactions.support_b);
    }
    for (const auto& load : loads) {
        for (double x : load.discontinuities()) {
            pts.push_back(x);
        }
    }

    for (double& x : pts) {
        x = std::max(0.0, std::min(x, L));
    }
    std::sort(pts.begin(), pts.end());

    const double tol = merge_tolerance(L);
    std::vector<double> unique_pts;
    for (double x : pts) {
        if (unique_pts.empty() || x - unique_pts.back() > tol) {
            unique_pts.push_back(x);
        }
    }
    if (unique_pts.size() < 2) {
        return {0.0, L};
    }
    // Pin the end exactly at L when a near-duplicate was merged into it
    unique_pts.back() = L;

    return unique_pts;
}

SegmentPolynomial build_segment_polynomial(double x_a, double x_b,
                                           const BeamConfig& config,
                                           const std::vector<LoadDefinition>& loads,
                                           const ReactionSet& reactions) {
    const double tol = merge_tolerance(config.length);
    auto acts_before = [x_a, tol](double x) { return x <= x_a + tol; };

    Eigen::Vector3d v = Eigen::Vector3d::Zero();
    Eigen::Vector4d m = Eigen::Vector4d::Zero();

    // Concentrated force F at position s: V += F, M += F·(x − s)
    auto add_force = [&v, &m](double F, double s) {
        v(0) += F;
        add_shifted_power(m, F, s, 1);
    };

    // Reactions
    if (config.boundary == BoundaryCondition::Cantilever) {
        add_force(reactions.Ra, reactions.support_a);
        m(0) -= reactions.Ma;
    } else {
        if (acts_before(reactions.support_a)) add_force(reactions.Ra, reactions.support_a);
        if (acts_before(reactions.support_b)) add_force(reactions.Rb, reactions.support_b);
    }

    // Loads
    for (const auto& def : loads) {
        if (const auto* p = std::get_if<PointLoad>(&def.load)) {
            if (acts_before(p->x)) add_force(p->magnitude, p->x);
        } else if (const auto* c = std::get_if<AppliedMoment>(&def.load)) {
            if (acts_before(c->x)) m(0) -= c->magnitude;
        } else if (const auto* u = std::get_if<UniformLoad>(&def.load)) {
            if (acts_before(u->x2)) {
                add_force(u->total_force(), u->centroid());
            } else if (acts_before(u->x1) && u->x2 >= x_b - tol) {
                const double q = u->magnitude;
                add_shifted_power(v, q, u->x1, 1);
                add_shifted_power(m, 0.5 * q, u->x1, 2);
            }
        } else if (const auto* t = std::get_if<TriangularLoad>(&def.load)) {
            if (acts_before(t->x2)) {
                add_force(t->total_force(), t->centroid());
            } else if (acts_before(t->x1) && t->x2 >= x_b - tol) {
                const double w = t->peak;
                const double Lt = t->span();
                if (t->peak_side == PeakSide::Right) {
                    // q(x) = w·(x − x1)/Lt
                    add_shifted_power(v, w / (2.0 * Lt), t->x1, 2);
                    add_shifted_power(m, w / (6.0 * Lt), t->x1, 3);
                } else {
                    // q(x) = w·(1 − (x − x1)/Lt)
                    add_shifted_power(v, w, t->x1, 1);
                    add_shifted_power(v, -w / (2.0 * Lt), t->x1, 2);
                    add_shifted_power(m, 0.5 * w, t->x1, 2);
                    add_shifted_power(m, -w / (6.0 * Lt), t->x1, 3);
                }
            }
        }
    }

    return SegmentPolynomial(v, m);
}

std::vector<PiecewiseSegment> build_piecewise_segments(const BeamConfig& config,
                                                       const std::vector<LoadDefinition>& loads,
                                                       const ReactionSet& reactions) {
    const std::vector<double> pts = segment_boundaries(config, loads, reactions);

    std::vector<PiecewiseSegment> segments;
    segments.reserve(pts.size());

    for (size_t i = 0; i + 1 < pts.size(); ++i) {
        const double x_a = pts[i];
        const double x_b = pts[i + 1];
        SegmentPolynomial poly = build_segment_polynomial(x_a, x_b, config, loads, reactions);

        segments.push_back(PiecewiseSegment{
            x_a, x_b, poly,
            format_polynomial(poly.shear_coefficients()),
            format_polynomial(poly.moment_coefficients())});
    }

    verify_segment_coverage(segments, config.length);
    return segments;
}

void verify_segment_coverage(const std::vector<PiecewiseSegment>& segments, double length) {
    const double tol = merge_tolerance(length);

    if (segments.empty()) {
        throw InvariantError(BeamlabError::segment_gap(0.0, length));
    }
    if (std::abs(segments.front().x_start) > tol) {
        throw InvariantError(BeamlabError::segment_gap(0.0, segments.front().x_start));
    }

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        if (!(seg.x_end > seg.x_start)) {
            throw InvariantError(BeamlabError::segment_order(seg.x_start, seg.x_end));
        }
        if (i + 1 < segments.size() &&
            std::abs(segments[i + 1].x_start - seg.x_end) > tol) {
            throw InvariantError(BeamlabError::segment_gap(seg.x_end, segments[i + 1].x_start));
        }
    }

    if (std::abs(segments.back().x_end - length) > tol) {
        throw InvariantError(BeamlabError::segment_gap(length, segments.back().x_end));
    }
}

const PiecewiseSegment* find_segment(const std::vector<PiecewiseSegment>& segments, double x) {
    for (const auto& seg : segments) {
        if (seg.contains(x)) return &seg;
    }
    if (!segments.empty() && x == segments.back().x_end) {
        return &segments.back();
    }
    return nullptr;
}

} // namespace beamlab

#include "beamlab/loads.hpp"

#include <algorithm>
#include <cmath>

namespace beamlab {

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string load_type_to_string(LoadType type) {
    switch (type) {
        case LoadType::Point: return "P";
        case LoadType::Uniform: return "U";
        case LoadType::Triangular: return "T";
        case LoadType::Moment: return "M";
        default: return "?";
    }
}

double TriangularLoad::centroid() const {
    // One third of the span from the peak end
    return peak_side == PeakSide::Right
        ? x1 + 2.0 * span() / 3.0
        : x1 + span() / 3.0;
}

double TriangularLoad::intensity_at(double x) const {
    const double L = span();
    if (L <= 0.0 || x < x1 || x > x2) return 0.0;
    const double r = (x - x1) / L;
    return peak_side == PeakSide::Right ? r * peak : (1.0 - r) * peak;
}

LoadDefinition LoadDefinition::point(double x, double magnitude, std::string label) {
    return LoadDefinition{std::move(label), PointLoad{x, magnitude}};
}

LoadDefinition LoadDefinition::uniform(double x1, double x2, double magnitude, std::string label) {
    return LoadDefinition{std::move(label), UniformLoad{x1, x2, magnitude}};
}

LoadDefinition LoadDefinition::triangular(double x1, double x2, double peak, PeakSide side,
                                          std::string label) {
    return LoadDefinition{std::move(label), TriangularLoad{x1, x2, peak, side}};
}

LoadDefinition LoadDefinition::moment(double x, double magnitude, std::string label) {
    return LoadDefinition{std::move(label), AppliedMoment{x, magnitude}};
}

LoadType LoadDefinition::type() const {
    return std::visit(overloaded{
        [](const PointLoad&) { return LoadType::Point; },
        [](const UniformLoad&) { return LoadType::Uniform; },
        [](const TriangularLoad&) { return LoadType::Triangular; },
        [](const AppliedMoment&) { return LoadType::Moment; },
    }, load);
}

double LoadDefinition::resultant_force() const {
    return std::visit(overloaded{
        [](const PointLoad& p) { return p.magnitude; },
        [](const UniformLoad& u) { return u.total_force(); },
        [](const TriangularLoad& t) { return t.total_force(); },
        [](const AppliedMoment&) { return 0.0; },
    }, load);
}

double LoadDefinition::moment_about(double pivot) const {
    return std::visit(overloaded{
        [pivot](const PointLoad& p) { return p.magnitude * (p.x - pivot); },
        [pivot](const UniformLoad& u) { return u.total_force() * (u.centroid() - pivot); },
        [pivot](const TriangularLoad& t) { return t.total_force() * (t.centroid() - pivot); },
        [](const AppliedMoment& m) { return m.magnitude; },
    }, load);
}

double LoadDefinition::intensity_at(double x) const {
    return std::visit(overloaded{
        [](const PointLoad&) { return 0.0; },
        [x](const UniformLoad& u) { return (x >= u.x1 && x <= u.x2) ? u.magnitude : 0.0; },
        [x](const TriangularLoad& t) { return t.intensity_at(x); },
        [](const AppliedMoment&) { return 0.0; },
    }, load);
}

bool LoadDefinition::is_distributed() const {
    const LoadType t = type();
    return t == LoadType::Uniform || t == LoadType::Triangular;
}

std::vector<double> LoadDefinition::discontinuities() const {
    return std::visit(overloaded{
        [](const PointLoad& p) { return std::vector<double>{p.x}; },
        [](const UniformLoad& u) { return std::vector<double>{u.x1, u.x2}; },
        [](const TriangularLoad& t) { return std::vector<double>{t.x1, t.x2}; },
        [](const AppliedMoment& m) { return std::vector<double>{m.x}; },
    }, load);
}

double clamp_position(double x, double length, const std::string& what,
                      WarningList* warnings) {
    const double clamped = std::max(0.0, std::min(x, length));
    if (clamped != x && warnings) {
        warnings->add(BeamlabWarning::position_clamped(what, x, clamped));
    }
    return clamped;
}

namespace {

// Returns false if the range collapses after clamping
bool clamp_range(double& x1, double& x2, double length, const std::string& label,
                 WarningList* warnings) {
    const double a = std::max(0.0, std::min(x1, length));
    const double b = std::max(0.0, std::min(x2, length));
    if (!(a < b)) {
        if (warnings) warnings->add(BeamlabWarning::invalid_load_range(label, x1, x2));
        return false;
    }
    if (warnings) {
        if (a != x1) warnings->add(BeamlabWarning::position_clamped(label, x1, a));
        if (b != x2) warnings->add(BeamlabWarning::position_clamped(label, x2, b));
    }
    x1 = a;
    x2 = b;
    return true;
}

std::string display_label(const LoadDefinition& def, size_t index) {
    if (!def.label.empty()) return def.label;
    return load_type_to_string(def.type()) + std::to_string(index + 1);
}

} // namespace

std::vector<LoadDefinition> resolve_loads(const LoadSpec& spec, double length,
                                          WarningList* warnings) {
    std::vector<LoadDefinition> resolved;

    if (const auto* single = std::get_if<ImplicitSingleLoad>(&spec)) {
        const double x = clamp_position(single->position, length, "P1", warnings);
        resolved.push_back(LoadDefinition::point(x, single->magnitude, "P1"));
        return resolved;
    }

    const auto& explicit_loads = std::get<ExplicitLoads>(spec).loads;
    resolved.reserve(explicit_loads.size());

    for (size_t i = 0; i < explicit_loads.size(); ++i) {
        LoadDefinition def = explicit_loads[i];
        def.label = display_label(def, i);

        bool keep = std::visit(overloaded{
            [&](PointLoad& p) {
                p.x = clamp_position(p.x, length, def.label, warnings);
                return true;
            },
            [&](AppliedMoment& m) {
                m.x = clamp_position(m.x, length, def.label, warnings);
                return true;
            },
            [&](UniformLoad& u) { return clamp_range(u.x1, u.x2, length, def.label, warnings); },
            [&](TriangularLoad& t) { return clamp_range(t.x1, t.x2, length, def.label, warnings); },
        }, def.load);

        if (keep) resolved.push_back(std::move(def));
    }

    return resolved;
}

} // namespace beamlab

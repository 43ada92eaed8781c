#include "beamlab/beam_config.hpp"

#include <stdexcept>
#include <string>

namespace beamlab {

std::string boundary_condition_to_string(BoundaryCondition bc) {
    switch (bc) {
        case BoundaryCondition::Cantilever: return "cantilever";
        case BoundaryCondition::SimplySupported: return "simplySupported";
        case BoundaryCondition::Overhanging: return "overhanging";
        default: return "unknown";
    }
}

LoadSpec BeamConfig::load_spec() const {
    if (custom_loads.empty()) {
        return ImplicitSingleLoad{force, load_position};
    }
    return ExplicitLoads{custom_loads};
}

SupportLayout BeamConfig::supports(WarningList* warnings) const {
    SupportLayout layout;
    switch (boundary) {
        case BoundaryCondition::Cantilever:
            layout.support_a = 0.0;
            layout.support_b = 0.0;
            break;
        case BoundaryCondition::SimplySupported:
            layout.support_a = 0.0;
            layout.support_b = length;
            break;
        case BoundaryCondition::Overhanging:
            layout.support_a = clamp_position(support_a, length, "support A", warnings);
            layout.support_b = clamp_position(support_b, length, "support B", warnings);
            break;
    }
    return layout;
}

namespace {

void require_positive_dimension(const char* name, double value) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(std::string(name) + " must be positive, got " +
                                    std::to_string(value));
    }
}

} // namespace

void BeamConfig::validate() const {
    if (!(length > 0.0)) {
        throw std::invalid_argument("Beam length must be positive, got " + std::to_string(length));
    }
    if (!(material.E > 0.0)) {
        throw std::invalid_argument("Young's modulus must be positive, got " +
                                    std::to_string(material.E));
    }
    require_positive_dimension("Section height", section.height);
    switch (section.shape) {
        case SectionShape::Rectangular:
            require_positive_dimension("Section width", section.width);
            break;
        case SectionShape::IBeam:
            require_positive_dimension("Flange width", section.flange_width);
            require_positive_dimension("Flange thickness", section.flange_thickness);
            require_positive_dimension("Web thickness", section.web_thickness);
            break;
        case SectionShape::Circular:
            break;
    }
}

bool BeamConfig::operator==(const BeamConfig& other) const {
    return length == other.length &&
           boundary == other.boundary &&
           support_a == other.support_a &&
           support_b == other.support_b &&
           material == other.material &&
           section == other.section &&
           force == other.force &&
           load_position == other.load_position &&
           custom_loads == other.custom_loads;
}

} // namespace beamlab

#include "beamlab/section.hpp"

#include <cmath>

namespace beamlab {

std::string section_shape_to_string(SectionShape shape) {
    switch (shape) {
        case SectionShape::Rectangular: return "rectangular";
        case SectionShape::Circular: return "circular";
        case SectionShape::IBeam: return "ibeam";
        default: return "unknown";
    }
}

SectionDescriptor SectionDescriptor::rectangular(double width, double height) {
    SectionDescriptor s;
    s.shape = SectionShape::Rectangular;
    s.width = width;
    s.height = height;
    return s;
}

SectionDescriptor SectionDescriptor::circular(double diameter) {
    SectionDescriptor s;
    s.shape = SectionShape::Circular;
    s.height = diameter;
    return s;
}

SectionDescriptor SectionDescriptor::i_beam(double height, double flange_width,
                                            double flange_thickness, double web_thickness) {
    SectionDescriptor s;
    s.shape = SectionShape::IBeam;
    s.height = height;
    s.flange_width = flange_width;
    s.flange_thickness = flange_thickness;
    s.web_thickness = web_thickness;
    return s;
}

bool SectionDescriptor::operator==(const SectionDescriptor& other) const {
    return shape == other.shape &&
           height == other.height &&
           width == other.width &&
           flange_width == other.flange_width &&
           flange_thickness == other.flange_thickness &&
           web_thickness == other.web_thickness;
}

double SectionProperties::section_modulus() const {
    double c = fibre_distance();
    return c > 0.0 ? I / c : 0.0;
}

SectionProperties compute_section_properties(const SectionDescriptor& section,
                                             WarningList* warnings) {
    SectionProperties props;
    const double H = section.height;
    props.depth = H;

    switch (section.shape) {
        case SectionShape::Rectangular: {
            const double b = section.width;
            props.I = b * H * H * H / 12.0;
            props.A = b * H;
            break;
        }
        case SectionShape::Circular: {
            // H is the diameter
            props.I = M_PI * std::pow(H, 4) / 64.0;
            props.A = M_PI * std::pow(H / 2.0, 2);
            break;
        }
        case SectionShape::IBeam: {
            const double B = section.flange_width;
            const double tf = section.flange_thickness;
            const double tw = section.web_thickness;
            const double inner_h = H - 2.0 * tf;
            const double inner_b = B - tw;

            if (inner_h > 0.0 && inner_b > 0.0) {
                props.I = (B * H * H * H - inner_b * inner_h * inner_h * inner_h) / 12.0;
                props.A = 2.0 * B * tf + tw * inner_h;
            } else {
                // Cutout collapses: outer box as a solid block
                props.I = B * H * H * H / 12.0;
                props.A = B * H;
                props.solid_fallback = true;
                if (warnings) {
                    warnings->add(BeamlabWarning::section_solid_fallback(inner_h, inner_b));
                }
            }
            break;
        }
    }

    return props;
}

} // namespace beamlab

#pragma once

#include "beamlab/warnings.hpp"

#include <string>

namespace beamlab {

/**
 * @brief Cross-section shape
 */
enum class SectionShape {
    Rectangular,  ///< Solid rectangle (width x height)
    Circular,     ///< Solid circle (height is the diameter)
    IBeam         ///< Doubly symmetric I-section
};

std::string section_shape_to_string(SectionShape shape);

/**
 * @brief Cross-section shape descriptor
 *
 * Dimensions in consistent units [m]. Which fields are read depends on the
 * shape:
 * - Rectangular: height, width
 * - Circular: height (diameter)
 * - IBeam: height, flange_width, flange_thickness, web_thickness
 */
struct SectionDescriptor {
    SectionShape shape = SectionShape::Rectangular;
    double height = 0.5;             ///< Overall depth, or diameter for circular [m]
    double width = 0.2;              ///< Rectangle width [m]
    double flange_width = 0.3;       ///< I-beam flange width [m]
    double flange_thickness = 0.02;  ///< I-beam flange thickness [m]
    double web_thickness = 0.015;    ///< I-beam web thickness [m]

    /**
     * @brief Construct a rectangular section descriptor
     */
    static SectionDescriptor rectangular(double width, double height);

    /**
     * @brief Construct a circular section descriptor
     */
    static SectionDescriptor circular(double diameter);

    /**
     * @brief Construct an I-section descriptor
     */
    static SectionDescriptor i_beam(double height, double flange_width,
                                    double flange_thickness, double web_thickness);

    bool operator==(const SectionDescriptor& other) const;
    bool operator!=(const SectionDescriptor& other) const { return !(*this == other); }
};

/**
 * @brief Geometric properties of a cross-section
 *
 * - I: Second moment of area about the neutral axis [m⁴]
 * - A: Cross-sectional area [m²]
 * - depth: Distance between the extreme fibres [m]
 *
 * The section is symmetric about the neutral axis, so the extreme fibres
 * are at y = ±depth/2.
 */
struct SectionProperties {
    double I = 0.0;              ///< Second moment of area [m⁴]
    double A = 0.0;              ///< Cross-sectional area [m²]
    double depth = 0.0;          ///< Overall depth [m]
    bool solid_fallback = false; ///< True if an invalid I-beam was treated as solid

    /**
     * @brief Distance from the neutral axis to an extreme fibre [m]
     */
    double fibre_distance() const { return 0.5 * depth; }

    /**
     * @brief Elastic section modulus I / c [m³]
     */
    double section_modulus() const;
};

/**
 * @brief Compute I and area for a section descriptor
 *
 * Rectangular: I = b·h³/12
 * Circular:    I = π·d⁴/64
 * I-beam:      I = (B·H³ − (B − tw)·(H − 2·tf)³)/12
 *
 * If the I-beam cutout has a non-positive height or width the outer box is
 * treated as solid (I = B·H³/12). This keeps the function total; the fallback
 * is reported to @p warnings when given.
 *
 * @param section Section descriptor
 * @param warnings Optional list that receives fallback warnings
 * @return SectionProperties
 */
SectionProperties compute_section_properties(const SectionDescriptor& section,
                                             WarningList* warnings = nullptr);

} // namespace beamlab

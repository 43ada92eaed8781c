#pragma once

#include <string>

namespace beamlab {

/**
 * @brief Linear elastic material for beam analysis
 *
 * Stores material properties in SI units:
 * - E: Young's modulus [Pa]
 * - fy: Yield strength [Pa] (used for the safety factor)
 */
class Material {
public:
    std::string name;   ///< Material name
    double E;           ///< Young's modulus [Pa]
    double fy;          ///< Yield strength [Pa]

    /**
     * @brief Construct a new Material
     *
     * @param name Material name
     * @param E Young's modulus [Pa]
     * @param fy Yield strength [Pa]
     */
    Material(std::string name, double E, double fy);

    /**
     * @brief Structural steel: E = 200 GPa, fy = 250 MPa
     */
    static Material steel();

    /**
     * @brief Aluminium alloy: E = 70 GPa, fy = 95 MPa
     */
    static Material aluminum();

    /**
     * @brief Timber: E = 11 GPa, fy = 40 MPa
     */
    static Material wood();

    /**
     * @brief Equality on name, stiffness and strength
     */
    bool operator==(const Material& other) const;
    bool operator!=(const Material& other) const { return !(*this == other); }
};

} // namespace beamlab

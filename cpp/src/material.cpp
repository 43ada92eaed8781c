#include "beamlab/material.hpp"

namespace beamlab {

Material::Material(std::string name, double E, double fy)
    : name(std::move(name)), E(E), fy(fy) {
}

Material Material::steel() {
    return Material("Steel", 200e9, 250e6);
}

Material Material::aluminum() {
    return Material("Aluminum", 70e9, 95e6);
}

Material Material::wood() {
    return Material("Wood", 11e9, 40e6);
}

bool Material::operator==(const Material& other) const {
    return name == other.name && E == other.E && fy == other.fy;
}

} // namespace beamlab

#ifndef AVR_GRAPHICS_CONVERSIONS_H
#define AVR_GRAPHICS_CONVERSIONS_H

#include <irrlicht.h>
#include <glm/glm.hpp>

namespace avr {
namespace graphics {

inline glm::vec3 toGlm(const irr::core::vector3df& v) {
    return glm::vec3(v.X, v.Y, v.Z);
}

inline irr::core::vector3df toIrr(const glm::vec3& v) {
    return irr::core::vector3df(v.x, v.y, v.z);
}

} // namespace graphics
} // namespace avr

#endif // AVR_GRAPHICS_CONVERSIONS_H

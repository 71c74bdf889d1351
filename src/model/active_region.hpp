#ifndef Ctess_ACTIVE_REGION_HPP
#define Ctess_ACTIVE_REGION_HPP

#include "core/tess_types.hpp"

namespace Ctess {

// Selects the model points that take part in the point index space.
class ActiveRegion {
public:
    virtual ~ActiveRegion() = default;
    virtual bool contains(const Vec3& unit_vector, real_t radius, int layer) const = 0;
};

} // namespace Ctess

#endif // Ctess_ACTIVE_REGION_HPP

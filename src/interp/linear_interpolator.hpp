#ifndef Ctess_LINEAR_INTERPOLATOR_HPP
#define Ctess_LINEAR_INTERPOLATOR_HPP

#include "horizontal_interpolator.hpp"

namespace Ctess {

// Barycentric interpolation over the three corners of the containing
// triangle. The weight of corner i is proportional to the volume spanned by
// u and the edge opposite it, i.e. the barycentric coordinate of the
// gnomonic projection of u onto the triangle's plane.
class LinearInterpolator : public HorizontalInterpolator {
public:
    explicit LinearInterpolator(const Grid& grid) : HorizontalInterpolator(grid) {}

    InterpolatorType get_type() const override { return InterpolatorType::LINEAR; }

    void interpolate(int triangle, const Vec3& u,
                     std::vector<int>& vertices,
                     std::vector<real_t>& coefficients) override;
};

} // namespace Ctess

#endif // Ctess_LINEAR_INTERPOLATOR_HPP

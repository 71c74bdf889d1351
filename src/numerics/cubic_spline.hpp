#ifndef Ctess_CUBIC_SPLINE_HPP
#define Ctess_CUBIC_SPLINE_HPP

#include "core/tess_constants.hpp"
#include <vector>
#include <cstddef>

namespace Ctess {
namespace cubic_spline {

// --- Natural cubic spline over a non-uniform abscissa ---
// All functions expect x.size() >= 2 and x strictly increasing.

bool is_strictly_increasing(const std::vector<real_t>& x);

// Second derivatives y'' at every node, with y''[0] = y''[n-1] = 0.
std::vector<real_t> second_derivatives(const std::vector<real_t>& x, const std::vector<real_t>& y);

// Index j of the interval [x[j], x[j+1]] that contains xq. Values outside
// the abscissa map to the first or last interval.
size_t find_interval(const std::vector<real_t>& x, real_t xq);

// Spline value at xq. Reproduces y exactly at the nodes.
real_t evaluate(const std::vector<real_t>& x, const std::vector<real_t>& y,
                const std::vector<real_t>& y2, real_t xq);

// Weights w such that evaluate(x, y, second_derivatives(x, y), xq)
// equals sum_k w[k] * y[k] for every y. w is resized to x.size().
void weights(const std::vector<real_t>& x, real_t xq, std::vector<real_t>& w);

} // namespace cubic_spline
} // namespace Ctess

#endif // Ctess_CUBIC_SPLINE_HPP

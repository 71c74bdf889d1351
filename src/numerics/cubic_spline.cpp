#include "cubic_spline.hpp"
#include <algorithm> // For std::upper_bound
#include <stdexcept>

namespace Ctess {
namespace cubic_spline {

namespace {

std::vector<real_t> intervals(const std::vector<real_t>& x) {
    std::vector<real_t> h(x.size() - 1);
    for (size_t i = 0; i + 1 < x.size(); ++i) {
        h[i] = x[i + 1] - x[i];
    }
    return h;
}

// Thomas algorithm for the symmetric tridiagonal system of the interior
// nodes: h[i-1] z[i-1] + 2 (h[i-1] + h[i]) z[i] + h[i] z[i+1] = rhs[i].
// Row r of rhs belongs to node r+1.
std::vector<real_t> solve_interior(const std::vector<real_t>& h, const std::vector<real_t>& rhs) {
    size_t m = rhs.size();
    std::vector<real_t> cp(m), dp(m), z(m);
    if (m == 0) return z;

    real_t diag = 2.0 * (h[0] + h[1]);
    cp[0] = h[1] / diag;
    dp[0] = rhs[0] / diag;
    for (size_t r = 1; r < m; ++r) {
        real_t lower = h[r];
        real_t upper = h[r + 1];
        real_t denom = 2.0 * (h[r] + h[r + 1]) - lower * cp[r - 1];
        cp[r] = upper / denom;
        dp[r] = (rhs[r] - lower * dp[r - 1]) / denom;
    }
    z[m - 1] = dp[m - 1];
    for (size_t r = m - 1; r-- > 0;) {
        z[r] = dp[r] - cp[r] * z[r + 1];
    }
    return z;
}

} // namespace

bool is_strictly_increasing(const std::vector<real_t>& x) {
    for (size_t i = 1; i < x.size(); ++i) {
        if (!(x[i] > x[i - 1])) return false;
    }
    return true;
}

std::vector<real_t> second_derivatives(const std::vector<real_t>& x, const std::vector<real_t>& y) {
    if (x.size() < 2 || x.size() != y.size()) {
        throw std::invalid_argument("cubic_spline::second_derivatives requires at least 2 nodes and matching x/y sizes.");
    }
    size_t n = x.size();
    std::vector<real_t> y2(n, 0.0);
    if (n == 2) return y2;

    std::vector<real_t> h = intervals(x);
    std::vector<real_t> rhs(n - 2);
    for (size_t i = 1; i + 1 < n; ++i) {
        rhs[i - 1] = 6.0 * ((y[i + 1] - y[i]) / h[i] - (y[i] - y[i - 1]) / h[i - 1]);
    }
    std::vector<real_t> z = solve_interior(h, rhs);
    for (size_t i = 1; i + 1 < n; ++i) {
        y2[i] = z[i - 1];
    }
    return y2;
}

size_t find_interval(const std::vector<real_t>& x, real_t xq) {
    if (xq <= x.front()) return 0;
    if (xq >= x.back()) return x.size() - 2;
    // First node strictly greater than xq; the interval starts one before it.
    size_t upper = static_cast<size_t>(std::upper_bound(x.begin(), x.end(), xq) - x.begin());
    return upper - 1;
}

real_t evaluate(const std::vector<real_t>& x, const std::vector<real_t>& y,
                const std::vector<real_t>& y2, real_t xq) {
    size_t j = find_interval(x, xq);
    real_t h = x[j + 1] - x[j];
    real_t a = (x[j + 1] - xq) / h;
    real_t b = 1.0 - a;
    return a * y[j] + b * y[j + 1]
         + ((a * a * a - a) * y2[j] + (b * b * b - b) * y2[j + 1]) * (h * h) / 6.0;
}

void weights(const std::vector<real_t>& x, real_t xq, std::vector<real_t>& w) {
    size_t n = x.size();
    w.assign(n, 0.0);
    size_t j = find_interval(x, xq);
    real_t hj = x[j + 1] - x[j];
    real_t a = (x[j + 1] - xq) / hj;
    real_t b = 1.0 - a;
    w[j] += a;
    w[j + 1] += b;
    if (n == 2) return;

    // y'' = G y. Row i of G is (T^-1 e_i)^T R since T is symmetric, where T is
    // the interior system and R maps y onto its right-hand side.
    std::vector<real_t> h = intervals(x);
    const real_t curvature[2] = {(a * a * a - a) * (hj * hj) / 6.0,
                                 (b * b * b - b) * (hj * hj) / 6.0};
    for (int side = 0; side < 2; ++side) {
        size_t node = j + static_cast<size_t>(side);
        if (node == 0 || node == n - 1 || curvature[side] == 0.0) continue;

        std::vector<real_t> e(n - 2, 0.0);
        e[node - 1] = 1.0;
        std::vector<real_t> z = solve_interior(h, e);
        for (size_t r = 0; r < n - 2; ++r) {
            size_t l = r + 1; // interior node of row r
            real_t c = curvature[side] * z[r] * 6.0;
            w[l - 1] += c / h[l - 1];
            w[l] -= c / h[l - 1] + c / h[l];
            w[l + 1] += c / h[l];
        }
    }
}

} // namespace cubic_spline
} // namespace Ctess

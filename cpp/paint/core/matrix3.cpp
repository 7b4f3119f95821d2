#include "paint/core/matrix3.h"

#include <cmath>

namespace paint {

namespace {
constexpr double kSingularEpsilon = 1e-12;
}

Matrix3 Matrix3::translation(double tx, double ty) noexcept {
    Matrix3 r;
    r.m = {1.0, 0.0, tx,
           0.0, 1.0, ty,
           0.0, 0.0, 1.0};
    return r;
}

Matrix3 Matrix3::scale(double sx, double sy) noexcept {
    Matrix3 r;
    r.m = {sx, 0.0, 0.0,
           0.0, sy, 0.0,
           0.0, 0.0, 1.0};
    return r;
}

Matrix3 Matrix3::rotation(double radians) noexcept {
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    Matrix3 r;
    r.m = {c, -s, 0.0,
           s, c, 0.0,
           0.0, 0.0, 1.0};
    return r;
}

Matrix3 Matrix3::rotationAround(double radians, double cx, double cy) noexcept {
    return translation(cx, cy).multiply(rotation(radians)).multiply(translation(-cx, -cy));
}

Matrix3 Matrix3::multiply(const Matrix3& other) const noexcept {
    const auto& a = m;
    const auto& b = other.m;
    Matrix3 r;
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            double sum = 0.0;
            for (int k = 0; k < 3; ++k) {
                sum += a[static_cast<std::size_t>(row * 3 + k)] * b[static_cast<std::size_t>(k * 3 + col)];
            }
            r.m[static_cast<std::size_t>(row * 3 + col)] = sum;
        }
    }
    return r;
}

Point2 Matrix3::transformPoint(double x, double y) const noexcept {
    const double tx = m[0] * x + m[1] * y + m[2];
    const double ty = m[3] * x + m[4] * y + m[5];
    const double w = m[6] * x + m[7] * y + m[8];
    if (std::abs(w - 1.0) > 1e-12 && std::abs(w) > kSingularEpsilon) {
        return Point2{tx / w, ty / w};
    }
    return Point2{tx, ty};
}

double Matrix3::determinant() const noexcept {
    return m[0] * (m[4] * m[8] - m[5] * m[7])
         - m[1] * (m[3] * m[8] - m[5] * m[6])
         + m[2] * (m[3] * m[7] - m[4] * m[6]);
}

bool Matrix3::invert(Matrix3& out) const noexcept {
    const double det = determinant();
    if (!std::isfinite(det) || std::abs(det) < kSingularEpsilon) return false;
    const double inv = 1.0 / det;
    out.m = {
        inv * (m[4] * m[8] - m[5] * m[7]),
        inv * (m[2] * m[7] - m[1] * m[8]),
        inv * (m[1] * m[5] - m[2] * m[4]),
        inv * (m[5] * m[6] - m[3] * m[8]),
        inv * (m[0] * m[8] - m[2] * m[6]),
        inv * (m[2] * m[3] - m[0] * m[5]),
        inv * (m[3] * m[7] - m[4] * m[6]),
        inv * (m[1] * m[6] - m[0] * m[7]),
        inv * (m[0] * m[4] - m[1] * m[3]),
    };
    return true;
}

bool Matrix3::nearlyEquals(const Matrix3& other, double epsilon) const noexcept {
    for (std::size_t i = 0; i < m.size(); ++i) {
        if (std::abs(m[i] - other.m[i]) > epsilon) return false;
    }
    return true;
}

} // namespace paint

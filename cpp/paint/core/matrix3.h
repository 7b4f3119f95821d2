#pragma once

#include "paint/core/types.h"
#include <array>

namespace paint {

// Row-major 3x3 affine matrix for 2D transforms.
//   [ m00 m01 m02 ]
//   [ m10 m11 m12 ]
//   [ m20 m21 m22 ]
struct Matrix3 {
    std::array<double, 9> m{1.0, 0.0, 0.0,
                            0.0, 1.0, 0.0,
                            0.0, 0.0, 1.0};

    static Matrix3 identity() noexcept { return Matrix3{}; }
    static Matrix3 translation(double tx, double ty) noexcept;
    static Matrix3 scale(double sx, double sy) noexcept;
    static Matrix3 rotation(double radians) noexcept;
    static Matrix3 rotationAround(double radians, double cx, double cy) noexcept;

    // Returns this * other (other is applied first).
    Matrix3 multiply(const Matrix3& other) const noexcept;
    Point2 transformPoint(double x, double y) const noexcept;
    Point2 transformPoint(const Point2& p) const noexcept { return transformPoint(p.x, p.y); }

    double determinant() const noexcept;
    // Writes the inverse into out. Returns false when the matrix is singular.
    bool invert(Matrix3& out) const noexcept;

    double at(int row, int col) const noexcept { return m[static_cast<std::size_t>(row * 3 + col)]; }
    bool nearlyEquals(const Matrix3& other, double epsilon = 1e-10) const noexcept;
};

} // namespace paint

#pragma once

#include "types.hpp"

#include <boost/qvm/mat.hpp>
#include <boost/qvm/mat_operations.hpp>
#include <cmath>

namespace rigcx::core::math {

// Column-vector convention: translation lives in the last column.
struct Mat4 {
    boost::qvm::mat<float, 4, 4> a{};

    float* operator[](int row) { return a.a[row]; }
    const float* operator[](int row) const { return a.a[row]; }

    static Mat4 identity() {
        Mat4 out{};
        out.a = boost::qvm::identity_mat<float, 4>();
        return out;
    }

    static Mat4 multiply(const Mat4& lhs, const Mat4& rhs) {
        Mat4 out{};
        out.a = boost::qvm::operator*(lhs.a, rhs.a);
        return out;
    }

    static Mat4 translation(const Vec3& t) {
        Mat4 out = identity();
        out.a.a[0][3] = t.x;
        out.a.a[1][3] = t.y;
        out.a.a[2][3] = t.z;
        return out;
    }

    static Mat4 translation(float x, float y, float z) {
        return translation(Vec3{x, y, z});
    }

    // Euler angles in radians, applied X then Y then Z.
    static Mat4 rotation(const Vec3& r) {
        const float cx = std::cos(r.x);
        const float sx = std::sin(r.x);
        const float cy = std::cos(r.y);
        const float sy = std::sin(r.y);
        const float cz = std::cos(r.z);
        const float sz = std::sin(r.z);

        Mat4 rot = identity();
        rot.a.a[0][0] = cy * cz;
        rot.a.a[0][1] = cz * sx * sy - cx * sz;
        rot.a.a[0][2] = cx * cz * sy + sx * sz;
        rot.a.a[1][0] = cy * sz;
        rot.a.a[1][1] = cx * cz + sx * sy * sz;
        rot.a.a[1][2] = -cz * sx + cx * sy * sz;
        rot.a.a[2][0] = -sy;
        rot.a.a[2][1] = cy * sx;
        rot.a.a[2][2] = cx * cy;
        return rot;
    }

    static Mat4 zRotation(float radians) {
        return rotation(Vec3{0.0f, 0.0f, radians});
    }

    static Mat4 inverse(const Mat4& m) {
        Mat4 out{};
        out.a = boost::qvm::inverse(m.a);
        return out;
    }

    Vec3 translationPart() const {
        return Vec3{a.a[0][3], a.a[1][3], a.a[2][3]};
    }

    void setTranslationPart(const Vec3& t) {
        a.a[0][3] = t.x;
        a.a[1][3] = t.y;
        a.a[2][3] = t.z;
    }

    bool nearlyEquals(const Mat4& other, float eps = 1e-4f) const {
        for (int r = 0; r < 4; ++r) {
            for (int c = 0; c < 4; ++c) {
                if (std::fabs(a.a[r][c] - other.a.a[r][c]) > eps) return false;
            }
        }
        return true;
    }
};

} // namespace rigcx::core::math

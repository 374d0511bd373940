#pragma once

#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_inverse.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace strata {

template <typename T, typename SpaceTag> class Vector3;
template <typename T, typename SpaceTag> class Vector4;
template <typename T> class Matrix4x4;

/**
 * @brief Type tags for different coordinate spaces
 *
 * Chunk geometry moves through Local (chunk space, 0..63 per axis), World and
 * Clip. Color is not a space but gets its own tag so palette entries never mix
 * with positions.
 */
namespace Space {
struct Local {}; // Chunk-local coordinates decoded from a vertex word
struct World {}; // World-space coordinates
struct Clip {};  // Homogeneous clip-space coordinates
struct Color {}; // Linear RGBA
} // namespace Space

/**
 * @brief 3D vector class with coordinate space type safety
 *
 * @tparam T Numeric type (float, double, etc.)
 * @tparam Space Coordinate space tag
 */
template <typename T, typename SpaceTag = Space::World> class Vector3 {
  public:
    T x, y, z;

    Vector3() : x(0), y(0), z(0) {}
    Vector3(T x, T y, T z) : x(x), y(y), z(z) {}

    Vector3<T, SpaceTag> operator+(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x + other.x, y + other.y, z + other.z);
    }

    Vector3<T, SpaceTag> operator-(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x - other.x, y - other.y, z - other.z);
    }

    Vector3<T, SpaceTag> operator-() const { return Vector3<T, SpaceTag>(-x, -y, -z); }

    Vector3<T, SpaceTag> operator*(T scalar) const { return Vector3<T, SpaceTag>(x * scalar, y * scalar, z * scalar); }

    Vector3<T, SpaceTag> operator/(T scalar) const { return Vector3<T, SpaceTag>(x / scalar, y / scalar, z / scalar); }

    bool operator==(const Vector3<T, SpaceTag>& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    // Cannot mix different spaces - these operations are deleted
    template <typename OtherSpace> Vector3<T, SpaceTag> operator+(const Vector3<T, OtherSpace>&) const = delete;

    template <typename OtherSpace> Vector3<T, SpaceTag> operator-(const Vector3<T, OtherSpace>&) const = delete;

    T dot(const Vector3<T, SpaceTag>& other) const { return x * other.x + y * other.y + z * other.z; }

    Vector3<T, SpaceTag> cross(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(y * other.z - z * other.y, z * other.x - x * other.z, x * other.y - y * other.x);
    }

    T lengthSquared() const { return x * x + y * y + z * z; }

    T length() const { return std::sqrt(lengthSquared()); }

    Vector3<T, SpaceTag> normalized() const {
        T len = length();
        if (len == 0)
            return *this;
        return *this / len;
    }

    // Component-wise min/max (used for bounds accumulation)
    Vector3<T, SpaceTag> min(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(std::min(x, other.x), std::min(y, other.y), std::min(z, other.z));
    }

    Vector3<T, SpaceTag> max(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(std::max(x, other.x), std::max(y, other.y), std::max(z, other.z));
    }

    template <typename TargetSpace> Vector3<T, TargetSpace> as() const { return Vector3<T, TargetSpace>(x, y, z); }
};

/**
 * @brief 4D vector class with coordinate space type safety
 *
 * Used for homogeneous positions (Clip) and RGBA colors (Color).
 */
template <typename T, typename SpaceTag = Space::World> class Vector4 {
  public:
    T x, y, z, w;

    Vector4() : x(0), y(0), z(0), w(0) {}
    Vector4(T x, T y, T z, T w) : x(x), y(y), z(z), w(w) {}
    Vector4(const Vector3<T, SpaceTag>& v, T w) : x(v.x), y(v.y), z(v.z), w(w) {}

    Vector4<T, SpaceTag> operator+(const Vector4<T, SpaceTag>& other) const {
        return Vector4<T, SpaceTag>(x + other.x, y + other.y, z + other.z, w + other.w);
    }

    Vector4<T, SpaceTag> operator-(const Vector4<T, SpaceTag>& other) const {
        return Vector4<T, SpaceTag>(x - other.x, y - other.y, z - other.z, w - other.w);
    }

    Vector4<T, SpaceTag> operator*(T scalar) const {
        return Vector4<T, SpaceTag>(x * scalar, y * scalar, z * scalar, w * scalar);
    }

    bool operator==(const Vector4<T, SpaceTag>& other) const {
        return x == other.x && y == other.y && z == other.z && w == other.w;
    }

    template <typename OtherSpace> Vector4<T, SpaceTag> operator+(const Vector4<T, OtherSpace>&) const = delete;

    template <typename OtherSpace> Vector4<T, SpaceTag> operator-(const Vector4<T, OtherSpace>&) const = delete;

    T dot(const Vector4<T, SpaceTag>& other) const { return x * other.x + y * other.y + z * other.z + w * other.w; }

    // Conversion to Vector3 (drops w)
    Vector3<T, SpaceTag> xyz() const { return Vector3<T, SpaceTag>(x, y, z); }

    template <typename TargetSpace> Vector4<T, TargetSpace> as() const { return Vector4<T, TargetSpace>(x, y, z, w); }
};

/**
 * @brief 4x4 transform backed by glm, column-major like a uniform buffer upload
 *
 * Instance, view and projection matrices all use this type. Element access is
 * (row, col); data() exposes the 16 column-major values.
 */
template <typename T> class Matrix4x4 {
  public:
    using Native = glm::mat<4, 4, T, glm::defaultp>;

    Matrix4x4() : m_(T(1)) {}
    explicit Matrix4x4(const Native& m) : m_(m) {}

    T& operator()(int row, int col) { return m_[col][row]; }
    const T& operator()(int row, int col) const { return m_[col][row]; }

    const T* data() const { return glm::value_ptr(m_); }
    const Native& native() const { return m_; }

    Matrix4x4<T> operator*(const Matrix4x4<T>& other) const { return Matrix4x4<T>(m_ * other.m_); }

    template <typename SpaceTag, typename ResultSpaceTag>
    Vector4<T, ResultSpaceTag> transform(const Vector4<T, SpaceTag>& v) const {
        const glm::vec<4, T> r = m_ * glm::vec<4, T>(v.x, v.y, v.z, v.w);
        return Vector4<T, ResultSpaceTag>(r.x, r.y, r.z, r.w);
    }

    // w = 1, no perspective divide; only meaningful for affine matrices.
    template <typename SpaceTag, typename ResultSpaceTag>
    Vector3<T, ResultSpaceTag> transformPoint(const Vector3<T, SpaceTag>& v) const {
        return transform<SpaceTag, ResultSpaceTag>(Vector4<T, SpaceTag>(v, 1)).xyz();
    }

    // w = 0, translation ignored.
    template <typename SpaceTag, typename ResultSpaceTag>
    Vector3<T, ResultSpaceTag> transformDirection(const Vector3<T, SpaceTag>& v) const {
        return transform<SpaceTag, ResultSpaceTag>(Vector4<T, SpaceTag>(v, 0)).xyz();
    }

    static Matrix4x4<T> translation(const Vector3<T, Space::World>& v) {
        return Matrix4x4<T>(glm::translate(Native(T(1)), glm::vec<3, T>(v.x, v.y, v.z)));
    }

    static Matrix4x4<T> scaling(const Vector3<T, Space::World>& v) {
        return Matrix4x4<T>(glm::scale(Native(T(1)), glm::vec<3, T>(v.x, v.y, v.z)));
    }

    // Right-handed. homogeneousDepth selects the [-1, 1] clip depth range,
    // otherwise depth maps to [0, 1] regardless of GLM_FORCE_DEPTH_ZERO_TO_ONE.
    static Matrix4x4<T> perspective(T fovY, T aspect, T zNear, T zFar, bool homogeneousDepth) {
        return Matrix4x4<T>(homogeneousDepth ? glm::perspectiveRH_NO(fovY, aspect, zNear, zFar)
                                             : glm::perspectiveRH_ZO(fovY, aspect, zNear, zFar));
    }

    static Matrix4x4<T> orthographic(T left, T right, T bottom, T top, T zNear, T zFar, bool homogeneousDepth) {
        return Matrix4x4<T>(homogeneousDepth ? glm::orthoRH_NO(left, right, bottom, top, zNear, zFar)
                                             : glm::orthoRH_ZO(left, right, bottom, top, zNear, zFar));
    }

    static Matrix4x4<T> lookAt(const Vector3<T, Space::World>& eye, const Vector3<T, Space::World>& target,
                               const Vector3<T, Space::World>& up) {
        return Matrix4x4<T>(glm::lookAtRH(glm::vec<3, T>(eye.x, eye.y, eye.z),
                                          glm::vec<3, T>(target.x, target.y, target.z),
                                          glm::vec<3, T>(up.x, up.y, up.z)));
    }

    // Identity for singular matrices.
    Matrix4x4<T> inverse() const {
        if (std::abs(glm::determinant(m_)) < T(1e-8)) {
            return Matrix4x4<T>();
        }
        return Matrix4x4<T>(glm::inverse(m_));
    }

    // Inverse-transpose of the upper 3x3 embedded in an identity matrix, so
    // normals stay perpendicular to surfaces under non-uniform scale. Callers
    // renormalize. Identity for singular matrices.
    Matrix4x4<T> normalMatrix() const {
        const glm::mat<3, 3, T> upper(m_);
        if (std::abs(glm::determinant(upper)) < T(1e-8)) {
            return Matrix4x4<T>();
        }
        return Matrix4x4<T>(Native(glm::inverseTranspose(upper)));
    }

    Matrix4x4<T> transpose() const { return Matrix4x4<T>(glm::transpose(m_)); }

  private:
    Native m_;
};

using Vec3f = Vector3<float, Space::World>;
using Mat4f = Matrix4x4<float>;
using Rgba = Vector4<float, Space::Color>;

// Bridges to glm for the shading math.
template <typename SpaceTag> glm::vec3 toGlm(const Vector3<float, SpaceTag>& v) {
    return glm::vec3(v.x, v.y, v.z);
}

template <typename SpaceTag> glm::vec4 toGlm(const Vector4<float, SpaceTag>& v) {
    return glm::vec4(v.x, v.y, v.z, v.w);
}

inline Vec3f fromGlm(const glm::vec3& v) {
    return Vec3f(v.x, v.y, v.z);
}

inline Rgba rgbaFromGlm(const glm::vec4& v) {
    return Rgba(v.x, v.y, v.z, v.w);
}

} // namespace strata

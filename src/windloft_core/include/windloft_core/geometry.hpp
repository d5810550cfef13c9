#pragma once

#include <array>

namespace windloft::core {
using Vec2 = std::array<double, 2>;
using Vec3 = std::array<double, 3>;
using Mat3 = std::array<std::array<double, 3>, 3>;  // row-major

constexpr double kPi = 3.14159265358979323846;

inline Vec3 operator+(const Vec3& a, const Vec3& b) {
  return {a[0] + b[0], a[1] + b[1], a[2] + b[2]};
}

inline Vec3 operator-(const Vec3& a, const Vec3& b) {
  return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

inline Vec3 operator*(const double s, const Vec3& a) {
  return {s * a[0], s * a[1], s * a[2]};
}

inline Vec2 operator+(const Vec2& a, const Vec2& b) {
  return {a[0] + b[0], a[1] + b[1]};
}

inline Vec2 operator-(const Vec2& a, const Vec2& b) {
  return {a[0] - b[0], a[1] - b[1]};
}

inline Vec2 operator*(const double s, const Vec2& a) {
  return {s * a[0], s * a[1]};
}

double dot(const Vec3& a, const Vec3& b);
Vec3 cross(const Vec3& a, const Vec3& b);
double norm(const Vec3& a);
double distance(const Vec2& a, const Vec2& b);
double distance(const Vec3& a, const Vec3& b);

Mat3 identity_matrix();
Mat3 multiply(const Mat3& a, const Mat3& b);
Mat3 transpose(const Mat3& a);
Vec3 multiply(const Mat3& m, const Vec3& v);

// Active rotation R = Rz(yaw) * Ry(pitch) * Rx(roll), angles in degrees.
// Yaw turns about z, pitch about y, roll about x.
Mat3 rotation_matrix(double yaw_deg, double pitch_deg, double roll_deg);

// Rotation by angle_deg about the unit axis through the origin.
Mat3 axis_rotation_matrix(const Vec3& axis, double angle_deg);

struct RigidTransform {
  Mat3 rotation = identity_matrix();
  Vec3 translation {0.0, 0.0, 0.0};

  // Rotate first, then translate.
  Vec3 apply(const Vec3& point) const;
  RigidTransform inverse() const;
};

// Result applies `second` after `first`.
RigidTransform compose(const RigidTransform& first, const RigidTransform& second);
}  // namespace windloft::core

#include "windloft_core/geometry.hpp"

#include <cmath>
#include <stdexcept>

namespace windloft::core {
double dot(const Vec3& a, const Vec3& b) {
  return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

Vec3 cross(const Vec3& a, const Vec3& b) {
  return {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2], a[0] * b[1] - a[1] * b[0]};
}

double norm(const Vec3& a) {
  return std::sqrt(dot(a, a));
}

double distance(const Vec2& a, const Vec2& b) {
  const double dx = a[0] - b[0];
  const double dy = a[1] - b[1];
  return std::sqrt(dx * dx + dy * dy);
}

double distance(const Vec3& a, const Vec3& b) {
  return norm(a - b);
}

Mat3 identity_matrix() {
  Mat3 m {};
  m[0][0] = 1.0;
  m[1][1] = 1.0;
  m[2][2] = 1.0;
  return m;
}

Mat3 multiply(const Mat3& a, const Mat3& b) {
  Mat3 out {};
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      double sum = 0.0;
      for (int k = 0; k < 3; ++k) {
        sum += a[i][k] * b[k][j];
      }
      out[i][j] = sum;
    }
  }
  return out;
}

Mat3 transpose(const Mat3& a) {
  Mat3 out {};
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      out[i][j] = a[j][i];
    }
  }
  return out;
}

Vec3 multiply(const Mat3& m, const Vec3& v) {
  return {
    m[0][0] * v[0] + m[0][1] * v[1] + m[0][2] * v[2],
    m[1][0] * v[0] + m[1][1] * v[1] + m[1][2] * v[2],
    m[2][0] * v[0] + m[2][1] * v[1] + m[2][2] * v[2],
  };
}

Mat3 rotation_matrix(const double yaw_deg, const double pitch_deg, const double roll_deg) {
  const double a = yaw_deg * kPi / 180.0;
  const double b = pitch_deg * kPi / 180.0;
  const double g = roll_deg * kPi / 180.0;

  Mat3 rz = identity_matrix();
  rz[0][0] = std::cos(a);
  rz[0][1] = -std::sin(a);
  rz[1][0] = std::sin(a);
  rz[1][1] = std::cos(a);

  Mat3 ry = identity_matrix();
  ry[0][0] = std::cos(b);
  ry[0][2] = std::sin(b);
  ry[2][0] = -std::sin(b);
  ry[2][2] = std::cos(b);

  Mat3 rx = identity_matrix();
  rx[1][1] = std::cos(g);
  rx[1][2] = -std::sin(g);
  rx[2][1] = std::sin(g);
  rx[2][2] = std::cos(g);

  return multiply(rz, multiply(ry, rx));
}

Mat3 axis_rotation_matrix(const Vec3& axis, const double angle_deg) {
  const double length = norm(axis);
  if (length <= 0.0) {
    throw std::invalid_argument("Rotation axis must be non-zero.");
  }
  const Vec3 u = (1.0 / length) * axis;
  const double t = angle_deg * kPi / 180.0;
  const double c = std::cos(t);
  const double s = std::sin(t);
  const double ic = 1.0 - c;

  Mat3 m {};
  m[0][0] = c + u[0] * u[0] * ic;
  m[0][1] = u[0] * u[1] * ic - u[2] * s;
  m[0][2] = u[0] * u[2] * ic + u[1] * s;
  m[1][0] = u[1] * u[0] * ic + u[2] * s;
  m[1][1] = c + u[1] * u[1] * ic;
  m[1][2] = u[1] * u[2] * ic - u[0] * s;
  m[2][0] = u[2] * u[0] * ic - u[1] * s;
  m[2][1] = u[2] * u[1] * ic + u[0] * s;
  m[2][2] = c + u[2] * u[2] * ic;
  return m;
}

Vec3 RigidTransform::apply(const Vec3& point) const {
  return multiply(rotation, point) + translation;
}

RigidTransform RigidTransform::inverse() const {
  RigidTransform inv;
  inv.rotation = transpose(rotation);
  const Vec3 back = multiply(inv.rotation, translation);
  inv.translation = {-back[0], -back[1], -back[2]};
  return inv;
}

RigidTransform compose(const RigidTransform& first, const RigidTransform& second) {
  RigidTransform out;
  out.rotation = multiply(second.rotation, first.rotation);
  out.translation = multiply(second.rotation, first.translation) + second.translation;
  return out;
}
}  // namespace windloft::core

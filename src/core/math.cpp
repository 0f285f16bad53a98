#include "core/math.hpp"

#include <cmath>
#include <cstddef>

namespace lensgen {

bool FloatEqual(double a, double b, double threshold) {
  return std::abs(a - b) < threshold;
}


bool FloatEqualZero(double a, double threshold) {
  return a > -threshold && a < threshold;
}


double Dot3(const double* vec1, const double* vec2) {
  return vec1[0] * vec2[0] + vec1[1] * vec2[1] + vec1[2] * vec2[2];
}


void Cross3(const double* vec1, const double* vec2, double* vec) {
  vec[0] = vec1[1] * vec2[2] - vec1[2] * vec2[1];
  vec[1] = vec1[2] * vec2[0] - vec1[0] * vec2[2];
  vec[2] = vec1[0] * vec2[1] - vec1[1] * vec2[0];
}


double Norm3(const double* vec) {
  return std::sqrt(Dot3(vec, vec));
}


double DiffNorm3(const double* vec1, const double* vec2) {
  double v[3];
  Vec3FromTo(vec1, vec2, v);
  return Norm3(v);
}


bool Normalize3(double* vec) {
  double len = Norm3(vec);
  if (FloatEqualZero(len)) {
    return false;
  }
  vec[0] /= len;
  vec[1] /= len;
  vec[2] /= len;
  return true;
}


bool Normalized3(const double* vec, double* vec_out) {
  vec_out[0] = vec[0];
  vec_out[1] = vec[1];
  vec_out[2] = vec[2];
  return Normalize3(vec_out);
}


void Vec3FromTo(const double* vec1, const double* vec2, double* vec) {
  vec[0] = vec2[0] - vec1[0];
  vec[1] = vec2[1] - vec1[1];
  vec[2] = vec2[2] - vec1[2];
}


template <typename T>
Vec3<T>::Vec3() : val_{ 0, 0, 0 } {}


template <typename T>
Vec3<T>::Vec3(T x, T y, T z) : val_{ x, y, z } {}


template <typename T>
Vec3<T>::Vec3(const T* data) : val_{ data[0], data[1], data[2] } {}


template <typename T>
const T* Vec3<T>::val() const {
  return val_;
}


template <typename T>
T Vec3<T>::x() const {
  return val_[0];
}


template <typename T>
T Vec3<T>::y() const {
  return val_[1];
}


template <typename T>
T Vec3<T>::z() const {
  return val_[2];
}


template <typename T>
Vec3<T> Vec3<T>::Normalized() const {
  return Vec3<T>::Normalized(*this);
}


template <typename T>
bool Vec3<T>::IsFinite() const {
  return std::isfinite(val_[0]) && std::isfinite(val_[1]) && std::isfinite(val_[2]);
}


template <typename T>
Vec3<T> Vec3<T>::Normalized(const Vec3<T>& v) {
  T data[3];
  Normalized3(v.val_, data);
  return Vec3<T>(data);
}


template <typename T>
Vec3<T>& Vec3<T>::operator+=(const Vec3<T>& v) {
  for (int i = 0; i < 3; i++) {
    val_[i] += v.val_[i];
  }
  return *this;
}


template <typename T>
Vec3<T>& Vec3<T>::operator-=(const Vec3<T>& v) {
  for (int i = 0; i < 3; i++) {
    val_[i] -= v.val_[i];
  }
  return *this;
}


template <typename T>
Vec3<T>& Vec3<T>::operator/=(T a) {
  for (auto& i : val_) {
    i /= a;
  }
  return *this;
}


template <typename T>
Vec3<T>& Vec3<T>::operator*=(T a) {
  for (auto& i : val_) {
    i *= a;
  }
  return *this;
}


template <typename T>
Vec3<T> Vec3<T>::operator-() const {
  return Vec3<T>(-val_[0], -val_[1], -val_[2]);
}


template <typename T>
T Vec3<T>::Dot(const Vec3<T>& v1, const Vec3<T>& v2) {
  return Dot3(v1.val_, v2.val_);
}


template <typename T>
T Vec3<T>::Norm(const Vec3<T>& v) {
  return Norm3(v.val_);
}


template <typename T>
Vec3<T> Vec3<T>::Cross(const Vec3<T>& v1, const Vec3<T>& v2) {
  T data[3];
  Cross3(v1.val_, v2.val_, data);
  return Vec3<T>(data);
}


template <typename T>
Vec3<T> Vec3<T>::FromTo(const Vec3<T>& v1, const Vec3<T>& v2) {
  T data[3];
  Vec3FromTo(v1.val_, v2.val_, data);
  return Vec3<T>(data);
}

template class Vec3<double>;


bool operator==(const Vec3d& lhs, const Vec3d& rhs) {
  for (int i = 0; i < 3; i++) {
    if (!FloatEqual(lhs.val()[i], rhs.val()[i])) {
      return false;
    }
  }
  return true;
}


bool operator!=(const Vec3d& lhs, const Vec3d& rhs) {
  return !(lhs == rhs);
}

}  // namespace lensgen

#ifndef CORE_MATH_H_
#define CORE_MATH_H_

#include <cmath>
#include <cstddef>

namespace lensgen {

namespace math {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegreeToRad = kPi / 180.0;
constexpr double kDoubleEps = 1e-9;

}  // namespace math


template <typename T>
class Vec3 {
 public:
  Vec3();
  explicit Vec3(const T* data);
  Vec3(T x, T y, T z);

  T x() const;
  T y() const;
  T z() const;

  const T* val() const;

  Vec3<T> Normalized() const;

  Vec3<T>& operator+=(const Vec3<T>& v);
  Vec3<T>& operator-=(const Vec3<T>& v);
  Vec3<T>& operator/=(T a);
  Vec3<T>& operator*=(T a);
  Vec3<T> operator-() const;

  bool IsFinite() const;

  static Vec3<T> Normalized(const Vec3<T>& v);
  static T Dot(const Vec3<T>& v1, const Vec3<T>& v2);
  static T Norm(const Vec3<T>& v);
  static Vec3<T> Cross(const Vec3<T>& v1, const Vec3<T>& v2);
  static Vec3<T> FromTo(const Vec3<T>& v1, const Vec3<T>& v2);

 private:
  T val_[3];
};

template <typename T>
Vec3<T> operator+(Vec3<T> lhs, const Vec3<T>& rhs) {
  lhs += rhs;
  return lhs;
}

template <typename T>
Vec3<T> operator-(Vec3<T> lhs, const Vec3<T>& rhs) {
  lhs -= rhs;
  return lhs;
}

template <typename T>
Vec3<T> operator*(Vec3<T> v, T a) {
  v *= a;
  return v;
}

template <typename T>
Vec3<T> operator*(T a, Vec3<T> v) {
  v *= a;
  return v;
}

// Approximate comparison, within math::kDoubleEps for every component.
bool operator==(const Vec3<double>& lhs, const Vec3<double>& rhs);
bool operator!=(const Vec3<double>& lhs, const Vec3<double>& rhs);

using Vec3d = Vec3<double>;


bool FloatEqual(double a, double b, double threshold = math::kDoubleEps);
bool FloatEqualZero(double a, double threshold = math::kDoubleEps);

double Dot3(const double* vec1, const double* vec2);
void Cross3(const double* vec1, const double* vec2, double* vec);
double Norm3(const double* vec);
double DiffNorm3(const double* vec1, const double* vec2);

/**
 * @brief Normalize a vector in place.
 * @return false if the vector is (nearly) zero and is left untouched.
 */
bool Normalize3(double* vec);
bool Normalized3(const double* vec, double* vec_out);
void Vec3FromTo(const double* vec1, const double* vec2, double* vec);

}  // namespace lensgen

#endif  // CORE_MATH_H_

#pragma once

#include <cmath>
#include <ostream>

namespace lagrange
{
   // 3D point type used for positions, velocities and accelerations.
   // Also serves as the element type of the odeint state containers, which
   // need +, scalar * and default construction.
   struct Vector3
   {
      double x, y, z;

      Vector3(void) : x(0.0), y(0.0), z(0.0) {}
      Vector3(double ix, double iy, double iz) : x(ix), y(iy), z(iz) {}

      Vector3 operator+(const Vector3& v) const
      {
         return Vector3(x + v.x, y + v.y, z + v.z);
      }

      Vector3 operator-(const Vector3& v) const
      {
         return Vector3(x - v.x, y - v.y, z - v.z);
      }

      Vector3 operator-(void) const
      {
         return Vector3(-x, -y, -z);
      }

      Vector3 operator*(double s) const
      {
         return Vector3(x * s, y * s, z * s);
      }

      Vector3 operator/(double s) const
      {
         return Vector3(x / s, y / s, z / s);
      }

      Vector3& operator+=(const Vector3& v)
      {
         x += v.x; y += v.y; z += v.z;
         return *this;
      }

      Vector3& operator-=(const Vector3& v)
      {
         x -= v.x; y -= v.y; z -= v.z;
         return *this;
      }

      double dot(const Vector3& v) const
      {
         return x * v.x + y * v.y + z * v.z;
      }

      double magnitude(void) const
      {
         return std::sqrt(dot(*this));
      }

      bool isFinite(void) const
      {
         return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
      }

      bool operator==(const Vector3& v) const
      {
         return x == v.x && y == v.y && z == v.z;
      }

      bool operator!=(const Vector3& v) const
      {
         return !(*this == v);
      }
   };

   inline Vector3 operator*(double s, const Vector3& v)
   {
      return v * s;
   }

   inline std::ostream& operator<<(std::ostream& out, const Vector3& v)
   {
      out << v.x << "\t" << v.y << "\t" << v.z;
      return out;
   }

} // end namespace lagrange

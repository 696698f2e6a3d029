#pragma once

#include <string>

#include "Vector3.hpp"

namespace lagrange
{
   enum class BodyKind
   {
      STAR,
      GIANT,
      TERRESTRIAL
   };

   inline std::string kindName(BodyKind kind)
   {
      switch (kind)
      {
         case BodyKind::STAR :
            return "STAR";
         case BodyKind::GIANT :
            return "GIANT";
         case BodyKind::TERRESTRIAL :
            return "TERRESTRIAL";
      }
      return "UNKNOWN";
   }

   // kind, trojan flag and name never change after creation; position and
   // velocity are advanced by the integrator every step.
   struct CelestialBody
   {
      CelestialBody(BodyKind inputKind = BodyKind::TERRESTRIAL,
                    bool inputTrojan = false,
                    const std::string& inputName = "") :
         mass(0.0), radius(0.0),
         kind(inputKind), trojan(inputTrojan), name(inputName)
      {
      }

      BodyKind getKind(void) const
      {
         return kind;
      }

      bool isTrojan(void) const
      {
         return trojan;
      }

      const std::string& getName(void) const
      {
         return name;
      }

      // Name for log messages; unnamed bodies get their kind
      std::string label(void) const
      {
         return name.empty() ? "<unnamed " + kindName(kind) + ">" : name;
      }

      double mass;   // kg
      double radius; // m, informational only
      Vector3 position;
      Vector3 velocity;

   private:
      BodyKind kind;
      bool trojan;
      std::string name;
   };
}

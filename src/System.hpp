#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "CelestialBody.hpp"
#include "Errors.hpp"
#include "Vector3.hpp"

namespace lagrange
{
   // State containers handed to the odeint stepper
   typedef std::vector< double > scalar_type;
   typedef std::vector< Vector3 > container_type;

   // Mass-weighted centre of a set of bodies. Falls back to the plain mean
   // when the set carries no mass. A single body gives its own position
   // exactly.
   template< class Predicate >
   Vector3 center_of_mass(const std::vector<CelestialBody>& bodies, Predicate include)
   {
      Vector3 weighted, plain, last;
      double totalMass = 0.0;
      size_t count = 0;
      for (auto it = bodies.begin(); it != bodies.end(); it++)
      {
         if (!include(*it))
            continue;
         weighted += it->position * it->mass;
         plain += it->position;
         last = it->position;
         totalMass += it->mass;
         count++;
      }
      if (count == 1)
         return last;
      if (totalMass > 0.0)
         return weighted / totalMass;
      if (count > 0)
         return plain / static_cast<double>(count);
      return Vector3();
   }

   // The ordered bodies of one run plus the Trojan pair under study.
   // Bodies are never added or removed after construction.
   class System
   {
      public:

         System(std::vector<CelestialBody> inputBodies, spdlog::logger& logger) :
            bodies(std::move(inputBodies)),
            pairFound(false),
            trojanIndex(0),
            companionIndex(0),
            trojanFlagCount(0),
            starCount(0)
         {
            for (size_t i=0; i<bodies.size(); i++)
            {
               const CelestialBody& b = bodies[i];
               if (b.mass < 0.0)
                  throw ConfigurationError("Body " + b.label() + " has negative mass.");
               if (b.radius < 0.0)
                  throw ConfigurationError("Body " + b.label() + " has negative radius.");
               if (b.getKind() == BodyKind::STAR)
                  starCount++;
               if (b.isTrojan())
               {
                  if (trojanFlagCount == 0)
                     trojanIndex = i;
                  trojanFlagCount++;
               }
            }

            logger.info("System has {} bodies, {} of them stars.", bodies.size(), starCount);

            if (starCount == 0)
               logger.warn("No star in the system, angles are measured about the system barycenter.");
            else if (starCount > 1)
               logger.warn("{} stars in the system, angles are measured about their barycenter.", starCount);

            if (trojanFlagCount == 0)
            {
               logger.warn("No body is flagged as a Trojan, resonance will not be evaluated.");
               return;
            }

            if (trojanFlagCount > 1)
               logger.warn("{} bodies flagged as Trojan; only {} is monitored, the others are plain gravitational sources.",
                           trojanFlagCount, bodies[trojanIndex].label());

            pairFound = findCompanion();
            if (pairFound)
               logger.info("Monitoring Trojan {} against companion {} ({}).",
                           bodies[trojanIndex].label(),
                           bodies[companionIndex].label(),
                           kindName(bodies[companionIndex].getKind()));
            else
               logger.warn("No GIANT or STAR precedes Trojan {}, resonance will not be evaluated.",
                           bodies[trojanIndex].label());
         }

         size_t size(void) const
         {
            return bodies.size();
         }

         const CelestialBody& body(size_t i) const
         {
            return bodies.at(i);
         }

         CelestialBody& body(size_t i)
         {
            return bodies.at(i);
         }

         const std::vector<CelestialBody>& getBodies(void) const
         {
            return bodies;
         }

         bool hasTrojanPair(void) const
         {
            return pairFound;
         }

         // Only meaningful when hasTrojanPair()
         size_t getTrojanIndex(void) const
         {
            return trojanIndex;
         }

         size_t getCompanionIndex(void) const
         {
            return companionIndex;
         }

         // Number of bodies carrying the Trojan flag, monitored or not
         size_t getTrojanFlagCount(void) const
         {
            return trojanFlagCount;
         }

         size_t getStarCount(void) const
         {
            return starCount;
         }

         double totalMass(void) const
         {
            double m = 0.0;
            for (auto it = bodies.begin(); it != bodies.end(); it++)
               m += it->mass;
            return m;
         }

         Vector3 barycenter(void) const
         {
            return center_of_mass(bodies, [](const CelestialBody&) { return true; });
         }

         // Point the orbital angles are measured about: the barycenter of
         // the stars, or of the whole system when there is no star.
         Vector3 primaryPosition(void) const
         {
            if (starCount == 0)
               return barycenter();
            return center_of_mass(bodies, [](const CelestialBody& b)
                                  { return b.getKind() == BodyKind::STAR; });
         }

         std::string primaryDescription(void) const
         {
            if (starCount == 0)
               return "system barycenter";
            if (starCount > 1)
               return "barycenter of " + std::to_string(starCount) + " stars";
            for (auto it = bodies.begin(); it != bodies.end(); it++)
               if (it->getKind() == BodyKind::STAR)
                  return "star " + it->label();
            return "star";
         }

         Vector3 totalMomentum(void) const
         {
            Vector3 p;
            for (auto it = bodies.begin(); it != bodies.end(); it++)
               p += it->velocity * it->mass;
            return p;
         }

         scalar_type getMass(void) const
         {
            scalar_type mass(bodies.size());
            for (size_t i=0; i<bodies.size(); i++)
               mass[i] = bodies[i].mass;
            return mass;
         }

         container_type getPositions(void) const
         {
            container_type q(bodies.size());
            for (size_t i=0; i<bodies.size(); i++)
               q[i] = bodies[i].position;
            return q;
         }

         container_type getVelocities(void) const
         {
            container_type v(bodies.size());
            for (size_t i=0; i<bodies.size(); i++)
               v[i] = bodies[i].velocity;
            return v;
         }

         void setState(const container_type& q, const container_type& v)
         {
            for (size_t i=0; i<bodies.size(); i++)
            {
               bodies[i].position = q[i];
               bodies[i].velocity = v[i];
            }
         }

   private:

         // Nearest preceding GIANT, otherwise nearest preceding STAR
         bool findCompanion(void)
         {
            for (size_t i=trojanIndex; i-- > 0; )
               if (bodies[i].getKind() == BodyKind::GIANT)
               {
                  companionIndex = i;
                  return true;
               }
            for (size_t i=trojanIndex; i-- > 0; )
               if (bodies[i].getKind() == BodyKind::STAR)
               {
                  companionIndex = i;
                  return true;
               }
            return false;
         }

         std::vector<CelestialBody> bodies;
         bool pairFound;
         size_t trojanIndex;
         size_t companionIndex;
         size_t trojanFlagCount;
         size_t starCount;
   };

} // end namespace lagrange

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/numeric/odeint.hpp>
#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "System.hpp"
#include "Utils.hpp"

namespace lagrange
{
   // Near-coincident pair whose mutual force was skipped. One record per
   // pair, covering every step where the pair was too close.
   struct DegenerateGeometryWarning
   {
      size_t first, second;              // body indices, first < second
      std::string firstName, secondName;
      size_t firstStep, lastStep;        // 1-based step indices
      size_t occurrences;
      double closestDistance;            // m
   };

   // Acceleration on every body from positions. Pairs closer than epsilon
   // are skipped and listed in coincident.
   struct nbody_acceleration
   {
      const scalar_type &mass;
      double gravitational_constant;
      double epsilon;
      std::vector< std::pair<size_t, size_t> > &coincident;
      std::vector< double > &coincidentDistance;

      nbody_acceleration(const scalar_type &inputMass, double inputG, double inputEpsilon,
                         std::vector< std::pair<size_t, size_t> > &inputCoincident,
                         std::vector< double > &inputCoincidentDistance) :
         mass(inputMass), gravitational_constant(inputG), epsilon(inputEpsilon),
         coincident(inputCoincident), coincidentDistance(inputCoincidentDistance)
      { }

      void operator()(const container_type &q, container_type &dvdt) const
      {
         const size_t n = q.size();
         for (size_t i=0; i<n; ++i)
            dvdt[i] = Vector3();

         for (size_t i=0; i<n; ++i)
         {
            for (size_t j=0; j<i; ++j)
            {
               Vector3 diff = q[i] - q[j]; // j towards i
               double d = diff.magnitude();
               if (d < epsilon)
               {
                  coincident.push_back(std::make_pair(j, i));
                  coincidentDistance.push_back(d);
                  continue;
               }

               // G m / d^2 along the unit vector, so tracers of zero mass
               // still feel the others
               double scale = gravitational_constant / (d * d * d);
               dvdt[j] += diff * (scale * mass[i]);
               dvdt[i] -= diff * (scale * mass[j]);
            }
         }
      }
   };

   // dq/dt = v
   struct nbody_drift
   {
      void operator()(const container_type &v, container_type &dqdt) const
      {
         for (size_t i=0; i<v.size(); ++i)
            dqdt[i] = v[i];
      }
   };

   // Advances a System by one fixed time step with pairwise Newtonian
   // gravity, O(n^2) per step.
   class GravityIntegrator
   {
      public:

         // The odeint symplectic Euler stepper is fed velocities as its
         // coordinate and positions as its momentum, which gives
         //    v += a(q) dt
         //    q += v dt
         // in that order.
         typedef boost::numeric::odeint::symplectic_euler< container_type > stepper_type;

         GravityIntegrator(double inputG, double inputEpsilon, spdlog::logger& mlogger) :
            gravitationalConstant(inputG),
            epsilon(inputEpsilon),
            stepsCompleted(0),
            logger(mlogger)
         {
            if (!(inputEpsilon >= 0.0))
               throw ConfigurationError("Coincidence epsilon must not be negative.");
         }

         void step(System& system, double dt)
         {
            if (!(dt > 0.0))
               throw ConfigurationError("Time step must be positive, got " + std::to_string(dt));

            scalar_type mass = system.getMass();
            container_type q = system.getPositions();
            container_type v = system.getVelocities();

            coincident.clear();
            coincidentDistance.clear();

            stepper.do_step(std::make_pair(nbody_acceleration(mass, gravitationalConstant, epsilon,
                                                              coincident, coincidentDistance),
                                           nbody_drift()),
                            v, q,
                            static_cast<double>(stepsCompleted) * dt, dt);

            const size_t thisStep = stepsCompleted + 1;

            for (size_t i=0; i<q.size(); i++)
            {
               if (!q[i].isFinite() || !v[i].isFinite())
               {
                  logger.error("Body {} has non-finite state after step {}.",
                               system.body(i).label(), thisStep);
                  throw NumericalInstabilityError("State of body " + system.body(i).label() +
                                                  " became non-finite at step " +
                                                  std::to_string(thisStep),
                                                  stepsCompleted);
               }
            }

            system.setState(q, v);
            stepsCompleted = thisStep;

            for (size_t k=0; k<coincident.size(); k++)
               recordDegenerate(system, coincident[k], coincidentDistance[k]);
         }

         size_t getStepsCompleted(void) const
         {
            return stepsCompleted;
         }

         std::vector<DegenerateGeometryWarning> getWarnings(void) const
         {
            std::vector<DegenerateGeometryWarning> out;
            for (auto it = warnings.begin(); it != warnings.end(); it++)
               out.push_back(it->second);
            return out;
         }

         double getGravitationalConstant(void) const
         {
            return gravitationalConstant;
         }

      private:

         void recordDegenerate(const System& system, std::pair<size_t, size_t> pair, double d)
         {
            auto found = warnings.find(pair);
            if (found == warnings.end())
            {
               DegenerateGeometryWarning w;
               w.first = pair.first;
               w.second = pair.second;
               w.firstName = system.body(pair.first).label();
               w.secondName = system.body(pair.second).label();
               w.firstStep = stepsCompleted;
               w.lastStep = stepsCompleted;
               w.occurrences = 1;
               w.closestDistance = d;
               warnings[pair] = w;
               logger.warn("Bodies {} and {} are {} m apart at step {}, skipping their mutual force.",
                           w.firstName, w.secondName, d, stepsCompleted);
               return;
            }

            DegenerateGeometryWarning& w = found->second;
            w.lastStep = stepsCompleted;
            w.occurrences++;
            if (d < w.closestDistance)
               w.closestDistance = d;
         }

         stepper_type stepper;
         double gravitationalConstant;
         double epsilon;
         size_t stepsCompleted;

         // Filled by the acceleration functor during a step
         std::vector< std::pair<size_t, size_t> > coincident;
         std::vector< double > coincidentDistance;

         std::map< std::pair<size_t, size_t>, DegenerateGeometryWarning > warnings;

         spdlog::logger& logger;
   };

} // end namespace lagrange

#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "System.hpp"

namespace lagrange
{
   enum class ResonanceState
   {
      STABLE,
      BROKEN,
      UNDETERMINED
   };

   inline std::string stateName(ResonanceState state)
   {
      switch (state)
      {
         case ResonanceState::STABLE :
            return "STABLE";
         case ResonanceState::BROKEN :
            return "BROKEN";
         case ResonanceState::UNDETERMINED :
            return "UNDETERMINED";
      }
      return "UNKNOWN";
   }

   // Result of one update. The transition fields are set once the monitor
   // has left STABLE.
   struct ResonanceStatus
   {
      ResonanceState state;
      size_t stepIndex;
      double elapsedTime;            // s

      bool evaluated;                // false when this step produced no ratio
      double ratio;                  // omega_trojan / omega_companion
      double deviation;              // percent
      double trojanRate;             // rad/s
      double companionRate;          // rad/s

      bool transitioned;             // left STABLE on some step
      size_t transitionStep;
      double transitionTime;         // s
      double transitionDeviation;    // percent, BROKEN only
      double transitionRatio;
   };

   // Wrap an angle difference into (-pi, pi]
   inline double unwrapAngle(double delta)
   {
      const double pi = std::acos(-1.);
      while (delta > pi)
         delta -= 2*pi;
      while (delta <= -pi)
         delta += 2*pi;
      return delta;
   }

   // Orbital period for an angular rate, infinite when the body does not turn
   inline double periodFromRate(double omega)
   {
      const double pi = std::acos(-1.);
      if (omega == 0.0)
         return std::numeric_limits<double>::infinity();
      return 2*pi / std::fabs(omega);
   }

   // Watches the instantaneous angular rates of the Trojan and its companion
   // about the primary. STABLE until the first step where the rate ratio
   // deviates from 1 by more than the margin; BROKEN is final.
   class ResonanceMonitor
   {
      public:

         ResonanceMonitor(const System& inputSystem, double inputMargin,
                          size_t inputZeroRateLimit, spdlog::logger& mlogger) :
            system(inputSystem),
            margin(inputMargin),
            zeroRateLimit(inputZeroRateLimit),
            zeroRateRun(0),
            trojanAngle(0.0),
            companionAngle(0.0),
            maxStableDeviation(0.0),
            logger(mlogger)
         {
            if (!(inputMargin >= 0.0))
               throw ConfigurationError("Resonance margin must not be negative.");
            if (inputZeroRateLimit == 0)
               throw ConfigurationError("Zero-rate step limit must be at least 1.");

            status.state = ResonanceState::STABLE;
            status.stepIndex = 0;
            status.elapsedTime = 0.0;
            status.evaluated = false;
            status.ratio = std::numeric_limits<double>::quiet_NaN();
            status.deviation = std::numeric_limits<double>::quiet_NaN();
            status.trojanRate = 0.0;
            status.companionRate = 0.0;
            status.transitioned = false;
            status.transitionStep = 0;
            status.transitionTime = 0.0;
            status.transitionDeviation = std::numeric_limits<double>::quiet_NaN();
            status.transitionRatio = std::numeric_limits<double>::quiet_NaN();

            if (!system.hasTrojanPair())
            {
               status.state = ResonanceState::UNDETERMINED;
               reason = "no Trojan pair designated";
               return;
            }

            trojanAngle = angleAboutPrimary(system.getTrojanIndex());
            companionAngle = angleAboutPrimary(system.getCompanionIndex());
         }

         // Consume the system state after a step of length dt
         ResonanceStatus update(double dt)
         {
            status.stepIndex++;
            status.elapsedTime = static_cast<double>(status.stepIndex) * dt;
            status.evaluated = false;

            if (!system.hasTrojanPair())
               return status;

            double newTrojan = angleAboutPrimary(system.getTrojanIndex());
            double newCompanion = angleAboutPrimary(system.getCompanionIndex());
            status.trojanRate = unwrapAngle(newTrojan - trojanAngle) / dt;
            status.companionRate = unwrapAngle(newCompanion - companionAngle) / dt;
            trojanAngle = newTrojan;
            companionAngle = newCompanion;

            if (status.state != ResonanceState::STABLE)
            {
               evaluate();
               return status;
            }

            if (status.companionRate == 0.0)
            {
               zeroRateRun++;
               logger.debug("Companion angular rate is zero at step {} ({} in a row).",
                            status.stepIndex, zeroRateRun);
               if (zeroRateRun >= zeroRateLimit)
               {
                  reason = "companion " + system.body(system.getCompanionIndex()).label() +
                     " has zero angular rate about the primary for " +
                     std::to_string(zeroRateRun) + " consecutive steps";
                  markTransition(ResonanceState::UNDETERMINED);
                  logger.warn("Resonance undetermined at step {}: {}.", status.stepIndex, reason);
               }
               return status;
            }
            zeroRateRun = 0;

            evaluate();

            if (status.deviation > margin)
            {
               markTransition(ResonanceState::BROKEN);
               status.transitionDeviation = status.deviation;
               status.transitionRatio = status.ratio;
               logger.info("Resonance broken at step {} (t = {} s): deviation {}% exceeds margin {}%.",
                           status.stepIndex, status.elapsedTime, status.deviation, margin);
            }
            else if (status.deviation > maxStableDeviation)
               maxStableDeviation = status.deviation;

            return status;
         }

         ResonanceState getState(void) const
         {
            return status.state;
         }

         const ResonanceStatus& getStatus(void) const
         {
            return status;
         }

         double getMargin(void) const
         {
            return margin;
         }

         // Largest deviation seen on steps that did not break the resonance
         double getMaxStableDeviation(void) const
         {
            return maxStableDeviation;
         }

         // Why the verdict is UNDETERMINED, empty otherwise
         const std::string& getUndeterminedReason(void) const
         {
            return reason;
         }

         double trojanPeriod(void) const
         {
            return periodFromRate(status.trojanRate);
         }

         double companionPeriod(void) const
         {
            return periodFromRate(status.companionRate);
         }

      private:

         double angleAboutPrimary(size_t index) const
         {
            Vector3 primary = system.primaryPosition();
            const Vector3& p = system.body(index).position;
            return std::atan2(p.y - primary.y, p.x - primary.x);
         }

         void evaluate(void)
         {
            if (status.companionRate == 0.0)
            {
               status.ratio = std::numeric_limits<double>::quiet_NaN();
               status.deviation = std::numeric_limits<double>::quiet_NaN();
               return;
            }
            status.evaluated = true;
            status.ratio = status.trojanRate / status.companionRate;
            status.deviation = std::fabs(status.ratio - 1.0) * 100.0;
         }

         void markTransition(ResonanceState newState)
         {
            status.state = newState;
            status.transitioned = true;
            status.transitionStep = status.stepIndex;
            status.transitionTime = status.elapsedTime;
         }

         const System& system;
         double margin;        // percent
         size_t zeroRateLimit;
         size_t zeroRateRun;

         double trojanAngle;
         double companionAngle;

         ResonanceStatus status;
         double maxStableDeviation;
         std::string reason;

         spdlog::logger& logger;
   };

} // end namespace lagrange

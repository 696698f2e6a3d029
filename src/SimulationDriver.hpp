#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "Configuration.hpp"
#include "Errors.hpp"
#include "GravityIntegrator.hpp"
#include "ResonanceMonitor.hpp"
#include "System.hpp"
#include "Utils.hpp"

namespace lagrange
{
   // Orbital periods of the pair at one moment of the run
   struct PeriodSample
   {
      double years;
      double trojanPeriodDays;
      double companionPeriodDays;
      double deviation; // percent
   };

   // Positions of every body, in input order, at one moment of the run
   struct StateSample
   {
      double years;
      container_type positions;
   };

   struct SimulationReport
   {
      ResonanceState state;
      size_t steps;
      double elapsedTime;          // s
      double timeStep;             // s
      double margin;               // percent

      // Set when state is BROKEN
      size_t breakStep;
      double breakTime;            // s
      double breakDeviation;       // percent
      double breakRatio;

      double maxStableDeviation;   // percent
      std::string trojanName;
      std::string companionName;
      std::string primary;
      std::string undeterminedReason;

      std::vector<DegenerateGeometryWarning> degenerateWarnings;
      std::vector<std::string> caveats;
      std::vector<PeriodSample> history;
      std::vector<StateSample> states; // empty unless a state file is configured
   };

   // Next multiple of interval after elapsed. Never earlier than elapsed, so
   // a caller stepping forward always gets past it.
   inline double nextDue(double elapsed, double interval)
   {
      double due = (std::floor(elapsed / interval) + 1.0) * interval;
      return due > elapsed ? due : elapsed + interval;
   }

   // Owns the system for one run and steps it until the resonance breaks,
   // becomes undetermined, or the horizon is reached.
   class SimulationDriver
   {
      public:

         SimulationDriver(System inputSystem, const RunConfiguration& rc,
                          spdlog::logger& mlogger) :
            config(checkConfiguration(rc, inputSystem)),
            system(std::move(inputSystem)),
            integrator(config.gravitationalConstant, config.coincidenceEpsilon, mlogger),
            monitor(system, config.margin, config.undeterminedAfterSteps, mlogger),
            logger(mlogger)
         {
         }

         // The monitor refers to the owned system
         SimulationDriver(const SimulationDriver&) = delete;
         SimulationDriver& operator=(const SimulationDriver&) = delete;

         size_t horizonSteps(void) const
         {
            double n = std::ceil(config.horizon / config.timeStep);
            if (n < 1.0)
               n = 1.0;
            return static_cast<size_t>(n);
         }

         const System& getSystem(void) const
         {
            return system;
         }

         SimulationReport run(void)
         {
            const double dt = config.timeStep;
            const size_t maxSteps = horizonSteps();
            const bool monitored = system.hasTrojanPair();
            const bool recordStates = !config.stateHistoryFilename.empty();

            std::vector<PeriodSample> history;
            std::vector<StateSample> states;
            double nextSample = config.sampleInterval;
            double nextProgress = config.progressInterval;

            logger.info("Simulation start: time step {} s, margin {}%, horizon {} years ({} steps).",
                        dt, config.margin, config.horizon / SECONDS_PER_YEAR, maxSteps);

            size_t step = 0;
            ResonanceStatus status = monitor.getStatus();
            while (step < maxSteps)
            {
               integrator.step(system, dt);
               step++;
               status = monitor.update(dt);
               const double elapsed = static_cast<double>(step) * dt;

               if (elapsed >= nextSample)
               {
                  if (status.evaluated)
                  {
                     PeriodSample sample;
                     sample.years = elapsed / SECONDS_PER_YEAR;
                     sample.trojanPeriodDays = monitor.trojanPeriod() / SECONDS_PER_DAY;
                     sample.companionPeriodDays = monitor.companionPeriod() / SECONDS_PER_DAY;
                     sample.deviation = status.deviation;
                     history.push_back(sample);
                  }
                  if (recordStates)
                  {
                     StateSample state;
                     state.years = elapsed / SECONDS_PER_YEAR;
                     state.positions = system.getPositions();
                     states.push_back(state);
                  }
                  nextSample = nextDue(elapsed, config.sampleInterval);
               }

               if (elapsed >= nextProgress)
               {
                  logger.info("{} years elapsed", elapsed / SECONDS_PER_YEAR);
                  if (status.evaluated)
                     logger.info("P1 = {} days, P2 = {} days",
                                 monitor.trojanPeriod() / SECONDS_PER_DAY,
                                 monitor.companionPeriod() / SECONDS_PER_DAY);
                  nextProgress = nextDue(elapsed, config.progressInterval);
               }

               if (status.state == ResonanceState::BROKEN)
                  break;
               if (monitored && status.state == ResonanceState::UNDETERMINED)
                  break;
            }
            logger.info("Simulation completed after {} steps.", step);

            return makeReport(status, step, std::move(history), std::move(states));
         }

      private:

         static const RunConfiguration& checkConfiguration(const RunConfiguration& rc,
                                                           const System& sys)
         {
            if (!(rc.timeStep > 0.0))
               throw ConfigurationError("Time step must be positive.");
            if (!(rc.margin >= 0.0))
               throw ConfigurationError("Margin must not be negative.");
            if (!(rc.horizon > 0.0))
               throw ConfigurationError("Horizon must be positive.");
            if (!(rc.sampleInterval > 0.0) || !(rc.progressInterval > 0.0))
               throw ConfigurationError("Sample and progress intervals must be positive.");
            // The step count has to fit a size_t
            const double steps = std::ceil(rc.horizon / rc.timeStep);
            if (!std::isfinite(steps) ||
                !(steps < static_cast<double>(std::numeric_limits<size_t>::max())))
               throw ConfigurationError("Time step is too small for the horizon, " +
                                        std::to_string(rc.horizon / rc.timeStep) + " steps.");
            if (sys.size() < 2)
               throw ConfigurationError("At least two bodies are needed, the system has " +
                                        std::to_string(sys.size()) + ".");
            return rc;
         }

         SimulationReport makeReport(const ResonanceStatus& status, size_t steps,
                                     std::vector<PeriodSample> history,
                                     std::vector<StateSample> states) const
         {
            SimulationReport report;
            report.state = status.state;
            report.steps = steps;
            report.elapsedTime = static_cast<double>(steps) * config.timeStep;
            report.timeStep = config.timeStep;
            report.margin = config.margin;
            report.breakStep = 0;
            report.breakTime = 0.0;
            report.breakDeviation = 0.0;
            report.breakRatio = 0.0;
            if (status.state == ResonanceState::BROKEN)
            {
               report.breakStep = status.transitionStep;
               report.breakTime = status.transitionTime;
               report.breakDeviation = status.transitionDeviation;
               report.breakRatio = status.transitionRatio;
            }
            report.maxStableDeviation = monitor.getMaxStableDeviation();
            report.primary = system.primaryDescription();
            if (system.hasTrojanPair())
            {
               report.trojanName = system.body(system.getTrojanIndex()).label();
               report.companionName = system.body(system.getCompanionIndex()).label();
            }
            report.undeterminedReason = monitor.getUndeterminedReason();
            report.degenerateWarnings = integrator.getWarnings();
            report.history = std::move(history);
            report.states = std::move(states);

            if (system.getTrojanFlagCount() > 1)
               report.caveats.push_back(std::to_string(system.getTrojanFlagCount()) +
                                        " bodies are flagged as Trojan; only " +
                                        system.body(system.getTrojanIndex()).label() +
                                        " was monitored.");
            if (!report.degenerateWarnings.empty())
               report.caveats.push_back("Mutual force was skipped for " +
                                        std::to_string(report.degenerateWarnings.size()) +
                                        " near-coincident pair(s).");
            if (report.state == ResonanceState::STABLE)
               report.caveats.push_back("Stable for the simulated duration only.");

            return report;
         }

         RunConfiguration config;
         System system;
         GravityIntegrator integrator;
         ResonanceMonitor monitor;
         spdlog::logger& logger;
   };

} // end namespace lagrange

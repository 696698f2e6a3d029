#pragma once

#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "SimulationDriver.hpp"
#include "Utils.hpp"

namespace lagrange
{
   inline void writeTextReport(std::ostream& out, const SimulationReport& report)
   {
      out << "Verdict: " << stateName(report.state) << "\n";
      if (!report.trojanName.empty())
         out << "Trojan pair: " << report.trojanName << " / " << report.companionName
             << " about the " << report.primary << "\n";
      out << "Time step: " << report.timeStep << " s, margin: " << report.margin << "%\n";
      out << "Simulated: " << report.steps << " steps, " << report.elapsedTime << " s ("
          << report.elapsedTime / SECONDS_PER_YEAR << " years)\n";

      switch (report.state)
      {
         case ResonanceState::BROKEN :
            out << "Resonance broken at step " << report.breakStep << " (t = "
                << report.breakTime << " s) with deviation " << report.breakDeviation
                << "% (rate ratio " << report.breakRatio << ")\n";
            break;

         case ResonanceState::STABLE :
            out << "The Trojan pair remained stable for "
                << std::floor(report.elapsedTime / SECONDS_PER_YEAR) << " years"
                << " (largest deviation " << report.maxStableDeviation << "%)\n";
            break;

         case ResonanceState::UNDETERMINED :
            out << "No verdict: " << report.undeterminedReason << "\n";
            break;
      }

      for (auto it = report.degenerateWarnings.begin(); it != report.degenerateWarnings.end(); it++)
         out << "Warning: " << it->firstName << " and " << it->secondName
             << " near-coincident on " << it->occurrences << " step(s) between "
             << it->firstStep << " and " << it->lastStep
             << ", closest " << it->closestDistance << " m\n";

      for (auto it = report.caveats.begin(); it != report.caveats.end(); it++)
         out << "Note: " << *it << "\n";
   }

   inline nlohmann::json reportToJson(const SimulationReport& report)
   {
      nlohmann::json j;
      j["state"] = stateName(report.state);
      j["steps"] = report.steps;
      j["elapsed_time"] = report.elapsedTime;
      j["time_step"] = report.timeStep;
      j["margin"] = report.margin;
      j["trojan"] = report.trojanName;
      j["companion"] = report.companionName;
      j["primary"] = report.primary;
      j["max_stable_deviation"] = report.maxStableDeviation;

      if (report.state == ResonanceState::BROKEN)
      {
         j["break"]["step"] = report.breakStep;
         j["break"]["time"] = report.breakTime;
         j["break"]["deviation"] = report.breakDeviation;
         j["break"]["ratio"] = report.breakRatio;
      }
      if (report.state == ResonanceState::UNDETERMINED)
         j["undetermined_reason"] = report.undeterminedReason;

      j["degenerate_pairs"] = nlohmann::json::array();
      for (auto it = report.degenerateWarnings.begin(); it != report.degenerateWarnings.end(); it++)
      {
         nlohmann::json w;
         w["bodies"] = { it->firstName, it->secondName };
         w["first_step"] = it->firstStep;
         w["last_step"] = it->lastStep;
         w["occurrences"] = it->occurrences;
         w["closest_distance"] = it->closestDistance;
         j["degenerate_pairs"].push_back(w);
      }
      j["caveats"] = report.caveats;
      return j;
   }

   inline void writeJsonReport(const std::string& filename, const SimulationReport& report,
                               spdlog::logger& logger)
   {
      std::ofstream out(filename);
      if (out.fail())
         throw ConfigurationError("Cannot write report file " + filename);
      out << std::setw(3) << reportToJson(report) << "\n";
      logger.info("Wrote report to {}", filename);
   }

   inline void writeHistory(std::ostream& out, const SimulationReport& report)
   {
      out << "years,trojan_period_days,companion_period_days,deviation_percent\n";
      out << std::setprecision(12);
      for (auto it = report.history.begin(); it != report.history.end(); it++)
         out << it->years << "," << it->trojanPeriodDays << ","
             << it->companionPeriodDays << "," << it->deviation << "\n";
   }

   inline void writeHistory(const std::string& filename, const SimulationReport& report,
                            spdlog::logger& logger)
   {
      std::ofstream out(filename);
      if (out.fail())
         throw ConfigurationError("Cannot write history file " + filename);
      writeHistory(out, report);
      logger.info("Wrote {} period samples to {}", report.history.size(), filename);
   }

   // One line per sample: time in years, then x y z of each body,
   // tab separated
   inline void writeStateHistory(std::ostream& out, const SimulationReport& report)
   {
      out << std::setprecision(12);
      for (auto it = report.states.begin(); it != report.states.end(); it++)
      {
         out << it->years;
         for (size_t i=0; i<it->positions.size(); ++i)
            out << "\t" << it->positions[i];
         out << "\n";
      }
   }

   inline void writeStateHistory(const std::string& filename, const SimulationReport& report,
                                 spdlog::logger& logger)
   {
      std::ofstream out(filename);
      if (out.fail())
         throw ConfigurationError("Cannot write state file " + filename);
      writeStateHistory(out, report);
      logger.info("Wrote {} state samples to {}", report.states.size(), filename);
   }

} // end namespace lagrange

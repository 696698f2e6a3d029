#pragma once

#include <string>
#include <vector>

#include <matplot/matplot.h>
#include <spdlog/spdlog.h>

#include "SimulationDriver.hpp"

namespace lagrange
{
   // Periods of both members of the pair against time, one line each.
   inline void plotPeriods(const std::string& filename, const SimulationReport& report,
                           spdlog::logger& logger)
   {
      if (report.history.empty())
      {
         logger.warn("No period samples, skipping plot {}.", filename);
         return;
      }

      std::vector<double> t, p1, p2;
      for (auto it = report.history.begin(); it != report.history.end(); it++)
      {
         t.push_back(it->years);
         p1.push_back(it->trojanPeriodDays);
         p2.push_back(it->companionPeriodDays);
      }

      matplot::figure(true);
      matplot::cla();
      matplot::title("Periods vs. Time");
      matplot::xlabel("Time (Years)");
      matplot::ylabel("Period (Days)");

      matplot::plot(t, p1, "r-");
      matplot::hold(matplot::on);
      matplot::plot(t, p2, "b-");
      matplot::legend({report.trojanName, report.companionName});
      matplot::hold(matplot::off);

      matplot::save(filename);
      logger.info("Saved period plot to {}", filename);
   }

} // end namespace lagrange

// LAGRANGE
// C++ simulation of Trojan planets in 1:1 resonance with a giant companion
//
// Usage: lagrange <system_file> <time_step> <margin> [config.json]
//
//    system_file  one body per line, see SystemFile.hpp
//    time_step    seconds
//    margin       allowed percent deviation from a 1:1 angular rate ratio

// C++ standard includes
#include <iostream>
#include <string>
#include <exception>
#include <memory>

// C includes (where possible the C++ standard version)
#include <cstdlib>

// External libraries
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

// LAGRANGE includes
#include "Configuration.hpp"
#include "Errors.hpp"
#include "PeriodPlot.hpp"
#include "Report.hpp"
#include "SimulationDriver.hpp"
#include "System.hpp"
#include "SystemFile.hpp"

using namespace std;
using namespace lagrange;

// Version info
const int LAGRANGE_MAJOR_VERSION = 0;
const int LAGRANGE_MINOR_VERSION = 1;

static void usage(void)
{
   cerr << "Usage: lagrange <system_file> <time_step> <margin> [config.json]\n"
        << "   time_step  simulation step in seconds (> 0)\n"
        << "   margin     allowed percent deviation from a 1:1 resonance (>= 0)\n";
}

static double parseArgument(const string& name, const string& text)
{
   size_t used = 0;
   double value = 0.0;
   try
   {
      value = stod(text, &used);
   }
   catch (const std::logic_error&)
   {
      throw ConfigurationError(name + " is not a number: " + text);
   }
   if (used != text.size())
      throw ConfigurationError(name + " is not a number: " + text);
   return value;
}

// ------  Main
int main(int argc, char* argv[])
{
   if (argc != 4 && argc != 5)
   {
      usage();
      return(EXIT_FAILURE);
   }

   try {
      auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("lagrange-log.txt", true);
      file_sink->set_level(spdlog::level::debug);

      spdlog::logger logger("multi_log", {console_sink, file_sink});
      logger.set_level(spdlog::level::debug);

      logger.info("LAGRANGE version {}.{}",
                   LAGRANGE_MAJOR_VERSION, LAGRANGE_MINOR_VERSION);

      try {
         string systemFileName = argv[1];

         // An explicitly named configuration must exist
         string configfileName = "lagrange.json";
         bool configRequired = false;
         if (argc == 5)
         {
            configfileName = argv[4];
            configRequired = true;
         }

         ConfigurationFile cf(configfileName, configRequired, logger);
         RunConfiguration rc = cf.getRunConfiguration();
         rc.timeStep = parseArgument("time_step", argv[2]);
         rc.margin = parseArgument("margin", argv[3]);

         logger.info("Reading system file {}", systemFileName);
         SystemFile sf(systemFileName, logger);
         System system(sf.getBodies(), logger);

         SimulationDriver driver(std::move(system), rc, logger);
         SimulationReport report = driver.run();

         writeTextReport(cout, report);

         if (!rc.reportFilename.empty())
            writeJsonReport(rc.reportFilename, report, logger);
         if (!rc.historyFilename.empty())
            writeHistory(rc.historyFilename, report, logger);
         if (!rc.stateHistoryFilename.empty())
            writeStateHistory(rc.stateHistoryFilename, report, logger);
         if (!rc.plotFilename.empty())
            plotPeriods(rc.plotFilename, report, logger);
      }
      catch (const ParseError& ex)
      {
         logger.error("System file error: {}", ex.what());
         return(EXIT_FAILURE);
      }
      catch (const ConfigurationError& ex)
      {
         logger.error("Configuration error: {}", ex.what());
         usage();
         return(EXIT_FAILURE);
      }
      catch (const NumericalInstabilityError& ex)
      {
         logger.error("Numerical instability: {} (last valid step {})",
                      ex.what(), ex.getLastValidStep());
         return(EXIT_FAILURE);
      }
      catch (const std::exception& ex)
      {
         logger.error("Standard exception: {}", ex.what());
         return(EXIT_FAILURE);
      }
   }
   catch (const spdlog::spdlog_ex &ex)
   {
      cerr << "Log init failed:" << ex.what() << endl;
      return(EXIT_FAILURE);
   }

   return(EXIT_SUCCESS);
}

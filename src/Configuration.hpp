#pragma once

#include <string>
#include <fstream>
#include <istream>
#include <list>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "Utils.hpp"

namespace lagrange {

   // Everything a run needs beyond the bodies themselves. Built once and
   // handed to the SimulationDriver.
   struct RunConfiguration
   {
      RunConfiguration(): timeStep(0.0),
                          margin(0.0),
                          gravitationalConstant(GRAVITATIONAL_CONSTANT),
                          horizon(1.0e6 * SECONDS_PER_YEAR),
                          coincidenceEpsilon(1.0),
                          undeterminedAfterSteps(10),
                          sampleInterval(SECONDS_PER_YEAR),
                          progressInterval(1000.0 * SECONDS_PER_YEAR)
      {
      }

      double timeStep;               // s, from the command line
      double margin;                 // percent, from the command line
      double gravitationalConstant;
      double horizon;                // s of simulated time
      double coincidenceEpsilon;     // m
      size_t undeterminedAfterSteps;
      double sampleInterval;         // s between period history samples
      double progressInterval;       // s between progress log messages
      std::string reportFilename;    // JSON report, empty for none
      std::string historyFilename;   // CSV period history, empty for none
      std::string plotFilename;      // period plot image, empty for none
      std::string stateHistoryFilename; // sampled body positions, empty for none
   };

   class ConfigurationFile
   {
      public:
         // A missing file is an error only when required; otherwise the
         // defaults stand.
         ConfigurationFile(const std::string& configFilename, bool required,
                           spdlog::logger& mlogger) : loaded(false), logger(mlogger)
         {
            // Logic to find the configuration file
            // First place it is found is used. Which is found is logged.
            std::list<std::filesystem::path> pathList;
            pathList.push_back(configFilename); // represents the current working directory
            pathList.push_back(getHome() / configFilename); // represents home directory
            pathList.push_back(getHome() / "lagrange" / configFilename);

            bool foundConfig = false;

            std::filesystem::path configPathUsing;

            for (auto it = pathList.begin(); it!=pathList.end(); it++)
            {
               std::ifstream testOpen(*it);
               if (!testOpen.fail())
               {
                  foundConfig = true;
                  configPathUsing = *it;
                  logger.debug("Found configuration file {}",(*it).generic_string());
                  break;
               }
            }

            if (!foundConfig)
            {
               if (required)
               {
                  logger.error("Cannot find a configuration file {}", configFilename);
                  throw ConfigurationError("Cannot open configuration file " + configFilename);
               }
               logger.info("No configuration file {}, using defaults.", configFilename);
               return;
            }

            std::ifstream configFile(configPathUsing.generic_string());
            read(configFile, configPathUsing.generic_string());
            logger.info("Read configuration from {}", configPathUsing.generic_string());
         }

         ConfigurationFile(std::istream& in, spdlog::logger& mlogger) : loaded(false), logger(mlogger)
         {
            read(in, "stream");
         }

         bool isLoaded(void) const
         {
            return loaded;
         }

         // Applies the file's settings on top of the defaults
         RunConfiguration getRunConfiguration(void) const
         {
            RunConfiguration rc;
            if (!loaded)
               return rc;

            try
            {
               if (jsonData.contains("gravitational_constant"))
               {
                  rc.gravitationalConstant = jsonData["gravitational_constant"].template get<double>();
                  if (!(rc.gravitationalConstant > 0.0))
                     throw ConfigurationError("gravitational_constant must be positive");
               }

               if (jsonData.contains("horizon_years"))
               {
                  double years = jsonData["horizon_years"].template get<double>();
                  if (!(years > 0.0))
                     throw ConfigurationError("horizon_years must be positive");
                  rc.horizon = years * SECONDS_PER_YEAR;
               }

               if (jsonData.contains("coincidence_epsilon"))
               {
                  rc.coincidenceEpsilon = jsonData["coincidence_epsilon"].template get<double>();
                  if (!(rc.coincidenceEpsilon >= 0.0))
                     throw ConfigurationError("coincidence_epsilon must not be negative");
               }

               if (jsonData.contains("undetermined_after_steps"))
               {
                  long steps = jsonData["undetermined_after_steps"].template get<long>();
                  if (steps < 1)
                     throw ConfigurationError("undetermined_after_steps must be at least 1");
                  rc.undeterminedAfterSteps = static_cast<size_t>(steps);
               }

               if (jsonData.contains("sample_interval_years"))
               {
                  double years = jsonData["sample_interval_years"].template get<double>();
                  if (!(years > 0.0))
                     throw ConfigurationError("sample_interval_years must be positive");
                  rc.sampleInterval = years * SECONDS_PER_YEAR;
               }

               if (jsonData.contains("progress_interval_years"))
               {
                  double years = jsonData["progress_interval_years"].template get<double>();
                  if (!(years > 0.0))
                     throw ConfigurationError("progress_interval_years must be positive");
                  rc.progressInterval = years * SECONDS_PER_YEAR;
               }

               // Optional outputs
               if (jsonData.contains("report_filename"))
                  rc.reportFilename = jsonData["report_filename"].template get<std::string>();
               if (jsonData.contains("history_filename"))
                  rc.historyFilename = jsonData["history_filename"].template get<std::string>();
               if (jsonData.contains("state_filename"))
                  rc.stateHistoryFilename = jsonData["state_filename"].template get<std::string>();
               if (jsonData.contains("period_plot"))
                  rc.plotFilename = jsonData["period_plot"].at("filename").template get<std::string>();
            }
            catch (const nlohmann::json::exception& ex)
            {
               logger.error("Bad value in configuration: {}", ex.what());
               throw ConfigurationError(std::string("Bad value in configuration: ") + ex.what());
            }

            return rc;
         }

   private:

      void read(std::istream& in, const std::string& source)
      {
         try
         {
            jsonData = nlohmann::json::parse(in);
         }
         catch (const nlohmann::json::parse_error& ex)
         {
            logger.error("Cannot parse configuration {}: {}", source, ex.what());
            throw ConfigurationError("Cannot parse configuration " + source + ": " + ex.what());
         }
         if (!jsonData.is_object())
            throw ConfigurationError("Configuration " + source + " is not a JSON object");
         loaded = true;
      }

      nlohmann::json jsonData;
      bool loaded;
      spdlog::logger& logger;

   }; // end class ConfigurationFile

} // end namespace lagrange

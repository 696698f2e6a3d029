#include <sstream>

#include <catch2/catch.hpp>

#include "Configuration.hpp"
#include "Errors.hpp"
#include "TestSupport.hpp"
#include "Utils.hpp"

using namespace lagrange;

TEST_CASE("configuration values override the defaults", "[configuration]")
{
   std::istringstream in(R"({
      "gravitational_constant": 1.0,
      "horizon_years": 20,
      "coincidence_epsilon": 0.5,
      "undetermined_after_steps": 3,
      "sample_interval_years": 0.5,
      "progress_interval_years": 2,
      "report_filename": "report.json",
      "history_filename": "periods.csv",
      "state_filename": "states.txt",
      "period_plot": { "filename": "periods.png" }
   })");
   ConfigurationFile cf(in, test::logger());
   RunConfiguration rc = cf.getRunConfiguration();

   REQUIRE(cf.isLoaded());
   REQUIRE(rc.gravitationalConstant == 1.0);
   REQUIRE(rc.horizon == Approx(20 * SECONDS_PER_YEAR));
   REQUIRE(rc.coincidenceEpsilon == 0.5);
   REQUIRE(rc.undeterminedAfterSteps == 3);
   REQUIRE(rc.sampleInterval == Approx(0.5 * SECONDS_PER_YEAR));
   REQUIRE(rc.progressInterval == Approx(2 * SECONDS_PER_YEAR));
   REQUIRE(rc.reportFilename == "report.json");
   REQUIRE(rc.historyFilename == "periods.csv");
   REQUIRE(rc.plotFilename == "periods.png");
   REQUIRE(rc.stateHistoryFilename == "states.txt");
}

TEST_CASE("omitted settings keep their defaults", "[configuration]")
{
   std::istringstream in("{}");
   ConfigurationFile cf(in, test::logger());
   RunConfiguration rc = cf.getRunConfiguration();
   RunConfiguration defaults;

   REQUIRE(rc.gravitationalConstant == GRAVITATIONAL_CONSTANT);
   REQUIRE(rc.horizon == defaults.horizon);
   REQUIRE(rc.sampleInterval == Approx(SECONDS_PER_YEAR));
   REQUIRE(rc.undeterminedAfterSteps == 10);
   REQUIRE(rc.reportFilename.empty());
   REQUIRE(rc.plotFilename.empty());
   REQUIRE(rc.stateHistoryFilename.empty());
}

TEST_CASE("missing configuration file", "[configuration]")
{
   const std::string name = "no-such-lagrange-config.json";

   ConfigurationFile optional(name, false, test::logger());
   REQUIRE_FALSE(optional.isLoaded());
   REQUIRE(optional.getRunConfiguration().horizon == RunConfiguration().horizon);

   REQUIRE_THROWS_AS(ConfigurationFile(name, true, test::logger()), ConfigurationError);
}

TEST_CASE("invalid configuration values are rejected", "[configuration]")
{
   const char* bad[] = {
      R"({"horizon_years": 0})",
      R"({"horizon_years": "long"})",
      R"({"gravitational_constant": -1})",
      R"({"coincidence_epsilon": -0.1})",
      R"({"undetermined_after_steps": 0})",
      R"({"sample_interval_years": -1})",
      R"({"period_plot": {}})"
   };

   for (const char* text : bad)
   {
      std::istringstream in(text);
      ConfigurationFile cf(in, test::logger());
      REQUIRE_THROWS_AS(cf.getRunConfiguration(), ConfigurationError);
   }

   std::istringstream notJson("{ horizon_years: ");
   REQUIRE_THROWS_AS(ConfigurationFile(notJson, test::logger()), ConfigurationError);

   std::istringstream notObject("[1, 2, 3]");
   REQUIRE_THROWS_AS(ConfigurationFile(notObject, test::logger()), ConfigurationError);
}

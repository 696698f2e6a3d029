#include <vector>

#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "GravityIntegrator.hpp"
#include "System.hpp"
#include "TestSupport.hpp"

using namespace lagrange;
using lagrange::test::makeBody;

TEST_CASE("two body momentum is conserved", "[integrator]")
{
   std::vector<CelestialBody> bodies;
   bodies.push_back(makeBody(BodyKind::GIANT, "Earth", 5.97e24, Vector3(), Vector3(3.0, -1.0, 0.5)));
   bodies.push_back(makeBody(BodyKind::TERRESTRIAL, "Moon", 7.35e22,
                             Vector3(3.844e8, 0.0, 0.0), Vector3(0.0, 1022.0, 0.0)));
   System system(bodies, test::logger());
   GravityIntegrator integrator(GRAVITATIONAL_CONSTANT, 1.0, test::logger());

   const Vector3 p0 = system.totalMomentum();
   const double scale = 7.35e22 * 1022.0;

   for (int i=0; i<10000; i++)
      integrator.step(system, 60.0);

   const Vector3 p1 = system.totalMomentum();
   REQUIRE((p1 - p0).magnitude() <= 1e-9 * scale);
   REQUIRE(integrator.getStepsCompleted() == 10000);

   // the moon has actually moved and been pulled around
   REQUIRE(system.body(1).position.y > 1e8);
   REQUIRE(system.body(1).velocity.x < 0.0);
}

TEST_CASE("a lone body drifts in a straight line", "[integrator]")
{
   const Vector3 p0(1.0e3, 2.0e3, 3.0e3);
   const Vector3 v0(10.0, -5.0, 2.0);
   std::vector<CelestialBody> bodies;
   bodies.push_back(makeBody(BodyKind::STAR, "Sun", 2e30, p0, v0));
   System system(bodies, test::logger());
   GravityIntegrator integrator(GRAVITATIONAL_CONSTANT, 1.0, test::logger());

   const double dt = 0.5;
   const int n = 100;
   for (int i=0; i<n; i++)
   {
      integrator.step(system, dt);
      REQUIRE(system.body(0).velocity == v0);
   }

   const Vector3 expected = p0 + v0 * (n * dt);
   REQUIRE(system.body(0).position.x == Approx(expected.x));
   REQUIRE(system.body(0).position.y == Approx(expected.y));
   REQUIRE(system.body(0).position.z == Approx(expected.z));
}

TEST_CASE("velocity is updated before position", "[integrator]")
{
   // Two unit masses 1 m apart with G = 1: a = 1 m/s^2 towards each other
   std::vector<CelestialBody> bodies;
   bodies.push_back(makeBody(BodyKind::GIANT, "A", 1.0, Vector3(0.0, 0.0, 0.0), Vector3()));
   bodies.push_back(makeBody(BodyKind::GIANT, "B", 1.0, Vector3(1.0, 0.0, 0.0), Vector3()));
   System system(bodies, test::logger());
   GravityIntegrator integrator(1.0, 1e-6, test::logger());

   integrator.step(system, 0.1);

   REQUIRE(system.body(0).velocity.x == Approx(0.1));
   REQUIRE(system.body(1).velocity.x == Approx(-0.1));
   REQUIRE(system.body(0).position.x == Approx(0.01));
   REQUIRE(system.body(1).position.x == Approx(0.99));
}

TEST_CASE("massless tracer is accelerated but exerts no force", "[integrator]")
{
   std::vector<CelestialBody> bodies;
   bodies.push_back(test::sun());
   bodies.push_back(makeBody(BodyKind::TERRESTRIAL, "Tracer", 0.0, Vector3(test::AU, 0.0, 0.0), Vector3()));
   System system(bodies, test::logger());
   GravityIntegrator integrator(GRAVITATIONAL_CONSTANT, 1.0, test::logger());

   integrator.step(system, test::HOUR);

   REQUIRE(system.body(0).position == Vector3());
   REQUIRE(system.body(0).velocity == Vector3());
   REQUIRE(system.body(1).velocity.x < 0.0);
   REQUIRE(system.body(1).velocity.x ==
           Approx(-GRAVITATIONAL_CONSTANT * test::SUN_MASS / (test::AU * test::AU) * test::HOUR));
}

TEST_CASE("coincident bodies are skipped and reported, never NaN", "[integrator]")
{
   std::vector<CelestialBody> bodies;
   bodies.push_back(makeBody(BodyKind::GIANT, "A", 1e27, Vector3(1e11, 0, 0), Vector3()));
   bodies.push_back(makeBody(BodyKind::GIANT, "B", 1e27, Vector3(1e11, 0, 0), Vector3()));
   System system(bodies, test::logger());
   GravityIntegrator integrator(GRAVITATIONAL_CONSTANT, 1.0, test::logger());

   for (int i=0; i<10; i++)
      integrator.step(system, test::HOUR);

   REQUIRE(system.body(0).position.isFinite());
   REQUIRE(system.body(1).position.isFinite());
   REQUIRE(system.body(0).velocity == Vector3());

   std::vector<DegenerateGeometryWarning> warnings = integrator.getWarnings();
   REQUIRE(warnings.size() == 1);
   REQUIRE(warnings[0].first == 0);
   REQUIRE(warnings[0].second == 1);
   REQUIRE(warnings[0].firstName == "A");
   REQUIRE(warnings[0].secondName == "B");
   REQUIRE(warnings[0].firstStep == 1);
   REQUIRE(warnings[0].lastStep == 10);
   REQUIRE(warnings[0].occurrences == 10);
   REQUIRE(warnings[0].closestDistance == 0.0);
}

TEST_CASE("non-positive time step is a configuration error", "[integrator]")
{
   std::vector<CelestialBody> bodies;
   bodies.push_back(test::sun());
   System system(bodies, test::logger());
   GravityIntegrator integrator(GRAVITATIONAL_CONSTANT, 1.0, test::logger());

   REQUIRE_THROWS_AS(integrator.step(system, 0.0), ConfigurationError);
   REQUIRE_THROWS_AS(integrator.step(system, -1.0), ConfigurationError);
   REQUIRE(integrator.getStepsCompleted() == 0);
}

TEST_CASE("non-finite state aborts the step and keeps the last valid state", "[integrator]")
{
   const Vector3 p0(1.0, 0.0, 0.0);
   std::vector<CelestialBody> bodies;
   bodies.push_back(makeBody(BodyKind::STAR, "Runaway", 1.0, p0, Vector3(1e308, 0.0, 0.0)));
   System system(bodies, test::logger());
   GravityIntegrator integrator(GRAVITATIONAL_CONSTANT, 1.0, test::logger());

   try
   {
      integrator.step(system, 1e10);
      FAIL("expected a numerical instability");
   }
   catch (const NumericalInstabilityError& ex)
   {
      REQUIRE(ex.getLastValidStep() == 0);
   }
   REQUIRE(system.body(0).position == p0);
   REQUIRE(integrator.getStepsCompleted() == 0);
}

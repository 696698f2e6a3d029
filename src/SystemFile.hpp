#pragma once

#include <cmath>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "CelestialBody.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

namespace lagrange
{
   // Reads a plaintext system description, one body per line:
   //
   //    GIANT trojan=False name=Jupiter mass=1.898e27 position=7.785e11,0,0 velocity=0,13070,0
   //
   // The kind comes first; keyed parameters follow in any order and take
   // their defaults when omitted.
   class SystemFile
   {
      public:

         SystemFile(const std::string& filename, spdlog::logger& mlogger) : logger(mlogger)
         {
            std::ifstream in(filename);
            if (in.fail())
            {
               logger.error("Cannot open system file {}", filename);
               throw ParseError("Cannot open system file " + filename, 0);
            }
            read(in);
            logger.info("Read {} bodies from {}", bodies.size(), filename);
         }

         SystemFile(std::istream& in, spdlog::logger& mlogger) : logger(mlogger)
         {
            read(in);
         }

         const std::vector<CelestialBody>& getBodies(void) const
         {
            return bodies;
         }

         static CelestialBody parseLine(const std::string& line, size_t lineNumber)
         {
            std::vector<std::string> params = split(line, " \t\r");
            if (params.empty())
               throw ParseError("Empty line", lineNumber);

            BodyKind kind = parseKind(params[0], lineNumber);
            bool trojan = false;
            std::string name;
            double mass = 0.0;
            double radius = 0.0;
            Vector3 position, velocity;

            for (size_t i=1; i<params.size(); i++)
            {
               size_t eq = params[i].find('=');
               if (eq == std::string::npos)
                  throw ParseError("Expected key=value, got '" + params[i] + "'", lineNumber);

               std::string key = params[i].substr(0, eq);
               std::string value = params[i].substr(eq + 1);

               if (key == "trojan")
                  trojan = parseBool(value, lineNumber);
               else if (key == "name")
                  name = value;
               else if (key == "mass")
                  mass = parseNonNegative(key, value, lineNumber);
               else if (key == "radius")
                  radius = parseNonNegative(key, value, lineNumber);
               else if (key == "position")
                  position = parseVector(key, value, lineNumber);
               else if (key == "velocity")
                  velocity = parseVector(key, value, lineNumber);
               else
                  throw ParseError("Unrecognized key '" + key + "'", lineNumber);
            }

            CelestialBody body(kind, trojan, name);
            body.mass = mass;
            body.radius = radius;
            body.position = position;
            body.velocity = velocity;
            return body;
         }

      private:

         void read(std::istream& in)
         {
            std::string line;
            size_t lineNumber = 0;
            while (std::getline(in, line))
            {
               lineNumber++;
               if (line.find_first_not_of(" \t\r") == std::string::npos)
                  continue;
               bodies.push_back(parseLine(line, lineNumber));
               const CelestialBody& b = bodies.back();
               logger.debug("Line {}: {} {} mass {} kg{}", lineNumber, kindName(b.getKind()),
                            b.label(), b.mass, b.isTrojan() ? " (Trojan)" : "");
            }
         }

         static BodyKind parseKind(const std::string& token, size_t lineNumber)
         {
            if (token == "STAR")
               return BodyKind::STAR;
            if (token == "GIANT")
               return BodyKind::GIANT;
            if (token == "TERRESTRIAL")
               return BodyKind::TERRESTRIAL;
            throw ParseError("Line must start with STAR, GIANT or TERRESTRIAL, got '" + token + "'",
                             lineNumber);
         }

         static bool parseBool(std::string value, size_t lineNumber)
         {
            tolower(value);
            if (value == "true" || value == "1")
               return true;
            if (value == "false" || value == "0")
               return false;
            throw ParseError("trojan must be True or False, got '" + value + "'", lineNumber);
         }

         static double parseReal(const std::string& key, const std::string& value, size_t lineNumber)
         {
            size_t used = 0;
            double x = 0.0;
            try
            {
               x = std::stod(value, &used);
            }
            catch (const std::logic_error&)
            {
               throw ParseError(key + " is not a number: '" + value + "'", lineNumber);
            }
            if (used != value.size() || !std::isfinite(x))
               throw ParseError(key + " is not a finite number: '" + value + "'", lineNumber);
            return x;
         }

         static double parseNonNegative(const std::string& key, const std::string& value, size_t lineNumber)
         {
            double x = parseReal(key, value, lineNumber);
            if (x < 0.0)
               throw ParseError(key + " must not be negative", lineNumber);
            return x;
         }

         static Vector3 parseVector(const std::string& key, const std::string& value, size_t lineNumber)
         {
            std::vector<std::string> vals = split(value, ",");
            if (vals.size() != 3)
               throw ParseError(key + " must be three comma-separated numbers", lineNumber);
            return Vector3(parseReal(key, vals[0], lineNumber),
                           parseReal(key, vals[1], lineNumber),
                           parseReal(key, vals[2], lineNumber));
         }

         std::vector<CelestialBody> bodies;
         spdlog::logger& logger;
   };

} // end namespace lagrange

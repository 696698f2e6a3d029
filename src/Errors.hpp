#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lagrange
{
   // Bad run parameters or an unusable system. Raised before any stepping.
   class ConfigurationError : public std::runtime_error
   {
      public:
         explicit ConfigurationError(const std::string& msg) :
            std::runtime_error(msg)
         {
         }
   };

   // Malformed line in a system file.
   class ParseError : public std::runtime_error
   {
      public:
         ParseError(const std::string& msg, size_t inputLine) :
            std::runtime_error(inputLine > 0 ?
                               "line " + std::to_string(inputLine) + ": " + msg :
                               msg),
            line(inputLine)
         {
         }

         // 1-based, 0 when the error is not tied to a line
         size_t lineNumber(void) const
         {
            return line;
         }

      private:
         size_t line;
   };

   // Positions or velocities went non-finite. The system is left at the
   // state of the last valid step.
   class NumericalInstabilityError : public std::runtime_error
   {
      public:
         NumericalInstabilityError(const std::string& msg, size_t inputLastValidStep) :
            std::runtime_error(msg),
            lastValidStep(inputLastValidStep)
         {
         }

         size_t getLastValidStep(void) const
         {
            return lastValidStep;
         }

      private:
         size_t lastValidStep;
   };

} // end namespace lagrange

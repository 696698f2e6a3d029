#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace lagrange
{
   const double SECONDS_PER_DAY = 60.0 * 60.0 * 24.0;
   const double SECONDS_PER_YEAR = SECONDS_PER_DAY * 365.25;

   const double GRAVITATIONAL_CONSTANT = 6.674e-11; // N m^2 / kg^2

   // In-place ASCII lower case, used for case-insensitive keywords
   inline void tolower(std::string& s)
   {
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
   }

   inline std::filesystem::path getHome(void)
   {
   #ifndef _WIN32
      const char* home = std::getenv("HOME");
   #else
      const char* home = std::getenv("USERPROFILE");
   #endif
      if (home != nullptr)
         return std::filesystem::path(home);
      return std::filesystem::current_path();
   }

   // Split on any run of the separator characters, dropping empty pieces
   inline std::vector<std::string> split(const std::string& s, const std::string& separators)
   {
      std::vector<std::string> pieces;
      size_t start = s.find_first_not_of(separators);
      while (start != std::string::npos)
      {
         size_t end = s.find_first_of(separators, start);
         pieces.push_back(s.substr(start, end - start));
         start = s.find_first_not_of(separators, end);
      }
      return pieces;
   }

}

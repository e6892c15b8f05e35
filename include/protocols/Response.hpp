#pragma once
/** @file  Response.hpp
 *  @brief SCPI reply line with fromWire.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <optional>
#include <string>

namespace rfsweep {
  namespace protocols {
    struct Response {
      std::string text; ///< reply with surrounding whitespace removed

      /// std::nullopt for an empty line (instrument answered nothing useful).
      static std::optional<Response> fromWire(const std::string& line) {
        const auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
          return std::nullopt;
        const auto last = line.find_last_not_of(" \t\r\n");
        return Response{ line.substr(first, last - first + 1) };
      }

      /// NR1/NR2/NR3 numeric reply ("+3.10000000E+09"); std::nullopt on garbage.
      std::optional<double> asDouble() const {
        if (text.empty())
          return std::nullopt;
        char* end = nullptr;
        const double v = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0')
          return std::nullopt;
        return v;
      }
    };
  } // namespace protocols
} // namespace rfsweep

#pragma once
/** @file  Command.hpp
 *  @brief SCPI command with toWire.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

namespace rfsweep {
  namespace protocols {
    struct Command {
      std::string payload;

      /// A query expects a reply line (`*IDN?`, `:CALC:MARK:X?`).
      bool isQuery() const { return !payload.empty() && payload.find('?') != std::string::npos; }

      std::string toWire() const { return payload + "\n"; }
    };

  } // namespace protocols
} // namespace rfsweep

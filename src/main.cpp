/* @file main.cpp
 * @brief rfsweep CLI: rfsweep <config.json>
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>

// rfsweep headers
#include "core/SystemCoordinator.hpp"

namespace {
  rfsweep::core::SystemCoordinator* gCoordinator = nullptr;

  extern "C" void onSigint(int) {
    if (gCoordinator)
      gCoordinator->handleAbort();
  }

  void printProgress(const rfsweep::protocols::ProgressEvent& ev) {
    std::cout << "[" << rfsweep::protocols::toString(ev.status) << "] board " << ev.boardNo
              << " ch " << ev.channelNo << "  " << ev.current << "/" << ev.total;
    if (ev.hex)
      std::cout << "  " << *ev.hex;
    std::cout << "  " << ev.message << std::endl;
  }
} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  rfsweep::core::SystemCoordinator coordinator;
  gCoordinator = &coordinator;
  std::signal(SIGINT, onSigint);

  try {
    coordinator.initialize(argv[1]);
    coordinator.setProgressSink(printProgress);

    const auto results = coordinator.run();

    std::printf("\n%-6s %16s %12s\n", "spot", "freq_hz", "power_dbm");
    for (const auto& r : results)
      std::printf("%-6s %16.1f %12.2f\n", r.sweepLabel.c_str(), r.frequencyHz, r.powerDbm);
  } catch (const std::exception& e) {
    std::cerr << "rfsweep: " << e.what() << "\n";
    gCoordinator = nullptr;
    return 1;
  }

  gCoordinator = nullptr;
  return 0;
}

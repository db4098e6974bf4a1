#include <exception>
#include <iostream>

#include "App.hpp"

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  App::Config cfg;
  switch (App::parseArgs(argc, argv, cfg)) {
    case App::ArgStatus::Missing:
      std::cout << "No input argument.\n";
      return 0;
    case App::ArgStatus::Invalid:
      std::cout << "Invalid input argument.\n";
      return 0;
    case App::ArgStatus::Ok:
      break;
  }

  try {
    App::Coordinator coordinator(cfg);
    coordinator.run();
  } catch (const std::exception& ex) {
    std::cout.flush();
    std::cerr << "[FAIL] " << ex.what() << "\n";
    return 1;
  }
  return 0;
}

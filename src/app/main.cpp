#include <iostream>

#include "bm/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    bm::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 2;
  }
}

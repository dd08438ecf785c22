#include <verity/server/config.hpp>
#include <verity/server/server.hpp>

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  try {
    // Command-line flags override a --config file
    auto config = verity::server::Config::LoadFromArgs(argc, argv);

    verity::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

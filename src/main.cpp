#include <spdlog/spdlog.h>
#include <sdc/cli/commands.hpp>

#include <iostream>

int main(int argc, const char* argv[]) {
  auto code = sdc::cli::dispatch(argc, argv, std::cout, std::cerr);
  spdlog::shutdown();
  return code;
}

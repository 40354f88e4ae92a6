#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <sonde/common/log.hpp>

int
main(int argc, char* argv[]) {
  sonde_log_init();
  return Catch::Session().run(argc, argv);
}

#include "resilab/cli/router.hpp"

int main(int argc, char** argv) {
  // All command parsing and output/exit-code contracts live in the router.
  return resilab::cli::Dispatch(argc, argv);
}

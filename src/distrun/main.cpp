#include "distrun/cli/router.hpp"

int main(int argc, char** argv) {
  return distrun::cli::Dispatch(argc, argv);
}

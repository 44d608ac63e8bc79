#include "comfytest/cli/router.hpp"

int main(int argc, char** argv) {
  return comfytest::cli::Dispatch(argc, argv);
}

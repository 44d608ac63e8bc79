#ifndef COMFYTEST_TESTS_COMMON_CLI_DISPATCH_HPP_
#define COMFYTEST_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "comfytest/cli/router.hpp"

#include <string>
#include <vector>

namespace comfytest::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return comfytest::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

} // namespace comfytest::tests::common

#endif // COMFYTEST_TESTS_COMMON_CLI_DISPATCH_HPP_

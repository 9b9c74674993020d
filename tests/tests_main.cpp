#include <gtest/gtest.h>

#include <absl/log/initialize.h>

auto main(int argc, char **argv) -> int {
  absl::InitializeLog();
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

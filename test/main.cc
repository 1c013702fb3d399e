#include "gtest/gtest.h"

#include "layover/logging.h"

int main(int argc, char** argv) {
  layover::s_verbosity = layover::log_lvl::error;

  ::testing::InitGoogleTest(&argc, argv);
  auto test_result = RUN_ALL_TESTS();

  return test_result;
}

/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Each test file registers its tests automatically via the TEST() macro.
 *
 * Build: cmake --build . --target allof_tests
 * Run:   ./allof_tests
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

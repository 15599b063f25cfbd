/**
 * @file test_main.cpp
 * @brief Google Test 主入口文件
 *
 * MultiOCR 核心库单元测试入口
 */

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <iostream>

int main(int argc, char** argv) {
    std::cout << "========================================" << std::endl;
    std::cout << "MultiOCR Core - Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    // 测试中只保留警告以上的日志
    spdlog::set_level(spdlog::level::warn);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

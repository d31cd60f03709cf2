/**
 * ************************************************************************
 *
 * @file IdGenerator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-03
 * @version 0.1
 * @brief 元素 ID 生成器实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "IdGenerator.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <random>

namespace animator::utils
{
namespace
{
constexpr uint32_t RANDOM_SUFFIX_LENGTH = 4;
constexpr uint32_t RADIX = 36;

std::atomic<uint64_t> g_idCounter{0};

char DigitToChar(uint32_t digit)
{
    return digit < 10 ? static_cast<char>('0' + digit) : static_cast<char>('a' + (digit - 10));
}
} // namespace

std::string ToBase36(uint64_t value)
{
    if (value == 0) return "0";

    std::string result;
    while (value > 0)
    {
        result.push_back(DigitToChar(static_cast<uint32_t>(value % RADIX)));
        value /= RADIX;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::string GenerateUniqueId()
{
    static std::mutex randomMutex;
    static std::mt19937 engine{std::random_device{}()};

    const auto timestamp = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
    const uint64_t counter = ++g_idCounter;

    std::string suffix;
    {
        std::lock_guard lock(randomMutex);
        std::uniform_int_distribution<uint32_t> dist(0, RADIX - 1);
        for (uint32_t i = 0; i < RANDOM_SUFFIX_LENGTH; ++i)
        {
            suffix.push_back(DigitToChar(dist(engine)));
        }
    }

    return "_anim_" + ToBase36(timestamp) + ToBase36(counter) + suffix;
}

} // namespace animator::utils

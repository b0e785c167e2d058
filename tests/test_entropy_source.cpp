#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <future>
#include <vector>

#include "testing_utils.hpp"
#include "token/entropy_source.hpp"

namespace yyid::tests {
// Системный источник заполняет буфер полностью
TEST(EntropySourceTest, SystemEntropyFillsBuffer)
{
    std::array<uint8_t, 16> first {};
    std::array<uint8_t, 16> second {};
    ASSERT_TRUE(readSystemEntropy(first.data(), first.size()));
    ASSERT_TRUE(readSystemEntropy(second.data(), second.size()));
    EXPECT_NE(first, second);

    // Пустой запрос допустим
    EXPECT_TRUE(readSystemEntropy(nullptr, 0));
}

// Большие запросы дочитываются до конца
TEST(EntropySourceTest, SystemEntropyLargeRequest)
{
    constexpr size_t SIZE = 1024 * 1024;
    std::vector<uint8_t> buffer(SIZE, 0);
    ASSERT_TRUE(readSystemEntropy(buffer.data(), buffer.size()));

    // В хвосте буфера должны появиться ненулевые байты
    const auto tailBegin = buffer.end() - 4096;
    EXPECT_TRUE(std::any_of(tailBegin, buffer.end(), [](uint8_t byte) { return byte != 0; }));
}

// Быстрый источник заполняет буфер произвольной длины
TEST(EntropySourceTest, FastEntropyFillsBuffer)
{
    for (const size_t size : { 1, 7, 8, 15, 16, 33 }) {
        std::vector<uint8_t> first(size, 0);
        std::vector<uint8_t> second(size, 0);
        ASSERT_TRUE(readFastEntropy(first.data(), first.size()));
        ASSERT_TRUE(readFastEntropy(second.data(), second.size()));
        if (size >= 8) {
            EXPECT_NE(first, second);
        }
    }
}

// Генератор быстрого источника инициализируется в каждом новом потоке отдельно
TEST(EntropySourceTest, FastEntropySeedsEachThread)
{
    constexpr size_t THREAD_COUNT = 8;

    auto readTask = []() {
        std::array<uint8_t, 16> buffer {};
        EXPECT_TRUE(readFastEntropy(buffer.data(), buffer.size()));
        return buffer;
    };

    std::vector<std::future<std::array<uint8_t, 16>>> futures;
    for (size_t i = 0; i < THREAD_COUNT; i++) {
        futures.push_back(std::async(std::launch::async, readTask));
    }

    std::vector<std::array<uint8_t, 16>> results;
    for (auto &future : futures) {
        results.push_back(future.get());
    }

    // Потоки не должны получить одинаковое начальное состояние
    std::sort(results.begin(), results.end());
    EXPECT_EQ(results.end(), std::adjacent_find(results.begin(), results.end()));
}

// Фабрики источников возвращают рабочие функции
TEST(EntropySourceTest, SourceFactories)
{
    const auto system = systemEntropySource();
    const auto fast = fastEntropySource();
    ASSERT_TRUE(static_cast<bool>(system));
    ASSERT_TRUE(static_cast<bool>(fast));

    std::array<uint8_t, 16> buffer {};
    EXPECT_TRUE(system(buffer.data(), buffer.size()));
    EXPECT_TRUE(fast(buffer.data(), buffer.size()));
}

// Тестовый детерминированный источник продолжает последовательность между вызовами
TEST(EntropySourceTest, SequenceSourceContinues)
{
    const auto source = makeSequenceSource({ 1, 2, 3 });
    std::array<uint8_t, 4> first {};
    std::array<uint8_t, 4> second {};
    ASSERT_TRUE(source(first.data(), first.size()));
    ASSERT_TRUE(source(second.data(), second.size()));

    EXPECT_EQ((std::array<uint8_t, 4> { 1, 2, 3, 1 }), first);
    EXPECT_EQ((std::array<uint8_t, 4> { 2, 3, 1, 2 }), second);
}
} // namespace yyid::tests

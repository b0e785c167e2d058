#include "token/entropy_source.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <random>

#if defined(YYID_PLATFORM_UNIX)
#include <cerrno>
#if defined(__linux__)
#include <sys/random.h>
#else
// На macOS getentropy() объявлена в <sys/random.h>, на BSD в <unistd.h>
#include <sys/types.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <sys/random.h>
#endif
#endif
#elif defined(YYID_PLATFORM_WINDOWS)
#include <windows.h>
#include <bcrypt.h>
#endif

#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
#if defined(YYID_PLATFORM_UNIX) && !defined(__linux__)
// getentropy() выдает не более 256 байт за вызов
constexpr size_t GETENTROPY_MAX_CHUNK = 256;
#endif
} // namespace

namespace yyid {
bool readSystemEntropy(uint8_t *buffer, size_t size)
{
#if defined(YYID_PLATFORM_UNIX) && defined(__linux__)
    size_t filled = 0;
    while (filled < size) {
        const auto result = getrandom(buffer + filled, size - filled, 0);
        if (result < 0) {
            if (errno == EINTR) {
                // Прерывание сигналом, повторяем запрос
                continue;
            }
            LOG_ERROR << "Не удалось получить случайные байты через getrandom(), ошибка: "
                      << utils::errnoToString(errno);
            return false;
        }
        // Короткое чтение возможно для больших запросов, дочитываем остаток
        filled += static_cast<size_t>(result);
    }
    return true;
#elif defined(YYID_PLATFORM_UNIX)
    size_t filled = 0;
    while (filled < size) {
        const auto chunk = std::min(size - filled, GETENTROPY_MAX_CHUNK);
        if (getentropy(buffer + filled, chunk) != 0) {
            LOG_ERROR << "Не удалось получить случайные байты через getentropy(), ошибка: "
                      << utils::errnoToString(errno);
            return false;
        }
        filled += chunk;
    }
    return true;
#elif defined(YYID_PLATFORM_WINDOWS)
    const auto status = BCryptGenRandom(nullptr, buffer, static_cast<ULONG>(size),
                                        BCRYPT_USE_SYSTEM_PREFERRED_RNG);
    if (!BCRYPT_SUCCESS(status)) {
        LOG_ERROR << "Не удалось получить случайные байты через BCryptGenRandom(), статус: "
                  << status;
        return false;
    }
    return true;
#else
    UNREACHABLE("Unsupported platform");
#endif
}

bool readFastEntropy(uint8_t *buffer, size_t size)
{
    // Для каждого потока создаем свой экземпляр генератора
    thread_local std::mt19937_64 rng;
    thread_local bool seeded = false;

    if (!seeded) {
        // std::random_device может выбросить std::system_error, если устройство недоступно
        try {
            rng.seed(std::random_device {}()
                     ^ static_cast<uint64_t>(
                         std::chrono::high_resolution_clock::now().time_since_epoch().count()));
        }
        catch (const std::exception &e) {
            LOG_ERROR << "Не удалось инициализировать быстрый генератор: " << e.what();
            return false;
        }
        seeded = true;
    }

    size_t filled = 0;
    while (filled < size) {
        const uint64_t value = rng();
        const auto chunk = std::min(size - filled, sizeof(value));
        std::memcpy(buffer + filled, &value, chunk);
        filled += chunk;
    }
    return true;
}

EntropySource systemEntropySource()
{
    return readSystemEntropy;
}

EntropySource fastEntropySource()
{
    return readFastEntropy;
}
} // namespace yyid

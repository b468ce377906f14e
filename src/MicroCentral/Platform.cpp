// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Platform.h>

#include <mutex>

#if MC_PLATFORM == MC_PLATFORM_UNIX
#include <stdio.h>
#include <chrono>

namespace MicroCentral {

void defaultDebugCbImpl(const char *msg) {
    printf("%s", msg);
}

std::chrono::steady_clock::time_point clock_reference;
std::once_flag clock_initialized;

unsigned long defaultTickCbImpl() {
    std::call_once(clock_initialized, [] () {
        clock_reference = std::chrono::steady_clock::now();
    });
    std::chrono::milliseconds ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - clock_reference);
    return (unsigned long) ms.count();
}

int64_t defaultUnixTimeCbImpl() {
    return (int64_t) std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} //namespace MicroCentral
#else
namespace MicroCentral {
void (*defaultDebugCbImpl)(const char*) = nullptr;
unsigned long (*defaultTickCbImpl)() = nullptr;
int64_t (*defaultUnixTimeCbImpl)() = nullptr;
} //namespace MicroCentral
#endif

namespace MicroCentral {

void (*getDefaultDebugCb())(const char*) {
    return defaultDebugCbImpl;
}

unsigned long (*getDefaultTickCb())() {
    return defaultTickCbImpl;
}

int64_t (*getDefaultUnixTimeCb())() {
    return defaultUnixTimeCbImpl;
}

// Time-based Pseudo RNG.
// Contains internal state which is mixed with the current timestamp
// each time it is called. Then this is passed through a multiply-with-carry
// PRNG operation to get a pseudo-random number.
uint32_t defaultRngCbImpl(void) {
    static std::mutex prng_mutex;
    static uint32_t prng_state = 1;
    std::lock_guard<std::mutex> lock(prng_mutex);
    uint32_t entropy = defaultTickCbImpl(); //ensure that RNG is only executed when defaultTickCbImpl is defined
    prng_state = (prng_state ^ entropy)*1664525U + 1013904223U; // assuming complement-2 integers and non-signaling overflow
    return prng_state;
}

uint32_t (*getDefaultRngCb())() {
    if (!defaultTickCbImpl) {
        //default RNG depends on default TickCb
        return nullptr;
    }
    return defaultRngCbImpl;
}

unsigned long (*tickCb)() = nullptr;
int64_t (*unixTimeCb)() = nullptr;

} //namespace MicroCentral

using namespace MicroCentral;

unsigned long mc_tick_ms() {
    if (!tickCb) {
        tickCb = getDefaultTickCb();
    }
    return tickCb ? tickCb() : 0;
}

void mc_set_timer(unsigned long (*get_ms)()) {
    tickCb = get_ms;
}

int64_t mc_unix_time() {
    if (!unixTimeCb) {
        unixTimeCb = getDefaultUnixTimeCb();
    }
    return unixTimeCb ? unixTimeCb() : 0;
}

void mc_set_unix_time(int64_t (*get_unix_time)()) {
    unixTimeCb = get_unix_time;
}

uint32_t mc_rng() {
    auto rng = getDefaultRngCb();
    return rng ? rng() : 0;
}

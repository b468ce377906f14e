// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_PLATFORM_H
#define MC_PLATFORM_H

#include <stdint.h>

#define MC_PLATFORM_NONE    0
#define MC_PLATFORM_UNIX    3

#ifndef MC_PLATFORM
#define MC_PLATFORM MC_PLATFORM_UNIX
#endif

#ifdef __cplusplus
namespace MicroCentral {

void (*getDefaultDebugCb())(const char*);
unsigned long (*getDefaultTickCb())();
int64_t (*getDefaultUnixTimeCb())();
uint32_t (*getDefaultRngCb())();

} //namespace MicroCentral

/*
 * Monotonic milliseconds. Used for timeouts and heartbeat supervision
 */
unsigned long mc_tick_ms();
void mc_set_timer(unsigned long (*get_ms)()); //replace the platform timer, e.g. for unit tests

/*
 * Wall clock in seconds since 1970-01-01T00:00:00Z. Used for the currentTime fields and the records
 */
int64_t mc_unix_time();
void mc_set_unix_time(int64_t (*get_unix_time)());

uint32_t mc_rng();

#endif //__cplusplus

#ifndef MC_MAX_JSON_CAPACITY
#if MC_PLATFORM == MC_PLATFORM_UNIX
#define MC_MAX_JSON_CAPACITY 16384
#else
#define MC_MAX_JSON_CAPACITY 4096
#endif
#endif

#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_DEBUG_H
#define MC_DEBUG_H

#include <MicroCentral/Platform.h>

#define MC_DL_NONE 0x00     //suppress all output to the console
#define MC_DL_ERROR 0x01    //report failures
#define MC_DL_WARN 0x02     //report observed or assumed inconsistent state
#define MC_DL_INFO 0x03     //inform about internal state changes
#define MC_DL_DEBUG 0x04    //relevant info for debugging
#define MC_DL_VERBOSE 0x05  //all output

#ifndef MC_DBG_LEVEL
#define MC_DBG_LEVEL MC_DL_INFO  //default
#endif

#ifndef MC_DBG_ENDL
#define MC_DBG_ENDL "\n"
#endif

#ifndef MC_DBG_MAXMSGSIZE
#define MC_DBG_MAXMSGSIZE 512
#endif

#ifdef __cplusplus

#include <mutex>

namespace MicroCentral {
class Debug {
private:
    void (*debugCb)(const char *msg) = nullptr;
    void (*debugCb2)(int lvl, const char *fn, int line, const char *msg) = nullptr;

    //every charge point session logs from its own thread
    std::mutex bufMutex;
    char buf [MC_DBG_MAXMSGSIZE] = {'\0'};
    int dbgLevel = MC_DBG_LEVEL;
public:
    Debug() = default;

    void setDebugCb(void (*debugCb)(const char *msg));
    void setDebugCb2(void (*debugCb2)(int lvl, const char *fn, int line, const char *msg));

    void setDebugLevel(int dbgLevel);
    int getDebugLevel() const {return dbgLevel;}

    bool setup();

    void operator()(int lvl, const char *fn, int line, const char *format, ...);
};

extern Debug debug;
} //namespace MicroCentral
#endif //__cplusplus

#if MC_DBG_LEVEL >= MC_DL_ERROR
#define MC_DBG_ERR(...) MicroCentral::debug(MC_DL_ERROR, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_ERR(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_WARN
#define MC_DBG_WARN(...) MicroCentral::debug(MC_DL_WARN, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_WARN(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_INFO
#define MC_DBG_INFO(...) MicroCentral::debug(MC_DL_INFO, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_INFO(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_DEBUG
#define MC_DBG_DEBUG(...) MicroCentral::debug(MC_DL_DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_DEBUG(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_VERBOSE
#define MC_DBG_VERBOSE(...) MicroCentral::debug(MC_DL_VERBOSE, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_VERBOSE(...) (void)0
#endif

#endif

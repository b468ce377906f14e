// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <string.h>
#include <stdarg.h>
#include <stdio.h>

#include <MicroCentral/Debug.h>

namespace MicroCentral {
const char *dbgLevelLabel [] = {
    "",         //MC_DL_NONE 0x00
    "ERROR",    //MC_DL_ERROR 0x01
    "warning",  //MC_DL_WARN 0x02
    "info",     //MC_DL_INFO 0x03
    "debug",    //MC_DL_DEBUG 0x04
    "verbose"   //MC_DL_VERBOSE 0x05
};

Debug debug;
} //namespace MicroCentral

using namespace MicroCentral;

void Debug::setDebugCb(void (*debugCb)(const char *msg)) {
    this->debugCb = debugCb;
}

void Debug::setDebugCb2(void (*debugCb2)(int lvl, const char *fn, int line, const char *msg)) {
    this->debugCb2 = debugCb2;
}

void Debug::setDebugLevel(int dbgLevel) {
    if (dbgLevel > MC_DBG_LEVEL) {
        MC_DBG_ERR("Debug level limited to %s by build config", dbgLevelLabel[MC_DBG_LEVEL]);
        dbgLevel = MC_DBG_LEVEL;
    }
    this->dbgLevel = dbgLevel;
}

bool Debug::setup() {
    if (!debugCb && !debugCb2) {
        // default-initialize console
        debugCb = getDefaultDebugCb(); //defaultDebugCb is null on unsupported platforms. Just inconvenient, not a failure
    }
    return true;
}

void Debug::operator()(int lvl, const char *fn, int line, const char *format, ...) {
    if (lvl > dbgLevel) {
        return;
    }

    std::lock_guard<std::mutex> lock(bufMutex);

    if (!debugCb && !debugCb2) {
        debugCb = getDefaultDebugCb();
    }

    if (debugCb2) {
        va_list args;
        va_start(args, format);
        auto ret = vsnprintf(buf, sizeof(buf), format, args);
        if (ret < 0 || (size_t)ret >= sizeof(buf)) {
            snprintf(buf + sizeof(buf) - sizeof(" [...]"), sizeof(" [...]"), " [...]");
        }
        va_end(args);

        debugCb2(lvl, fn, line, buf);
    } else if (debugCb) {
        size_t l = strlen(fn);
        while (l > 0 && fn[l-1] != '/' && fn[l-1] != '\\') {
            l--;
        }

        auto ret = snprintf(buf, sizeof(buf), "[MC] %s (%s:%i): ", dbgLevelLabel[lvl], fn + l, line);
        if (ret < 0 || (size_t)ret >= sizeof(buf)) {
            snprintf(buf + sizeof(buf) - sizeof(" : "), sizeof(" : "), " : ");
        }

        debugCb(buf);

        va_list args;
        va_start(args, format);
        ret = vsnprintf(buf, sizeof(buf), format, args);
        if (ret < 0 || (size_t)ret >= sizeof(buf)) {
            snprintf(buf + sizeof(buf) - sizeof(" [...]"), sizeof(" [...]"), " [...]");
        }
        va_end(args);

        debugCb(buf);
        debugCb(MC_DBG_ENDL);
    }
}

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_REQUESTCALLBACKS_H
#define MC_REQUESTCALLBACKS_H

#include <ArduinoJson.h>
#include <functional>

namespace MicroCentral {

using OnReceiveConfListener = std::function<void(JsonObject payload)>;
using OnReceiveReqListener = std::function<void(JsonObject payload)>;
using OnSendConfListener = std::function<void(JsonObject payload)>;
using OnTimeoutListener = std::function<void()>;
using OnReceiveErrorListener = std::function<void(const char *code, const char *description, JsonObject details)>; //will be called if OCPP communication partner returns error code
using OnAbortListener = std::function<void()>; //will be called whenever the engine stops waiting for the response: timeout, error, or connection closed

} //namespace MicroCentral
#endif

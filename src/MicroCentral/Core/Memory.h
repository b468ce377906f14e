// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_MEMORY_H
#define MC_MEMORY_H

#include <stddef.h>
#include <memory>
#include <ArduinoJson.h>

namespace MicroCentral {

using JsonDoc = DynamicJsonDocument;

/*
 * Allocate JSON documents. `tag` names the owner in the OOM diagnostics
 */
JsonDoc initJsonDoc(const char *tag, size_t capacity = 0);
std::unique_ptr<JsonDoc> makeJsonDoc(const char *tag, size_t capacity = 0);

} //namespace MicroCentral

#endif

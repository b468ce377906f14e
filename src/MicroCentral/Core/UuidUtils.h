// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_UUIDUTILS_H
#define MC_UUIDUTILS_H

#include <stdint.h>
#include <stddef.h>

#define MC_UUID_STR_SIZE (36 + 1)

namespace MicroCentral {
namespace UuidUtils {

// Generates a UUID (Universally Unique Identifier) and writes it into a given buffer
// Returns false if the generation failed
// The buffer must be at least 37 bytes long (36 characters + zero termination)
bool generateUUID(uint32_t (*rng)(), char *uuidBuffer, size_t size);

} //namespace UuidUtils
} //namespace MicroCentral
#endif

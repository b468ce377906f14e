// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/Memory.h>
#include <MicroCentral/Debug.h>

namespace MicroCentral {

JsonDoc initJsonDoc(const char *tag, size_t capacity) {
    JsonDoc doc (capacity);
    if (doc.capacity() < capacity) {
        MC_DBG_ERR("OOM: %s (%zu bytes)", tag ? tag : "JsonDoc", capacity);
    }
    return doc;
}

std::unique_ptr<JsonDoc> makeJsonDoc(const char *tag, size_t capacity) {
    auto doc = std::unique_ptr<JsonDoc>(new JsonDoc(capacity));
    if (doc->capacity() < capacity) {
        MC_DBG_ERR("OOM: %s (%zu bytes)", tag ? tag : "JsonDoc", capacity);
        return nullptr;
    }
    return doc;
}

} //namespace MicroCentral

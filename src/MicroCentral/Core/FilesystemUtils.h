// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_FILESYSTEMUTILS_H
#define MC_FILESYSTEMUTILS_H

#include <MicroCentral/Core/FilesystemAdapter.h>
#include <MicroCentral/Core/Memory.h>
#include <ArduinoJson.h>
#include <memory>

namespace MicroCentral {

class ArduinoJsonFileAdapter {
private:
    FileAdapter *file;
public:
    ArduinoJsonFileAdapter(FileAdapter *file) : file(file) { }

    size_t readBytes(char *buf, size_t len) {
        return file->read(buf, len);
    }

    int read() {
        return file->read();
    }

    size_t write(const uint8_t *buf, size_t len) {
        return file->write((const char*) buf, len);
    }

    size_t write(uint8_t c) {
        return file->write((const char*) &c, 1);
    }
};

namespace FilesystemUtils {

std::unique_ptr<JsonDoc> loadJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn);
bool storeJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, const JsonDoc& doc);

bool remove_if(std::shared_ptr<FilesystemAdapter> filesystem, std::function<bool(const char*)> pred);

}

}

#endif

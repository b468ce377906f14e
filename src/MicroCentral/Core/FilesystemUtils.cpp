// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/FilesystemAdapter.h>
#include <MicroCentral/Core/FilesystemUtils.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using namespace MicroCentral;

std::unique_ptr<JsonDoc> FilesystemUtils::loadJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn) {
    if (!filesystem || !fn || *fn == '\0') {
        MC_DBG_ERR("Format error");
        return nullptr;
    }

    if (strnlen(fn, MC_MAX_PATH_SIZE) >= MC_MAX_PATH_SIZE) {
        MC_DBG_ERR("Fn too long: %.*s", MC_MAX_PATH_SIZE, fn);
        return nullptr;
    }

    size_t fsize = 0;
    if (filesystem->stat(fn, &fsize) != 0) {
        MC_DBG_DEBUG("File does not exist: %s", fn);
        return nullptr;
    }

    if (fsize < 2) {
        MC_DBG_ERR("File too small for JSON, collect %s", fn);
        filesystem->remove(fn);
        return nullptr;
    }

    auto file = filesystem->open(fn, "r");
    if (!file) {
        MC_DBG_ERR("Could not open file %s", fn);
        return nullptr;
    }

    size_t capacity_init = (3 * fsize) / 2;

    //capacity = ceil capacity_init to the next power of two; should be at least 128

    size_t capacity = 128;
    while (capacity < capacity_init && capacity < MC_MAX_JSON_CAPACITY) {
        capacity *= 2;
    }
    if (capacity > MC_MAX_JSON_CAPACITY) {
        capacity = MC_MAX_JSON_CAPACITY;
    }

    std::unique_ptr<JsonDoc> doc;
    DeserializationError err = DeserializationError::NoMemory;
    ArduinoJsonFileAdapter fileReader {file.get()};

    while (err == DeserializationError::NoMemory && capacity <= MC_MAX_JSON_CAPACITY) {

        doc = makeJsonDoc("FilesystemUtils", capacity);
        if (!doc) {
            return nullptr;
        }
        err = deserializeJson(*doc, fileReader);

        capacity *= 2;

        file->seek(0); //rewind file to beginning
    }

    if (err) {
        MC_DBG_ERR("Error deserializing file %s: %s", fn, err.c_str());
        return nullptr;
    }

    MC_DBG_DEBUG("Loaded JSON file: %s", fn);

    return doc;
}

bool FilesystemUtils::storeJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, const JsonDoc& doc) {
    if (!filesystem || !fn || *fn == '\0') {
        MC_DBG_ERR("Format error");
        return false;
    }

    if (strnlen(fn, MC_MAX_PATH_SIZE) >= MC_MAX_PATH_SIZE) {
        MC_DBG_ERR("Fn too long: %.*s", MC_MAX_PATH_SIZE, fn);
        return false;
    }

    if (doc.isNull() || doc.overflowed()) {
        MC_DBG_ERR("Invalid JSON %s", fn);
        return false;
    }

    size_t written = 0;
    {
        auto file = filesystem->open(fn, "w");
        if (!file) {
            MC_DBG_ERR("Could not open file %s", fn);
            return false;
        }

        ArduinoJsonFileAdapter fileWriter {file.get()};

        //the files are meant to be inspected and edited by the operator
        written = serializeJsonPretty(doc, fileWriter);
    } //close file

    if (written < 2) {
        MC_DBG_ERR("Error writing file %s", fn);
        size_t file_size = 0;
        if (filesystem->stat(fn, &file_size) == 0) {
            MC_DBG_DEBUG("Collect invalid file %s", fn);
            filesystem->remove(fn);
        }
        return false;
    }

    MC_DBG_DEBUG("Wrote JSON file: %s", fn);
    return true;
}

bool FilesystemUtils::remove_if(std::shared_ptr<FilesystemAdapter> filesystem, std::function<bool(const char*)> pred) {
    if (!filesystem) {
        return false;
    }
    return filesystem->ftw_root([filesystem, pred] (const char *fpath) {
        if (fpath[0] != '.' && pred(fpath)) {

            char fn [MC_MAX_PATH_SIZE] = {'\0'};
            auto ret = snprintf(fn, MC_MAX_PATH_SIZE, MC_FILENAME_PREFIX "%s", fpath);
            if (ret < 0 || ret >= MC_MAX_PATH_SIZE) {
                MC_DBG_ERR("fn error: %i", ret);
                return -1;
            }

            filesystem->remove(fn);
            //no error handling - just skip failed file
        }
        return 0;
    }) == 0;
}

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/FilesystemAdapter.h>
#include <MicroCentral/Debug.h>

#include <string.h>

#if MC_USE_FILEAPI == MC_DISABLE_FS

namespace MicroCentral {

std::shared_ptr<FilesystemAdapter> makeDefaultFilesystemAdapter(FilesystemOpt config) {
    return nullptr;
}

} //end namespace MicroCentral

#elif MC_USE_FILEAPI == MC_POSIX_FILEAPI

#include <cstdio>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <errno.h>
#include <mutex>

namespace MicroCentral {

class PosixFileAdapter : public FileAdapter {
    FILE *file {nullptr};
public:
    PosixFileAdapter(FILE *file) : file(file) {}

    ~PosixFileAdapter() {
        fclose(file);
    }

    size_t read(char *buf, size_t len) override {
        return fread(buf, 1, len, file);
    }

    size_t write(const char *buf, size_t len) override {
        return fwrite(buf, 1, len, file);
    }

    size_t seek(size_t offset) override {
        return fseek(file, offset, SEEK_SET);
    }

    int read() override {
        return fgetc(file);
    }
};

class PosixFilesystemAdapter : public FilesystemAdapter {
public:
    FilesystemOpt config;
public:
    PosixFilesystemAdapter(FilesystemOpt config) : config(config) { }

    ~PosixFilesystemAdapter() = default;

    int stat(const char *path, size_t *size) override {
        struct ::stat st;
        auto ret = ::stat(path, &st);
        if (ret == 0) {
            if (S_ISDIR(st.st_mode)) {
                return -1;
            }
            *size = st.st_size;
        }
        return ret;
    }

    std::unique_ptr<FileAdapter> open(const char *fn, const char *mode) override {
        auto file = fopen(fn, mode);
        if (file) {
            return std::unique_ptr<FileAdapter>(new PosixFileAdapter(file));
        } else {
            MC_DBG_DEBUG("Failed to open file path %s", fn);
            return nullptr;
        }
    }

    bool remove(const char *fn) override {
        return ::remove(fn) == 0 || errno == ENOENT;
    }

    int ftw_root(std::function<int(const char *fpath)> fn) override {
        auto dir = opendir(MC_FILENAME_PREFIX);
        if (!dir) {
            MC_DBG_ERR("cannot open root directory: " MC_FILENAME_PREFIX);
            return -1;
        }

        int err = 0;
        while (auto entry = readdir(dir)) {
            err = fn(entry->d_name);
            if (err) {
                break;
            }
        }

        closedir(dir);
        return err;
    }
};

namespace FilesystemLocal {
std::mutex cacheMutex;
std::weak_ptr<FilesystemAdapter> filesystemCache;
}

std::shared_ptr<FilesystemAdapter> makeDefaultFilesystemAdapter(FilesystemOpt config) {

    std::lock_guard<std::mutex> lock(FilesystemLocal::cacheMutex);

    if (auto cached = FilesystemLocal::filesystemCache.lock()) {
        return cached;
    }

    if (!config.accessAllowed()) {
        MC_DBG_DEBUG("Access to FS not allowed by config");
        return nullptr;
    }

    if (config.mustMount()) {
        char dirPath [MC_MAX_PATH_SIZE] = MC_FILENAME_PREFIX;
        size_t len = strlen(dirPath);
        if (len > 1 && dirPath[len - 1] == '/') {
            dirPath[len - 1] = '\0';
        }
        if (mkdir(dirPath, 0755) != 0 && errno != EEXIST) {
            MC_DBG_ERR("cannot create root directory: " MC_FILENAME_PREFIX);
            return nullptr;
        }
    }

    auto fs = std::shared_ptr<FilesystemAdapter>(new PosixFilesystemAdapter(config));
    FilesystemLocal::filesystemCache = fs;
    return fs;
}

} //end namespace MicroCentral

#endif //switch-case MC_USE_FILEAPI

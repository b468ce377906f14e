// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_FILESYSTEMADAPTER_H
#define MC_FILESYSTEMADAPTER_H

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <functional>

#include <MicroCentral/Platform.h>

#define MC_DISABLE_FS      0
#define MC_POSIX_FILEAPI   4

#ifndef MC_USE_FILEAPI
#if MC_PLATFORM == MC_PLATFORM_UNIX
#define MC_USE_FILEAPI MC_POSIX_FILEAPI
#else
#define MC_USE_FILEAPI MC_DISABLE_FS
#endif
#endif //ndef MC_USE_FILEAPI

#ifndef MC_FILENAME_PREFIX
#define MC_FILENAME_PREFIX "./mc_store/"
#endif

#ifndef MC_MAX_PATH_SIZE
#define MC_MAX_PATH_SIZE 128
#endif

namespace MicroCentral {

class FilesystemOpt {
private:
    bool use = false;
    bool mount = false;
public:
    enum Mode : uint8_t {Deactivate, Use, Use_Mount};

    FilesystemOpt() = default;
    FilesystemOpt(Mode mode) {
        switch (mode) {
            case (FilesystemOpt::Use_Mount):
                mount = true;
                //fallthrough
            case (FilesystemOpt::Use):
                use = true;
                break;
            default:
                break;
        }
    }

    bool accessAllowed() const {return use;}
    bool mustMount() const {return mount;} //on UNIX: create the MC_FILENAME_PREFIX directory if missing
};

class FileAdapter {
public:
    virtual ~FileAdapter() = default;
    virtual size_t read(char *buf, size_t len) = 0;
    virtual size_t write(const char *buf, size_t len) = 0;
    virtual size_t seek(size_t offset) = 0;

    virtual int read() = 0;
};

class FilesystemAdapter {
public:
    virtual ~FilesystemAdapter() = default;
    virtual int stat(const char *path, size_t *size) = 0;
    virtual std::unique_ptr<FileAdapter> open(const char *fn, const char *mode) = 0;
    virtual bool remove(const char *fn) = 0;
    virtual int ftw_root(std::function<int(const char *fpath)> fn) = 0; //enumerate the files in the mc_store root folder
};

/*
 * Platform specific implementation. Currently supported:
 *     - POSIX-like API
 *
 * Returns null if the platform is not supported or the filesystem access is deactivated
 */
std::shared_ptr<FilesystemAdapter> makeDefaultFilesystemAdapter(FilesystemOpt config);

} //end namespace MicroCentral

#endif

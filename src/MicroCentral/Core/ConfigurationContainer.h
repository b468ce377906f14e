// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CONFIGURATIONCONTAINER_H
#define MC_CONFIGURATIONCONTAINER_H

#include <memory>
#include <vector>
#include <string>

#include <MicroCentral/Core/ConfigurationKeyValue.h>
#include <MicroCentral/Core/FilesystemAdapter.h>

namespace MicroCentral {

/*
 * Set of configurations which are stored together in one file. load() and save() define the
 * storage; the container keeps the configuration objects
 */
class ConfigurationContainer {
private:
    std::string filename;
protected:
    std::vector<std::shared_ptr<Configuration>> configurations;
public:
    ConfigurationContainer(const char *filename) : filename(filename) { }

    virtual ~ConfigurationContainer();

    const char *getFilename() const {return filename.c_str();}

    virtual bool load() = 0; //called during startup, to load the configurations with the stored value
    virtual bool save() = 0;

    std::shared_ptr<Configuration> createConfiguration(TConfig type, const char *key);
    void remove(Configuration *config);

    size_t size() const {return configurations.size();}
    std::shared_ptr<Configuration> getConfiguration(const char *key);
};

/*
 * Container which lives only in memory. Used for filenames starting with "/volatile" and when
 * no filesystem is configured
 */
std::unique_ptr<ConfigurationContainer> makeConfigurationContainerVolatile(const char *filename);

/*
 * Container which is backed by a JSON file on the filesystem
 */
std::unique_ptr<ConfigurationContainer> makeConfigurationContainerFile(std::shared_ptr<FilesystemAdapter> filesystem, const char *filename);

} //end namespace MicroCentral

#endif

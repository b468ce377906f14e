// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/ConfigurationContainer.h>
#include <MicroCentral/Core/FilesystemUtils.h>
#include <MicroCentral/Core/Memory.h>
#include <MicroCentral/Debug.h>

#include <string.h>
#include <algorithm>

#define MAX_CONFIGURATIONS 50

#define MC_CONFIG_CONTENT_TYPE "mc_config_file"
#define MC_CONFIG_FILE_VERSION "1.0"

using namespace MicroCentral;

ConfigurationContainer::~ConfigurationContainer() {

}

std::shared_ptr<Configuration> ConfigurationContainer::createConfiguration(TConfig type, const char *key) {
    std::shared_ptr<Configuration> res = makeConfiguration(type, key);
    if (!res) {
        return nullptr;
    }
    configurations.push_back(res);
    return res;
}

void ConfigurationContainer::remove(Configuration *config) {
    configurations.erase(std::remove_if(configurations.begin(), configurations.end(),
        [config] (const std::shared_ptr<Configuration>& entry) {
            return entry.get() == config;
        }), configurations.end());
}

std::shared_ptr<Configuration> ConfigurationContainer::getConfiguration(const char *key) {
    for (auto& entry : configurations) {
        if (!strcmp(entry->getKey(), key)) {
            return entry;
        }
    }
    return nullptr;
}

namespace MicroCentral {

class ConfigurationContainerVolatile : public ConfigurationContainer {
public:
    ConfigurationContainerVolatile(const char *filename) : ConfigurationContainer(filename) { }

    bool load() override {return true;}
    bool save() override {return true;}
};

class ConfigurationContainerFile : public ConfigurationContainer {
private:
    std::shared_ptr<FilesystemAdapter> filesystem;
    uint16_t revisionSum = 0;

    bool loaded = false;

    bool configurationsUpdated() {
        auto revisionSum_old = revisionSum;

        revisionSum = 0;
        for (auto& config : configurations) {
            revisionSum += config->getValueRevision();
        }

        return revisionSum != revisionSum_old;
    }

    //writes a stored entry to the configuration of the same key. Returns false if the entry is corrupt
    bool restore(JsonObject stored) {
        TConfig type;
        if (!deserializeTConfig(stored["type"] | "_Undefined", type)) {
            return false;
        }

        const char *key = stored["key"] | "";
        if (!*key) {
            return false;
        }

        JsonVariant value = stored["value"];
        bool valid = false;
        switch (type) {
            case TConfig::Int:
                valid = value.is<int>();
                break;
            case TConfig::Bool:
                valid = value.is<bool>();
                break;
            case TConfig::String:
                valid = value.is<const char*>();
                break;
        }
        if (!valid) {
            return false;
        }

        auto config = getConfiguration(key);
        if (config && config->getType() != type) {
            MC_DBG_ERR("conflicting type for %s - remove old config", key);
            remove(config.get());
            config = nullptr;
        }

        if (!config) {
            config = createConfiguration(type, key);
            if (!config) {
                MC_DBG_ERR("OOM: %s", key);
                return true;
            }
        }

        switch (type) {
            case TConfig::Int:
                config->setInt(value.as<int>());
                break;
            case TConfig::Bool:
                config->setBool(value.as<bool>());
                break;
            case TConfig::String:
                if (!config->setString(value.as<const char*>())) {
                    MC_DBG_WARN("%s: stored value discarded", key);
                }
                break;
        }
        return true;
    }
public:
    ConfigurationContainerFile(std::shared_ptr<FilesystemAdapter> filesystem, const char *filename) :
            ConfigurationContainer(filename), filesystem(filesystem) { }

    bool load() override {

        if (loaded) {
            return true;
        }

        if (!filesystem) {
            return false;
        }

        size_t file_size = 0;
        if (filesystem->stat(getFilename(), &file_size) != 0 // file does not exist
                || file_size == 0) {                         // file exists, but empty
            MC_DBG_DEBUG("create configuration file %s", getFilename());
            loaded = true;
            return save();
        }

        auto doc = FilesystemUtils::loadJson(filesystem, getFilename());
        if (!doc) {
            MC_DBG_ERR("failed to load %s", getFilename());
            return false;
        }

        JsonObject root = doc->as<JsonObject>();

        if (strcmp(root["head"]["content-type"] | "Invalid", MC_CONFIG_CONTENT_TYPE)) {
            MC_DBG_ERR("%s: unrecognized configuration file format", getFilename());
            return false;
        }

        if (strcmp(root["head"]["version"] | "Invalid", MC_CONFIG_FILE_VERSION)) {
            MC_DBG_ERR("%s: unsupported version", getFilename());
            return false;
        }

        JsonArray configurationsArray = root["configurations"];
        if (configurationsArray.size() > MAX_CONFIGURATIONS) {
            MC_DBG_ERR("%s: too many configurations (=%zu)", getFilename(), configurationsArray.size());
            return false;
        }

        for (JsonObject stored : configurationsArray) {
            if (!restore(stored)) {
                MC_DBG_ERR("%s: corrupt config", getFilename());
            }
        }

        configurationsUpdated();

        MC_DBG_DEBUG("loaded %s", getFilename());
        loaded = true;
        return true;
    }

    bool save() override {

        if (!filesystem) {
            return false;
        }

        if (!configurationsUpdated()) {
            return true; //nothing to be done
        }

        size_t jsonCapacity = 2 * JSON_OBJECT_SIZE(2); //head + configurations + head payload
        jsonCapacity += JSON_ARRAY_SIZE(configurations.size());
        jsonCapacity += configurations.size() * JSON_OBJECT_SIZE(3);

        if (jsonCapacity > MC_MAX_JSON_CAPACITY) {
            MC_DBG_ERR("%s: %zu configurations exceed the JSON capacity, crop", getFilename(), configurations.size());
            jsonCapacity = MC_MAX_JSON_CAPACITY;
        }

        auto doc = initJsonDoc("v16.Configuration.ContainerFile", jsonCapacity);
        JsonObject head = doc.createNestedObject("head");
        head["content-type"] = MC_CONFIG_CONTENT_TYPE;
        head["version"] = MC_CONFIG_FILE_VERSION;

        JsonArray configurationsArray = doc.createNestedArray("configurations");

        for (auto& config : configurations) {
            auto stored = configurationsArray.createNestedObject();
            if (stored.isNull()) {
                break; //doc full
            }

            //strings are stored by reference; the configs outlive doc
            stored["type"] = serializeTConfig(config->getType());
            stored["key"] = config->getKey();

            switch (config->getType()) {
                case TConfig::Int:
                    stored["value"] = config->getInt();
                    break;
                case TConfig::Bool:
                    stored["value"] = config->getBool();
                    break;
                case TConfig::String:
                    stored["value"] = config->getString();
                    break;
            }
        }

        if (!FilesystemUtils::storeJson(filesystem, getFilename(), doc)) {
            MC_DBG_ERR("could not save configs file: %s", getFilename());
            return false;
        }

        MC_DBG_DEBUG("saved %s", getFilename());
        return true;
    }
};

std::unique_ptr<ConfigurationContainer> makeConfigurationContainerVolatile(const char *filename) {
    return std::unique_ptr<ConfigurationContainer>(new ConfigurationContainerVolatile(filename));
}

std::unique_ptr<ConfigurationContainer> makeConfigurationContainerFile(std::shared_ptr<FilesystemAdapter> filesystem, const char *filename) {
    return std::unique_ptr<ConfigurationContainer>(new ConfigurationContainerFile(filesystem, filename));
}

} //end namespace MicroCentral

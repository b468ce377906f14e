// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/Configuration.h>
#include <MicroCentral/Debug.h>

#include <string.h>
#include <string>
#include <vector>

namespace MicroCentral {

namespace ConfigurationLocal {

struct Validator {
    std::string key;
    std::function<bool(const char*)> checkValue;
};

std::shared_ptr<FilesystemAdapter> filesystem;
std::vector<std::shared_ptr<ConfigurationContainer>> configurationContainers;
std::vector<Validator> validators;

ConfigurationContainer *declareContainer(const char *filename) {
    for (auto& container : configurationContainers) {
        if (!strcmp(container->getFilename(), filename)) {
            return container.get();
        }
    }

    MC_DBG_DEBUG("init new configurations container: %s", filename);

    std::shared_ptr<ConfigurationContainer> container;
    if (!filesystem || !strncmp(filename, CONFIGURATION_VOLATILE, strlen(CONFIGURATION_VOLATILE))) {
        container = makeConfigurationContainerVolatile(filename);
    } else {
        container = makeConfigurationContainerFile(filesystem, filename);
    }

    configurationContainers.push_back(container);
    return container.get();
}

//finds `key` in any container. A config of the wrong type is dropped
std::shared_ptr<Configuration> findConfiguration(TConfig type, const char *key) {
    for (auto& container : configurationContainers) {
        auto config = container->getConfiguration(key);
        if (!config) {
            continue;
        }
        if (config->getType() != type) {
            MC_DBG_ERR("conflicting type for %s - remove old config", key);
            container->remove(config.get());
            continue;
        }
        return config;
    }
    return nullptr;
}

bool applyFactoryDefault(Configuration& config, int factoryDefault) {
    config.setInt(factoryDefault);
    return true;
}

bool applyFactoryDefault(Configuration& config, bool factoryDefault) {
    config.setBool(factoryDefault);
    return true;
}

bool applyFactoryDefault(Configuration& config, const char *factoryDefault) {
    return config.setString(factoryDefault);
}

} //namespace ConfigurationLocal

using namespace ConfigurationLocal;

template<class T>
std::shared_ptr<Configuration> declareConfiguration(const char *key, T factoryDefault, const char *filename) {

    if (auto existing = findConfiguration(convertType<T>(), key)) {
        return existing;
    }

    auto container = declareContainer(filename);

    auto config = container->createConfiguration(convertType<T>(), key);
    if (!config) {
        return nullptr;
    }

    if (!applyFactoryDefault(*config, factoryDefault)) {
        MC_DBG_ERR("invalid factory default of %s", key);
        container->remove(config.get());
        return nullptr;
    }

    return config;
}

template std::shared_ptr<Configuration> declareConfiguration<int>(const char *key, int factoryDefault, const char *filename);
template std::shared_ptr<Configuration> declareConfiguration<bool>(const char *key, bool factoryDefault, const char *filename);
template std::shared_ptr<Configuration> declareConfiguration<const char*>(const char *key, const char *factoryDefault, const char *filename);

std::function<bool(const char*)> *getConfigurationValidator(const char *key) {
    for (auto& v : validators) {
        if (v.key == key) {
            return &v.checkValue;
        }
    }
    return nullptr;
}

void registerConfigurationValidator(const char *key, std::function<bool(const char*)> validator) {
    if (auto existing = getConfigurationValidator(key)) {
        *existing = validator;
        return;
    }
    validators.push_back(Validator{key, validator});
}

bool configuration_init(std::shared_ptr<FilesystemAdapter> _filesystem) {
    filesystem = _filesystem;
    return true;
}

void configuration_deinit() {
    decltype(configurationContainers)().swap(configurationContainers);
    decltype(validators)().swap(validators);
    filesystem.reset();
}

bool configuration_load() {
    bool success = true;
    for (auto& container : configurationContainers) {
        if (!container->load()) {
            success = false;
        }
    }
    return success;
}

bool configuration_save() {
    bool success = true;
    for (auto& container : configurationContainers) {
        if (!container->save()) {
            success = false;
        }
    }
    return success;
}

bool VALIDATE_UNSIGNED_INT(const char *value) {
    if (!value || !*value) {
        return false;
    }
    for(size_t i = 0; value[i] != '\0'; i++) {
        if (value[i] < '0' || value[i] > '9') {
            return false;
        }
    }
    return true;
}

} //end namespace MicroCentral

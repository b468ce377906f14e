// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CONFIGURATION_H
#define MC_CONFIGURATION_H

#include <MicroCentral/Core/ConfigurationKeyValue.h>
#include <MicroCentral/Core/ConfigurationContainer.h>
#include <MicroCentral/Core/FilesystemAdapter.h>

#include <memory>
#include <functional>

#define CONFIGURATION_FN (MC_FILENAME_PREFIX "mc-config.jsn")
#define CONFIGURATION_VOLATILE "/volatile"

/*
 * Keys of the server configuration
 */
#define MC_CONFIG_HEARTBEAT_INTERVAL     "HeartbeatInterval"      //int, seconds, dictated in BootNotification.conf
#define MC_CONFIG_HEARTBEAT_TIMEOUT_FACTOR "HeartbeatTimeoutFactor" //int, evict after interval * factor without traffic; 0 disables
#define MC_CONFIG_CALL_TIMEOUT           "CallTimeout"            //int, seconds until an outbound call fails with Timeout
#define MC_CONFIG_LISTEN_URL             "ListenUrl"              //string
#define MC_CONFIG_STORE_SEED_FILE        "StoreSeedFile"          //string, file name in MC_FILENAME_PREFIX

namespace MicroCentral {

/*
 * Returns the configuration of `key`, created with `factoryDefault` if it does not exist yet. A
 * configuration of the same key with another type is replaced. Filenames starting with
 * CONFIGURATION_VOLATILE are never written to the filesystem
 */
template <class T>
std::shared_ptr<Configuration> declareConfiguration(const char *key, T factoryDefault, const char *filename = CONFIGURATION_FN);

std::function<bool(const char*)> *getConfigurationValidator(const char *key);
void registerConfigurationValidator(const char *key, std::function<bool(const char*)> validator);

bool configuration_init(std::shared_ptr<FilesystemAdapter> filesytem);
void configuration_deinit();

bool configuration_load();
bool configuration_save();

//default implementation for common validator
bool VALIDATE_UNSIGNED_INT(const char*);

} //end namespace MicroCentral
#endif

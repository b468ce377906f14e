// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_GETCONFIGURATION_H
#define MC_GETCONFIGURATION_H

#include <string>
#include <vector>

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {
namespace Ocpp16 {

struct ConfigurationKeyValue {
    std::string key;
    bool readonly = false;
    bool hasValue = false;
    std::string value;
};

class GetConfiguration : public Operation {
private:
    std::vector<std::string> keys; //empty: request all
    std::vector<ConfigurationKeyValue> configurationKeys;
    std::vector<std::string> unknownKeys;
public:
    GetConfiguration(std::vector<std::string> keys = {});

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const std::vector<ConfigurationKeyValue>& getConfigurationKeys() const {return configurationKeys;}
    const std::vector<std::string>& getUnknownKeys() const {return unknownKeys;}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CHANGECONFIGURATION_H
#define MC_CHANGECONFIGURATION_H

#include <string>

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {
namespace Ocpp16 {

class ChangeConfiguration : public Operation {
private:
    std::string key;
    std::string value;
    std::string status; //Accepted, Rejected, RebootRequired or NotSupported
public:
    ChangeConfiguration(const char *key, const char *value);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

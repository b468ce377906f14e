// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_REMOTESTARTTRANSACTION_H
#define MC_REMOTESTARTTRANSACTION_H

#include <string>

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {
namespace Ocpp16 {

class RemoteStartTransaction : public Operation {
private:
    std::string idTag;
    int connectorId; //omitted if <= 0
    std::string chargingProfile; //JSON object; omitted if empty
    std::string status;
public:
    RemoteStartTransaction(const char *idTag, int connectorId = -1, const char *chargingProfile = nullptr);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

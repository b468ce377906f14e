// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_UNLOCKCONNECTOR_H
#define MC_UNLOCKCONNECTOR_H

#include <string>

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {
namespace Ocpp16 {

class UnlockConnector : public Operation {
private:
    int connectorId;
    std::string status; //Unlocked, UnlockFailed or NotSupported
public:
    UnlockConnector(int connectorId);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

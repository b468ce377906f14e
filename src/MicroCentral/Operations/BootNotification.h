// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_BOOTNOTIFICATION_H
#define MC_BOOTNOTIFICATION_H

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {

class Model;
struct ChargerRecord;

namespace Ocpp16 {

class BootNotification : public Operation {
private:
    Model& model;
    ChargerRecord& charger;
    int heartbeatInterval;
    const char *errorCode = nullptr;
public:
    BootNotification(Model& model, ChargerRecord& charger, int heartbeatInterval);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;

    const char *getErrorCode() override {return errorCode;}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

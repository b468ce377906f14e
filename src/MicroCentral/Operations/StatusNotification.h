// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_STATUSNOTIFICATION_H
#define MC_STATUSNOTIFICATION_H

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {

class Model;
struct ChargerRecord;

namespace Ocpp16 {

class StatusNotification : public Operation {
private:
    Model& model;
    ChargerRecord& charger;
    const char *errorCode = nullptr;
    const char *errorDescription = "";
public:
    StatusNotification(Model& model, ChargerRecord& charger);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;

    const char *getErrorCode() override {return errorCode;}
    const char *getErrorDescription() override {return errorDescription;}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

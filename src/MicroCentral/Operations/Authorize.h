// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_AUTHORIZE_H
#define MC_AUTHORIZE_H

#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Model/Authorization/AuthorizationService.h>

namespace MicroCentral {

class Model;

namespace Ocpp16 {

class Authorize : public Operation {
private:
    Model& model;
    ChargerRecord& charger;
    AuthorizationStatus status = AuthorizationStatus::Invalid;
public:
    Authorize(Model& model, ChargerRecord& charger);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

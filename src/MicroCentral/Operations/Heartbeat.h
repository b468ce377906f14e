// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_HEARTBEAT_H
#define MC_HEARTBEAT_H

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {

class Model;
struct ChargerRecord;

namespace Ocpp16 {

class Heartbeat : public Operation {
private:
    Model& model;
    ChargerRecord& charger;
public:
    Heartbeat(Model& model, ChargerRecord& charger);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

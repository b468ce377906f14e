// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_METERVALUES_H
#define MC_METERVALUES_H

#include <MicroCentral/Core/Operation.h>

#define MC_MEASURAND_ENERGY_IMPORT   "Energy.Active.Import.Register"
#define MC_MEASURAND_CURRENT_IMPORT  "Current.Import"
#define MC_MEASURAND_VOLTAGE         "Voltage"
#define MC_MEASURAND_TEMPERATURE     "Temperature"

namespace MicroCentral {

class Model;
struct ChargerRecord;

namespace Ocpp16 {

/*
 * Records each sampled value of a meterValue array as one event of `sessionId` (-1 if none).
 * Returns the number of recorded events. Used by MeterValues and StopTransaction.transactionData
 */
size_t recordMeterValues(Model& model, const ChargerRecord& charger, int connectorId, int sessionId, JsonArray meterValues);

class MeterValues : public Operation {
private:
    Model& model;
    ChargerRecord& charger;
    const char *errorCode = nullptr;
    const char *errorDescription = "";
public:
    MeterValues(Model& model, ChargerRecord& charger);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;

    const char *getErrorCode() override {return errorCode;}
    const char *getErrorDescription() override {return errorDescription;}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

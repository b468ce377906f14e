// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/MeterValues.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Debug.h>

#include <stdlib.h>
#include <string.h>

using MicroCentral::Ocpp16::MeterValues;
using MicroCentral::JsonDoc;

namespace MicroCentral {
namespace Ocpp16 {

//OCPP transmits sampled values as strings; some chargers send plain numbers
bool readSampledNumber(JsonVariant value, double& out) {
    if (value.is<double>()) {
        out = value.as<double>();
        return true;
    }
    if (!value.is<const char*>()) {
        return false;
    }
    const char *str = value.as<const char*>();
    if (!*str) {
        return false;
    }
    char *end = nullptr;
    double num = strtod(str, &end);
    if (!end || *end != '\0') {
        return false;
    }
    out = num;
    return true;
}

size_t recordMeterValues(Model& model, const ChargerRecord& charger, int connectorId, int sessionId, JsonArray meterValues) {

    auto& sessionService = *model.getSessionService();

    ChargeSessionRecord session;
    bool sessionOpen = false;
    double meterStart = 0.;
    if (sessionId > 0 && sessionService.getSession(sessionId, session) == FetchStatus::Found && session.isOpen()) {
        sessionOpen = sessionService.meterStartFor(sessionId, meterStart) == FetchStatus::Found;
    }

    size_t recorded = 0;
    double lastEnergy = 0.;
    bool hasLastEnergy = false;

    for (JsonObject meterValue : meterValues) {

        Timestamp timestamp = model.getClock().now();
        if (meterValue["timestamp"].is<const char*>() && !timestamp.setTime(meterValue["timestamp"])) {
            MC_DBG_WARN("invalid meterValue timestamp, use server time");
        }

        for (JsonObject sampledValue : meterValue["sampledValue"].as<JsonArray>()) {

            auto event = makeEventRecord(charger, MC_EVENT_METERVALUES, timestamp, connectorId, sessionId);
            serializeJson(sampledValue, event.data);

            const char *measurand = sampledValue["measurand"] | MC_MEASURAND_ENERGY_IMPORT;

            double value = 0.;
            if (readSampledNumber(sampledValue["value"], value)) {
                if (!strncmp(measurand, "Energy.Active.Import", strlen("Energy.Active.Import"))) {
                    if (!strcmp(sampledValue["unit"] | "Wh", "kWh")) {
                        value *= 1000.;
                    }
                    event.hasEnergy = true;
                    event.energy = value;
                    lastEnergy = value;
                    hasLastEnergy = true;
                } else if (!strcmp(measurand, MC_MEASURAND_CURRENT_IMPORT)) {
                    event.hasCurrent = true;
                    event.current = value;
                } else if (!strcmp(measurand, MC_MEASURAND_VOLTAGE)) {
                    event.hasVoltage = true;
                    event.voltage = value;
                } else if (!strcmp(measurand, MC_MEASURAND_TEMPERATURE)) {
                    event.hasTemperature = true;
                    event.temperature = value;
                }
                //other measurands are kept as data only
            } else {
                MC_DBG_DEBUG("non-numeric sample of %s", measurand);
            }

            if (sessionService.recordMeterSample(event)) {
                recorded++;
            }
        }
    }

    if (sessionOpen && hasLastEnergy) {
        double runningKwh = (lastEnergy - meterStart) / 1000.;
        if (runningKwh > 0. && !sessionService.updateRunningEnergy(sessionId, runningKwh)) {
            MC_DBG_ERR("could not update energy of session %i", sessionId);
        }
    }

    return recorded;
}

} //end namespace Ocpp16
} //end namespace MicroCentral

MeterValues::MeterValues(Model& model, ChargerRecord& charger) : model(model), charger(charger) {

}

const char* MeterValues::getOperationType(){
    return "MeterValues";
}

void MeterValues::processReq(JsonObject payload) {

    int connectorId = payload["connectorId"] | -1;
    if (connectorId < 0) {
        errorCode = "FormationViolation";
        errorDescription = "connectorId missing";
        return;
    }

    if (!payload["meterValue"].is<JsonArray>()) {
        errorCode = "FormationViolation";
        errorDescription = "meterValue missing";
        return;
    }

    int sessionId = payload["transactionId"] | -1;
    if (sessionId <= 0 && connectorId > 0) {
        ChargeSessionRecord session;
        if (model.getSessionService()->findOpenSession(charger, connectorId, session) == FetchStatus::Found) {
            sessionId = session.sessionId;
        }
    }

    auto recorded = recordMeterValues(model, charger, connectorId, sessionId, payload["meterValue"]);
    MC_DBG_DEBUG("%s/%i: recorded %zu samples for session %i", charger.name.c_str(), connectorId, recorded, sessionId);
}

std::unique_ptr<JsonDoc> MeterValues::createConf(){
    return createEmptyDocument();
}

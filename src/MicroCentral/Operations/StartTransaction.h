// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_STARTTRANSACTION_H
#define MC_STARTTRANSACTION_H

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {

class Model;
struct ChargerRecord;

namespace Ocpp16 {

/*
 * Opens the charge session. The idTag is not checked again: the answer is always Accepted, a failure
 * to open the session is answered with transactionId 0
 */
class StartTransaction : public Operation {
private:
    Model& model;
    ChargerRecord& charger;
    int transactionId = 0;
    const char *errorCode = nullptr;
    const char *errorDescription = "";
public:
    StartTransaction(Model& model, ChargerRecord& charger);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;

    const char *getErrorCode() override {return errorCode;}
    const char *getErrorDescription() override {return errorDescription;}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CHANGEAVAILABILITY_H
#define MC_CHANGEAVAILABILITY_H

#include <string>

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {
namespace Ocpp16 {

class ChangeAvailability : public Operation {
private:
    int connectorId;
    std::string type;
    std::string status; //Accepted, Rejected or Scheduled
public:
    ChangeAvailability(int connectorId, const char *type);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

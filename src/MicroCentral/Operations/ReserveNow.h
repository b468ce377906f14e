// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_RESERVENOW_H
#define MC_RESERVENOW_H

#include <string>

#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Core/Time.h>
#include <MicroCentral/Version.h>

#if MC_ENABLE_RESERVATION

namespace MicroCentral {
namespace Ocpp16 {

class ReserveNow : public Operation {
private:
    int connectorId;
    Timestamp expiryDate;
    std::string idTag;
    int reservationId;
    std::string parentIdTag; //omitted if empty
    std::string status; //Accepted, Faulted, Occupied, Rejected or Unavailable
public:
    ReserveNow(int connectorId, const Timestamp& expiryDate, const char *idTag, int reservationId, const char *parentIdTag = nullptr);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif //MC_ENABLE_RESERVATION
#endif

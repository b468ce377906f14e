// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CANCELRESERVATION_H
#define MC_CANCELRESERVATION_H

#include <string>

#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Version.h>

#if MC_ENABLE_RESERVATION

namespace MicroCentral {
namespace Ocpp16 {

class CancelReservation : public Operation {
private:
    int reservationId;
    std::string status; //Accepted or Rejected
public:
    CancelReservation(int reservationId);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif //MC_ENABLE_RESERVATION
#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_SETCHARGINGPROFILE_H
#define MC_SETCHARGINGPROFILE_H

#include <string>

#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Version.h>

#if MC_ENABLE_SMARTCHARGING

namespace MicroCentral {
namespace Ocpp16 {

/*
 * Forwards a charging profile to the charge point. The profile is passed through as JSON
 * without interpretation
 */
class SetChargingProfile : public Operation {
private:
    int connectorId;
    std::string csChargingProfiles; //JSON object
    std::string status;
public:
    SetChargingProfile(int connectorId, const char *csChargingProfiles);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif //MC_ENABLE_SMARTCHARGING
#endif

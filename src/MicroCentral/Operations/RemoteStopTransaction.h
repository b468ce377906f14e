// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_REMOTESTOPTRANSACTION_H
#define MC_REMOTESTOPTRANSACTION_H

#include <string>

#include <MicroCentral/Core/Operation.h>

namespace MicroCentral {
namespace Ocpp16 {

class RemoteStopTransaction : public Operation {
private:
    int transactionId;
    std::string status; //Accepted or Rejected
public:
    RemoteStopTransaction(int transactionId);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    const char *getStatus() const {return status.c_str();}
};

} //end namespace Ocpp16
} //end namespace MicroCentral
#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_OPERATIONREGISTRY_H
#define MC_OPERATIONREGISTRY_H

#include <functional>
#include <vector>
#include <memory>
#include <ArduinoJson.h>
#include <MicroCentral/Core/RequestCallbacks.h>

namespace MicroCentral {

class Operation;
class Request;

struct OperationCreator {
    const char *operationType {nullptr};
    std::function<Operation*()> creator {nullptr};
    OnReceiveReqListener onRequest {nullptr};
    OnSendConfListener onResponse {nullptr};
};

/*
 * Maps the action names of incoming CALLs to the Operation which handles them. Actions without entry
 * are answered with NotImplemented
 */
class OperationRegistry {
private:
    std::vector<OperationCreator> registry;
    OperationCreator *findCreator(const char *operationType);

public:
    OperationRegistry();

    void registerOperation(const char *operationType, std::function<Operation*()> creator);

    //answer the action with CallError NotSupported (known to OCPP 1.6, but not handled by this server)
    void registerUnsupported(const char *operationType);

    void setOnRequest(const char *operationType, OnReceiveReqListener onRequest);
    void setOnResponse(const char *operationType, OnSendConfListener onResponse);

    bool isRegistered(const char *operationType);

    /*
     * Checks that every action in `operationTypes` has a handler. Logs the missing ones and
     * returns false if at least one is missing
     */
    bool validate(const char *const *operationTypes, size_t count);

    std::unique_ptr<Request> deserializeOperation(const char *operationType);

    void debugPrint();
};

}

#endif

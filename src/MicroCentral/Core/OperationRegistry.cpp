// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/OperationRegistry.h>
#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Core/Request.h>
#include <MicroCentral/Core/OcppError.h>
#include <MicroCentral/Debug.h>
#include <algorithm>
#include <string.h>

using namespace MicroCentral;

OperationRegistry::OperationRegistry() {

}

OperationCreator *OperationRegistry::findCreator(const char *operationType) {
    for (auto it = registry.begin(); it != registry.end(); ++it) {
        if (!strcmp(it->operationType, operationType)) {
            return &*it;
        }
    }
    return nullptr;
}

void OperationRegistry::registerOperation(const char *operationType, std::function<Operation*()> creator) {
    registry.erase(std::remove_if(registry.begin(), registry.end(),
                [operationType] (const OperationCreator& el) {
                    return !strcmp(operationType, el.operationType);
                }),
            registry.end());

    OperationCreator entry;
    entry.operationType = operationType;
    entry.creator = creator;

    registry.push_back(entry);

    MC_DBG_DEBUG("registered operation %s", operationType);
}

void OperationRegistry::registerUnsupported(const char *operationType) {
    registerOperation(operationType, [operationType] () {
        return new NotSupported(operationType);});
}

void OperationRegistry::setOnRequest(const char *operationType, OnReceiveReqListener onRequest) {
    if (auto entry = findCreator(operationType)) {
        entry->onRequest = onRequest;
    } else {
        MC_DBG_ERR("%s not registered", operationType);
    }
}

void OperationRegistry::setOnResponse(const char *operationType, OnSendConfListener onResponse) {
    if (auto entry = findCreator(operationType)) {
        entry->onResponse = onResponse;
    } else {
        MC_DBG_ERR("%s not registered", operationType);
    }
}

bool OperationRegistry::isRegistered(const char *operationType) {
    return findCreator(operationType) != nullptr;
}

bool OperationRegistry::validate(const char *const *operationTypes, size_t count) {
    bool complete = true;
    for (size_t i = 0; i < count; i++) {
        if (!findCreator(operationTypes[i])) {
            MC_DBG_ERR("no handler for %s", operationTypes[i]);
            complete = false;
        }
    }
    return complete;
}

std::unique_ptr<Request> OperationRegistry::deserializeOperation(const char *operationType) {

    if (auto entry = findCreator(operationType)) {
        auto payload = entry->creator();
        if (payload) {
            auto result = std::unique_ptr<Request>(new Request(
                                std::unique_ptr<Operation>(payload)));
            result->setOnReceiveReqListener(entry->onRequest);
            result->setOnSendConfListener(entry->onResponse);
            return result;
        }
    }

    return std::unique_ptr<Request>(new Request(
                std::unique_ptr<Operation>(new NotImplemented())));
}

void OperationRegistry::debugPrint() {
    for (auto& creator : registry) {
        MC_DBG_INFO("    > %s", creator.operationType);
    }
}

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Operations/RemoteStopTransaction.h>
#include <MicroCentral/Debug.h>

using MicroCentral::Ocpp16::RemoteStopTransaction;
using MicroCentral::JsonDoc;

RemoteStopTransaction::RemoteStopTransaction(int transactionId) : transactionId(transactionId) {

}

const char* RemoteStopTransaction::getOperationType(){
    return "RemoteStopTransaction";
}

std::unique_ptr<JsonDoc> RemoteStopTransaction::createReq() {
    auto doc = makeJsonDoc("v16.Operation.RemoteStopTransaction", JSON_OBJECT_SIZE(1));
    if (!doc) {
        return nullptr;
    }
    JsonObject payload = doc->to<JsonObject>();
    payload["transactionId"] = transactionId;
    return doc;
}

void RemoteStopTransaction::processConf(JsonObject payload) {
    status = payload["status"] | "";
    if (status.empty()) {
        MC_DBG_WARN("RemoteStopTransaction.conf without status");
        return;
    }
    MC_DBG_INFO("RemoteStopTransaction: %s", status.c_str());
}

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/MessageService.h>
#include <MicroCentral/Core/Request.h>
#include <MicroCentral/Core/Connection.h>
#include <MicroCentral/Core/OperationRegistry.h>
#include <MicroCentral/Core/OcppError.h>
#include <MicroCentral/Platform.h>

#include <MicroCentral/Debug.h>

#include <vector>

namespace MicroCentral {
size_t removePayload(const char *src, size_t src_size, char *dst, size_t dst_size);
}

using namespace MicroCentral;

MessageService::MessageService(Connection& connection, OperationRegistry& operationRegistry) :
            connection(connection), operationRegistry(operationRegistry) {

}

MessageService::~MessageService() {
    close();
}

void MessageService::loop() {

    std::vector<std::unique_ptr<Request>> timedOut;

    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
            if (it->second->isTimeoutExceeded()) {
                timedOut.push_back(std::move(it->second));
                it = pendingRequests.erase(it);
            } else {
                ++it;
            }
        }
    }

    //listeners may issue further requests, so execute them without lock
    for (auto& request : timedOut) {
        MC_DBG_INFO("operation timeout: %s", request->getOperationType());
        request->executeTimeout();
    }
}

bool MessageService::sendRequest(std::unique_ptr<Request> request) {

    if (!request) {
        MC_DBG_ERR("invalid arg");
        return false;
    }

    auto doc = initJsonDoc("MessageService");
    if (request->createRequest(doc) != Request::CreateRequestResult::Success) {
        MC_DBG_ERR("could not create %s", request->getOperationType());
        request->executeAbort();
        return false;
    }

    std::string out;
    serializeJson(doc, out);

    std::string messageId = request->getMessageID();
    Request *requestPtr = request.get();

    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        if (closed || !connection.isConnected()) {
            MC_DBG_WARN("connection closed, discard %s", request->getOperationType());
            //abort outside the lock
        } else {
            request->setRequestSent(); //starts timeout period
            //enter the table before sending. The response may arrive before sendTXT returns
            pendingRequests[messageId] = std::move(request);
        }
    }

    if (request) {
        request->executeAbort();
        return false;
    }

    if (!connection.sendTXT(out.c_str(), out.length())) {
        MC_DBG_WARN("send failure: %s", out.c_str());

        std::unique_ptr<Request> failed;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            auto found = pendingRequests.find(messageId);
            if (found != pendingRequests.end() && found->second.get() == requestPtr) {
                failed = std::move(found->second);
                pendingRequests.erase(found);
            }
        }
        if (failed) {
            failed->executeAbort();
        }
        return false;
    }

    MC_DBG_DEBUG("Send %s", out.c_str());
    return true;
}

void MessageService::close() {

    std::map<std::string, std::unique_ptr<Request>> aborted;

    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        closed = true;
        aborted.swap(pendingRequests);
    }

    for (auto& entry : aborted) {
        MC_DBG_DEBUG("abort pending %s", entry.second->getOperationType());
        entry.second->executeAbort();
    }
}

size_t MessageService::getPendingCount() {
    std::lock_guard<std::mutex> lock(pendingMutex);
    return pendingRequests.size();
}

bool MessageService::receiveMessage(const char* payload, size_t length) {

    MC_DBG_DEBUG("Recv %.*s", (int)length, payload);

    size_t capacity_init = (3 * length) / 2;

    //capacity = ceil capacity_init to the next power of two; should be at least 128

    size_t capacity = 128;
    while (capacity < capacity_init && capacity < MC_MAX_JSON_CAPACITY) {
        capacity *= 2;
    }
    if (capacity > MC_MAX_JSON_CAPACITY) {
        capacity = MC_MAX_JSON_CAPACITY;
    }

    auto doc = initJsonDoc("MessageService");
    DeserializationError err = DeserializationError::NoMemory;

    while (err == DeserializationError::NoMemory && capacity <= MC_MAX_JSON_CAPACITY) {

        doc = initJsonDoc("MessageService", capacity);
        err = deserializeJson(doc, payload, length);

        capacity *= 2;
    }

    bool success = false;

    switch (err.code()) {
        case DeserializationError::Ok: {
            if (!doc.is<JsonArray>()) {
                MC_DBG_WARN("Invalid OCPP message! Not a JSON array");
                sendCallError("-1", std::unique_ptr<Operation>(new FormationViolation("not an OCPP-J array")));
                break;
            }

            int messageTypeId = doc[0] | -1;

            if (messageTypeId == MESSAGE_TYPE_CALL) {
                receiveRequest(doc.as<JsonArray>());
                success = true;
            } else if (messageTypeId == MESSAGE_TYPE_CALLRESULT ||
                    messageTypeId == MESSAGE_TYPE_CALLERROR) {
                receiveResponse(doc.as<JsonArray>());
                success = true;
            } else {
                MC_DBG_WARN("Invalid OCPP message! (though JSON has successfully been deserialized)");
                sendCallError(doc[1] | "-1", std::unique_ptr<Operation>(new FormationViolation("unknown messageTypeId")));
            }
            break;
        }
        case DeserializationError::NoMemory: {
            MC_DBG_WARN("incoming operation exceeds buffer capacity. Input length = %zu, max capacity = %d", length, MC_MAX_JSON_CAPACITY);

            /*
             * If websocket input is of message type MESSAGE_TYPE_CALL, send back a message of type MESSAGE_TYPE_CALLERROR.
             * Then the communication counterpart knows that this operation failed.
             * If the input type is MESSAGE_TYPE_CALLRESULT, then abort the operation to avoid getting stalled.
             */

            doc = initJsonDoc("MessageService", 200);
            char onlyRpcHeader[200];
            size_t onlyRpcHeader_len = removePayload(payload, length, onlyRpcHeader, sizeof(onlyRpcHeader));
            DeserializationError err2 = deserializeJson(doc, onlyRpcHeader, onlyRpcHeader_len);
            if (err2.code() == DeserializationError::Ok) {
                int messageTypeId = doc[0] | -1;
                if (messageTypeId == MESSAGE_TYPE_CALL) {
                    success = true;
                    sendCallError(doc[1] | "-1", std::unique_ptr<Operation>(new MsgBufferExceeded(MC_MAX_JSON_CAPACITY, length)));
                } else if (messageTypeId == MESSAGE_TYPE_CALLRESULT ||
                            messageTypeId == MESSAGE_TYPE_CALLERROR) {
                    success = true;
                    MC_DBG_WARN("crop incoming response");
                    receiveResponse(doc.as<JsonArray>());
                }
            }
            break;
        }
        default: {
            MC_DBG_WARN("Deserialization failed: %s", err.c_str());

            //try to recover the messageId from the RPC header
            const char *messageId = "-1";
            auto headerDoc = initJsonDoc("MessageService", 200);
            char onlyRpcHeader[200];
            size_t onlyRpcHeader_len = removePayload(payload, length, onlyRpcHeader, sizeof(onlyRpcHeader));
            if (!deserializeJson(headerDoc, onlyRpcHeader, onlyRpcHeader_len) &&
                    headerDoc[1].is<const char*>()) {
                messageId = headerDoc[1];
            }
            sendCallError(messageId, std::unique_ptr<Operation>(new FormationViolation("JSON deserialization failed")));
            break;
        }
    }

    return success;
}

void MessageService::receiveResponse(JsonArray json) {

    if (json.size() < 2 || !json[1].is<const char*>()) {
        MC_DBG_WARN("malformatted response");
        return;
    }

    std::unique_ptr<Request> request;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto found = pendingRequests.find(json[1].as<const char*>());
        if (found != pendingRequests.end()) {
            request = std::move(found->second);
            pendingRequests.erase(found);
        }
    }

    if (!request) {
        MC_DBG_WARN("Received response doesn't match pending operation: %s", json[1].as<const char*>());
        return;
    }

    if (!request->receiveResponse(json)) {
        MC_DBG_WARN("Invalid response to %s", request->getOperationType());
        request->executeAbort();
    }
}

void MessageService::receiveRequest(JsonArray json) {
    if (json.size() < 4 || !json[1].is<const char*>() || !json[2].is<const char*>() || !json[3].is<JsonObject>()) {
        MC_DBG_ERR("malformatted request");
        sendCallError(json[1] | "-1", std::unique_ptr<Operation>(new FormationViolation("CALL must be [2, messageId, action, payload]")));
        return;
    }
    auto request = operationRegistry.deserializeOperation(json[2]);
    if (request == nullptr) {
        MC_DBG_WARN("OOM");
        return;
    }
    receiveRequest(json, std::move(request));
}

void MessageService::receiveRequest(JsonArray json, std::unique_ptr<Request> request) {
    if (!request->receiveRequest(json)) { //execute the operation
        return;
    }
    sendResponse(*request);
}

void MessageService::sendCallError(const char *messageId, std::unique_ptr<Operation> error) {
    auto request = makeRequest(std::move(error));
    if (!request) {
        MC_DBG_ERR("OOM");
        return;
    }
    request->setMessageID(messageId);
    sendResponse(*request);
}

bool MessageService::sendResponse(Request& request) {

    auto response = initJsonDoc("MessageService");
    auto ret = request.createResponse(response);

    if (ret != Request::CreateResponseResult::Success) {
        MC_DBG_ERR("could not answer %s", request.getOperationType());
        return false;
    }

    std::string out;
    serializeJson(response, out);

    bool success = connection.sendTXT(out.c_str(), out.length());

    if (success) {
        MC_DBG_DEBUG("Send %s", out.c_str());
    } else {
        MC_DBG_WARN("send failure: %s", out.c_str());
    }

    return success;
}

/*
 * Tries to recover the Ocpp-Operation header from a broken message.
 *
 * Example input:
 * [2, "75705e50-682d-404e-b400-1bca33d41e19", "StatusNotification", {"connectorId":"now the message breaks...
 *
 * The Json library returns an error code when trying to deserialize that broken message. This
 * function searches for the first occurence of the character '{' and writes "}]" after it.
 *
 * Example output:
 * [2, "75705e50-682d-404e-b400-1bca33d41e19", "StatusNotification", {}]
 *
 */
size_t MicroCentral::removePayload(const char *src, size_t src_size, char *dst, size_t dst_size) {
    size_t res_len = 0;
    for (size_t i = 0; i < src_size && i < dst_size-3; i++) {
        if (src[i] == '\0'){
            //no payload found within specified range. Cancel execution
            break;
        }
        dst[i] = src[i];
        if (src[i] == '{') {
            dst[i+1] = '}';
            dst[i+2] = ']';
            res_len = i+3;
            break;
        }
    }
    dst[res_len] = '\0';
    return res_len;
}

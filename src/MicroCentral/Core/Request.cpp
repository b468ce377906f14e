// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/Request.h>
#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Core/UuidUtils.h>

#include <MicroCentral/Platform.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using namespace MicroCentral;

Request::Request(std::unique_ptr<Operation> msg) : operation(std::move(msg)) {
    timeoutStart = mc_tick_ms();
}

Request::~Request(){

}

Operation *Request::getOperation(){
    return operation.get();
}

void Request::setTimeout(unsigned long timeoutMs) {
    this->timeoutPeriod = timeoutMs;
}

bool Request::isTimeoutExceeded() {
    return timedOut || (timeoutPeriod && mc_tick_ms() - timeoutStart >= timeoutPeriod);
}

void Request::executeTimeout() {
    if (!timedOut && !aborted) {
        onTimeoutListener();
        onAbortListener();
    }
    timedOut = true;
}

void Request::executeAbort() {
    if (!timedOut && !aborted) {
        onAbortListener();
    }
    aborted = true;
}

Request::CreateRequestResult Request::createRequest(JsonDoc& requestJson) {

    if (messageID.empty()) {
        char uuid [MC_UUID_STR_SIZE] = {'\0'};
        if (!UuidUtils::generateUUID(mc_rng, uuid, sizeof(uuid))) {
            MC_DBG_ERR("UUID failure");
            return CreateRequestResult::Failure;
        }
        messageID = uuid;
    }

    /*
     * Create the OCPP message
     */
    auto requestPayload = operation->createReq();
    if (!requestPayload) {
        return CreateRequestResult::Failure;
    }

    /*
     * Create OCPP-J Remote Procedure Call header
     */
    size_t json_buffsize = JSON_ARRAY_SIZE(4) + (messageID.length() + 1) + requestPayload->capacity();
    requestJson = initJsonDoc("Request", json_buffsize);

    requestJson.add(MESSAGE_TYPE_CALL);              //MessageType
    requestJson.add(messageID);                      //Unique message ID
    requestJson.add(operation->getOperationType());  //Action
    requestJson.add(*requestPayload);                //Payload

    if (requestJson.overflowed()) {
        MC_DBG_ERR("JSON capacity exceeded: %s", operation->getOperationType());
        return CreateRequestResult::Failure;
    }

    return CreateRequestResult::Success;
}

bool Request::receiveResponse(JsonArray response){

    /*
     * Validate array size to prevent NULL pointer dereference
     */
    if (response.size() < 2) {
        MC_DBG_ERR("malformed response: insufficient elements (size=%zu, expected>=2)", response.size());
        return false;
    }

    /*
     * check if messageIDs match. If yes, continue with this function. If not, return false for message not consumed
     */
    if (!response[1].is<const char*>() || messageID.compare(response[1].as<const char*>())) {
        return false;
    }

    int messageTypeId = response[0] | -1;

    if (messageTypeId == MESSAGE_TYPE_CALLRESULT) {

        // CALLRESULT format: [3, messageId, payload] - requires 3 elements
        if (response.size() < 3) {
            MC_DBG_ERR("malformed CALLRESULT: insufficient elements (size=%zu, expected>=3)", response.size());
            return false;
        }

        /*
        * Hand the payload over to the Operation object
        */
        JsonObject payload = response[2];
        operation->processConf(payload);

        /*
        * Hand the payload over to the onReceiveConf Callback
        */
        onReceiveConfListener(payload);

        /*
        * return true as this message has been consumed
        */
        return true;
    } else if (messageTypeId == MESSAGE_TYPE_CALLERROR) {

        // CALLERROR format: [4, messageId, errorCode, errorDescription, errorDetails] - requires 5 elements
        if (response.size() < 5) {
            MC_DBG_ERR("malformed CALLERROR: insufficient elements (size=%zu, expected>=5)", response.size());
            return false;
        }

        /*
        * Hand the error over to the Operation object
        */
        const char *errorCode = response[2] | "GenericError";
        const char *errorDescription = response[3] | "";
        JsonObject errorDetails = response[4];
        bool abortOperation = operation->processErr(errorCode, errorDescription, errorDetails);

        if (abortOperation) {
            onReceiveErrorListener(errorCode, errorDescription, errorDetails);
            onAbortListener();
            aborted = true;
        }

        return abortOperation;
    } else {
        MC_DBG_WARN("invalid response");
        return false;
    }
}

bool Request::receiveRequest(JsonArray request) {

    // CALL format: [2, messageId, action, payload] - requires 4 elements
    if (request.size() < 4) {
        MC_DBG_ERR("malformed request: insufficient elements (size=%zu, expected>=4)", request.size());
        return false;
    }

    if (!request[1].is<const char*>()) {
        MC_DBG_ERR("malformatted msgId");
        return false;
    }

    if (!messageID.empty()) {
        MC_DBG_ERR("messageID already defined");
    }
    messageID = request[1].as<const char*>();

    /*
     * Hand the payload over to the Request object
     */
    JsonObject payload = request[3];
    operation->processReq(payload);

    /*
     * Hand the payload over to the first Callback. It is a callback that notifies the session that request has been processed
     */
    onReceiveReqListener(payload);

    return true; //success
}

Request::CreateResponseResult Request::createResponse(JsonDoc& response) {

    bool operationFailure = operation->getErrorCode() != nullptr;

    if (!operationFailure) {

        std::unique_ptr<JsonDoc> payload = operation->createConf();

        if (!payload) {
            MC_DBG_ERR("could not create %s.conf", operation->getOperationType());
            return CreateResponseResult::Failure;
        }

        /*
         * Create OCPP-J Remote Procedure Call header
         */
        size_t json_buffsize = JSON_ARRAY_SIZE(3) + (messageID.length() + 1) + payload->capacity();
        response = initJsonDoc("Request", json_buffsize);

        response.add(MESSAGE_TYPE_CALLRESULT);   //MessageType
        response.add(messageID);                 //Unique message ID
        response.add(*payload);                  //Payload

        onSendConfListener(payload->as<JsonObject>());
    } else {
        //operation failure. Send error message instead

        const char *errorCode = operation->getErrorCode();
        const char *errorDescription = operation->getErrorDescription();
        std::unique_ptr<JsonDoc> errorDetails = operation->getErrorDetails();
        if (!errorDetails) {
            errorDetails = createEmptyDocument();
        }

        /*
         * Create OCPP-J Remote Procedure Call header
         */
        size_t json_buffsize = JSON_ARRAY_SIZE(5)
                    + (messageID.length() + 1)
                    + (errorDetails ? errorDetails->capacity() : JSON_OBJECT_SIZE(0));
        response = initJsonDoc("Request", json_buffsize);

        response.add(MESSAGE_TYPE_CALLERROR);   //MessageType
        response.add(messageID);                //Unique message ID
        response.add(errorCode);
        response.add(errorDescription);
        if (errorDetails) {
            response.add(*errorDetails);        //Error description
        } else {
            response.createNestedObject();
        }
    }

    if (response.overflowed()) {
        MC_DBG_ERR("JSON capacity exceeded: %s", operation->getOperationType());
        return CreateResponseResult::Failure;
    }

    return CreateResponseResult::Success;
}

void Request::setOnReceiveConfListener(OnReceiveConfListener onReceiveConf){
    if (onReceiveConf)
        onReceiveConfListener = onReceiveConf;
}

/**
 * Sets a Listener that is called after this machine processed a request by the communication counterpart
 */
void Request::setOnReceiveReqListener(OnReceiveReqListener onReceiveReq){
    if (onReceiveReq)
        onReceiveReqListener = onReceiveReq;
}

void Request::setOnSendConfListener(OnSendConfListener onSendConf){
    if (onSendConf)
        onSendConfListener = onSendConf;
}

void Request::setOnTimeoutListener(OnTimeoutListener onTimeout) {
    if (onTimeout)
        onTimeoutListener = onTimeout;
}

void Request::setOnReceiveErrorListener(OnReceiveErrorListener onReceiveError) {
    if (onReceiveError)
        onReceiveErrorListener = onReceiveError;
}

void Request::setOnAbortListener(OnAbortListener onAbort) {
    if (onAbort)
        onAbortListener = onAbort;
}

const char *Request::getMessageID() const {
    return messageID.c_str();
}

void Request::setMessageID(const char *id) {
    messageID = id ? id : "";
}

const char *Request::getOperationType() {
    return operation ? operation->getOperationType() : "UNDEFINED";
}

void Request::setRequestSent() {
    requestSent = true;
    timeoutStart = mc_tick_ms();
}

bool Request::isRequestSent() {
    return requestSent;
}

namespace MicroCentral {

std::unique_ptr<Request> makeRequest(std::unique_ptr<Operation> operation){
    if (operation == nullptr) {
        return nullptr;
    }
    return std::unique_ptr<Request>(new Request(std::move(operation)));
}

std::unique_ptr<Request> makeRequest(Operation *operation) {
    return makeRequest(std::unique_ptr<Operation>(operation));
}

} //namespace MicroCentral

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_REQUEST_H
#define MC_REQUEST_H

#define MESSAGE_TYPE_CALL 2
#define MESSAGE_TYPE_CALLRESULT 3
#define MESSAGE_TYPE_CALLERROR 4

#include <memory>
#include <string>

#include <MicroCentral/Core/RequestCallbacks.h>
#include <MicroCentral/Core/Memory.h>

namespace MicroCentral {

class Operation;

class Request {
private:
    std::string messageID;
    std::unique_ptr<Operation> operation;
    OnReceiveConfListener onReceiveConfListener = [] (JsonObject payload) {};
    OnReceiveReqListener onReceiveReqListener = [] (JsonObject payload) {};
    OnSendConfListener onSendConfListener = [] (JsonObject payload) {};
    OnTimeoutListener onTimeoutListener = [] () {};
    OnReceiveErrorListener onReceiveErrorListener = [] (const char *code, const char *description, JsonObject details) {};
    OnAbortListener onAbortListener = [] () {};

    unsigned long timeoutStart = 0;
    unsigned long timeoutPeriod = 40000; //in ms
    bool timedOut = false;
    bool aborted = false;

    bool requestSent = false;
public:

    Request(std::unique_ptr<Operation> msg);

    ~Request();

    Operation *getOperation();

    void setTimeout(unsigned long timeoutMs); //if positive, sets timeout period in ms. If 0, disables timeout
    bool isTimeoutExceeded();
    void executeTimeout(); //call Timeout Listener

    /*
     * The connection closed before the response arrived. Calls the abort listener
     */
    void executeAbort();

    /**
     * Creates the OCPP-J message of this operation: [2, messageId, action, payload]
     */
    enum class CreateRequestResult {
        Success,
        Failure
    };
    CreateRequestResult createRequest(JsonDoc& out);

   /**
    * Processes charge point responses (=Confirmations and Errors). Returns true if the response belongs
    * to this request and has been consumed, false otherwise
    */
    bool receiveResponse(JsonArray json);

    /**
     * Processes the request in the JSON document. Returns true on success, false on error.
     */
    bool receiveRequest(JsonArray json);

    /**
     * After processing a request sent by the communication counterpart, this function creates the confirmation
     * message, or a CallError if the operation failed.
     */
    enum class CreateResponseResult {
        Success,
        Failure
    };

    CreateResponseResult createResponse(JsonDoc& out);

    void setOnReceiveConfListener(OnReceiveConfListener onReceiveConf); //listener executed when we received the .conf() to a .req() we sent
    void setOnReceiveReqListener(OnReceiveReqListener onReceiveReq); //listener executed when we receive a .req()
    void setOnSendConfListener(OnSendConfListener onSendConf); //listener executed when we send a .conf() to a .req() we received

    void setOnTimeoutListener(OnTimeoutListener onTimeout);
    void setOnReceiveErrorListener(OnReceiveErrorListener onReceiveError);

    /**
     * The listener onAbort will be called whenever the engine stops waiting for the response of an operation which
     * was initiated by the central system. Causes for onAbort:
     *
     *    - Cannot create OCPP payload
     *    - Timeout
     *    - Receives error msg instead of confirmation msg
     *    - The connection closes while the request is pending
     */
    void setOnAbortListener(OnAbortListener onAbort);

    const char *getMessageID() const;
    void setMessageID(const char *id); //for answering frames which could not be parsed completely
    const char *getOperationType();

    void setRequestSent(); //also starts the timeout period
    bool isRequestSent();
};

/*
 * Simple factory functions
 */
std::unique_ptr<Request> makeRequest(std::unique_ptr<Operation> op);
std::unique_ptr<Request> makeRequest(Operation *op); //takes ownership of op

} //namespace MicroCentral

#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_MESSAGESERVICE_H
#define MC_MESSAGESERVICE_H

#include <MicroCentral/Core/Request.h>
#include <MicroCentral/Core/Memory.h>

#include <ArduinoJson.h>

#include <map>
#include <mutex>
#include <string>
#include <memory>

namespace MicroCentral {

class Connection;
class OperationRegistry;

/*
 * OCPP-J engine of one charge point connection. Dispatches the incoming CALLs to the operations of
 * the registry, answers them and keeps the table of outgoing CALLs which wait for their response.
 *
 * receiveMessage() and loop() are called by the session worker. sendRequest() and close() may be
 * called from any thread
 */
class MessageService {
private:
    Connection& connection;
    OperationRegistry& operationRegistry;

    std::mutex pendingMutex;
    std::map<std::string, std::unique_ptr<Request>> pendingRequests; //sent CALLs, keyed by messageId
    bool closed = false;

    void receiveRequest(JsonArray json);
    void receiveRequest(JsonArray json, std::unique_ptr<Request> request);
    void receiveResponse(JsonArray json);

    //answer a frame which does not qualify as CALL with the given CallError
    void sendCallError(const char *messageId, std::unique_ptr<Operation> error);
    bool sendResponse(Request& request);
public:
    MessageService(Connection& connection, OperationRegistry& operationRegistry);
    ~MessageService();

    // process message from the charge point ("message" = serialized Request or Confirmation)
    bool receiveMessage(const char* payload, size_t length);

    void loop(); //expires the timed out requests

    // send a Request to the charge point. On failure, the abort listener has been executed
    bool sendRequest(std::unique_ptr<Request> request);

    // abort all pending requests and refuse further requests
    void close();

    size_t getPendingCount();
};

} //namespace MicroCentral
#endif

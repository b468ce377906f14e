// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

/**
 * This framework considers OCPP operations to be a combination of two things: first, ensure that the message reaches its
 * destination properly (the "Remote procedure call" header, e.g. message Id). Second, transmit the application data
 * as specified in the OCPP 1.6 document.
 *
 * The remote procedure call (RPC) part is implemented by the class Request. The application data part is implemented by
 * the respective Operation subclasses, e.g. BootNotification, StartTransaction, Reset ect.
 *
 * The central system receives most of its operations (BootNotification, StartTransaction, ...) and initiates the
 * remote commands (Reset, RemoteStartTransaction, ...). For received operations, processReq() and createConf() are
 * relevant. For initiated operations, createReq() and processConf() are relevant.
 */

#ifndef MC_OPERATION_H
#define MC_OPERATION_H

#include <ArduinoJson.h>
#include <memory>

#include <MicroCentral/Core/Memory.h>

namespace MicroCentral {

std::unique_ptr<JsonDoc> createEmptyDocument();

class Operation {
public:
    Operation();

    virtual ~Operation();

    virtual const char* getOperationType();

    /**
     * Create the payload for the respective OCPP message
     *
     * For instance operation Reset: creates Reset.req(type)
     */
    virtual std::unique_ptr<JsonDoc> createReq();

    virtual void processConf(JsonObject payload);

    /*
     * returns if the operation must be aborted
     */
    virtual bool processErr(const char *code, const char *description, JsonObject details) { return true;}

    /**
     * Processes the request in the JSON document.
     */
    virtual void processReq(JsonObject payload);

    /**
     * After successfully processing a request sent by the communication counterpart, this function creates the payload for a confirmation
     * message.
     */
    virtual std::unique_ptr<JsonDoc> createConf();

    virtual const char *getErrorCode() {return nullptr;} //nullptr means no error
    virtual const char *getErrorDescription() {return "";}
    virtual std::unique_ptr<JsonDoc> getErrorDetails() {return createEmptyDocument();}
};

} //namespace MicroCentral
#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_OCPPERROR_H
#define MC_OCPPERROR_H

#include <MicroCentral/Core/Operation.h>
#include <MicroCentral/Core/Memory.h>

namespace MicroCentral {

class NotImplemented : public Operation {
public:
    NotImplemented() = default;

    const char *getErrorCode() override {
        return "NotImplemented";
    }
};

class NotSupported : public Operation {
private:
    const char *operationType;
public:
    NotSupported(const char *operationType) : operationType(operationType) { }

    const char *getOperationType() override {
        return operationType;
    }

    const char *getErrorCode() override {
        return "NotSupported";
    }
};

/*
 * Answer to a CALL frame which could not be parsed or does not have the OCPP-J array layout
 */
class FormationViolation : public Operation {
private:
    const char *description;
public:
    FormationViolation(const char *description = "") : description(description) { }

    const char *getErrorCode() override {
        return "FormationViolation";
    }
    const char *getErrorDescription() override {
        return description;
    }
};

class MsgBufferExceeded : public Operation {
private:
    size_t maxCapacity;
    size_t msgLen;
public:
    MsgBufferExceeded(size_t maxCapacity, size_t msgLen) : maxCapacity(maxCapacity), msgLen(msgLen) { }
    const char *getErrorCode() override {
        return "GenericError";
    }
    const char *getErrorDescription() override {
        return "JSON too long or too many fields. Cannot deserialize";
    }
    std::unique_ptr<JsonDoc> getErrorDetails() override {
        auto errDoc = makeJsonDoc("v16.CallError.GenericError", JSON_OBJECT_SIZE(2));
        if (!errDoc) {
            return nullptr;
        }
        JsonObject err = errDoc->to<JsonObject>();
        err["max_capacity"] = maxCapacity;
        err["msg_length"] = msgLen;
        return errDoc;
    }
};

} //end namespace MicroCentral
#endif

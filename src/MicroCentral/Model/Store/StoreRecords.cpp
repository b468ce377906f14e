// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Store/StoreRecords.h>

namespace MicroCentral {

const char *serializeChargeSessionStatus(ChargeSessionStatus status) {
    switch (status) {
        case ChargeSessionStatus::Started:
            return "Started";
        case ChargeSessionStatus::Completed:
            return "Completed";
    }
    return "Started";
}

} //namespace MicroCentral

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_TARIFFSERVICE_H
#define MC_TARIFFSERVICE_H

#include <string>

#include <MicroCentral/Model/Store/Store.h>
#include <MicroCentral/Core/Memory.h>

namespace MicroCentral {

struct CostBreakdown {
    std::string tariffName;
    double energyKwh = 0.;
    bool hasFixedStartFee = false;
    double fixedStartFee = 0.;
    bool hasEnergyCost = false;
    double energyCost = 0.;
    double rateUsed = 0.;
    std::string rateType;         //daytime, nighttime, flat_rate, fallback_daytime; empty if no rate applied
    std::string sessionStartTime; //"HH:MM:SS", time-of-day rates only
    std::string daytimeHours;     //"HH:MM-HH:MM", time-of-day rates only
    double totalCost = 0.;
    std::string reason;           //set when the cost is zero for lack of a tariff or energy

    bool toJson(JsonObject out) const;
    bool toJsonString(std::string& out) const;
};

/*
 * Computes the cost of a charge session. Deterministic in its inputs: the daytime or nighttime rate
 * is chosen from the time of day of `start` and applies to all energy
 *
 * `tariff` may be nullptr (tariff missing). Returns the total cost rounded to 2 decimals
 */
double calculateCost(const TariffRecord *tariff, double energyKwh, const Timestamp& start, const Timestamp& end, CostBreakdown& breakdown);

bool isDaytime(int32_t timeOfDay, int32_t daytimeFrom, int32_t daytimeTo);

class TariffService {
private:
    Store& store;
public:
    TariffService(Store& store);

    double cost(int tariffId, double energyKwh, const Timestamp& start, const Timestamp& end, CostBreakdown& breakdown);
};

} //namespace MicroCentral

#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Tariffs/TariffService.h>
#include <MicroCentral/Debug.h>

#include <math.h>
#include <stdio.h>

using namespace MicroCentral;

namespace MicroCentral {
namespace TariffUtils {

double roundCents(double value) {
    return round(value * 100.) / 100.;
}

void writeHourMinute(int32_t secondsOfDay, char *buf, size_t size) {
    snprintf(buf, size, "%02d:%02d", (int) (secondsOfDay / 3600), (int) ((secondsOfDay % 3600) / 60));
}

bool rateConfigured(bool hasRate, double rate) {
    return hasRate && rate != 0.;
}

} //namespace TariffUtils
} //namespace MicroCentral

using namespace MicroCentral::TariffUtils;

bool CostBreakdown::toJson(JsonObject out) const {
    bool success = true;
    if (!tariffName.empty()) {
        success &= out["tariffName"].set(tariffName.c_str());
    }
    success &= out["energyKwh"].set(energyKwh);
    if (hasFixedStartFee) {
        success &= out["fixedStartFee"].set(fixedStartFee);
    }
    if (hasEnergyCost) {
        success &= out["energyCost"].set(energyCost);
        success &= out["rateUsed"].set(rateUsed);
        success &= out["rateType"].set(rateType.c_str());
    }
    if (!sessionStartTime.empty()) {
        success &= out["sessionStartTime"].set(sessionStartTime.c_str());
    }
    if (!daytimeHours.empty()) {
        success &= out["daytimeHours"].set(daytimeHours.c_str());
    }
    success &= out["totalCost"].set(totalCost);
    if (!reason.empty()) {
        success &= out["reason"].set(reason.c_str());
    }
    return success;
}

bool CostBreakdown::toJsonString(std::string& out) const {
    auto doc = initJsonDoc("CostBreakdown", JSON_OBJECT_SIZE(10) + tariffName.size() + reason.size() + 64);
    if (!toJson(doc.to<JsonObject>())) {
        MC_DBG_ERR("cost breakdown exceeds capacity");
        return false;
    }
    out.clear();
    serializeJson(doc, out);
    return true;
}

bool MicroCentral::isDaytime(int32_t timeOfDay, int32_t daytimeFrom, int32_t daytimeTo) {
    if (daytimeFrom <= daytimeTo) {
        return daytimeFrom <= timeOfDay && timeOfDay <= daytimeTo;
    } else {
        //window wraps around midnight, e.g. 22:00-06:00
        return timeOfDay >= daytimeFrom || timeOfDay <= daytimeTo;
    }
}

double MicroCentral::calculateCost(const TariffRecord *tariff, double energyKwh, const Timestamp& start, const Timestamp& end, CostBreakdown& breakdown) {
    (void)end; //the session start alone selects the rate

    breakdown = CostBreakdown();
    breakdown.energyKwh = energyKwh;

    if (!tariff) {
        breakdown.reason = "Tariff not found";
        return 0.;
    }

    if (!tariff->enabled) {
        breakdown.reason = "Tariff disabled";
        return 0.;
    }

    if (energyKwh <= 0.) {
        breakdown.reason = "No pricing plan or zero energy";
        return 0.;
    }

    breakdown.tariffName = tariff->name;

    double total = 0.;

    if (rateConfigured(tariff->hasFixedStartFee, tariff->fixedStartFee)) {
        breakdown.hasFixedStartFee = true;
        breakdown.fixedStartFee = tariff->fixedStartFee;
        total += tariff->fixedStartFee;
    }

    bool hasDaytimeRate = rateConfigured(tariff->hasDaytimeRate, tariff->daytimeRate);
    bool hasNighttimeRate = rateConfigured(tariff->hasNighttimeRate, tariff->nighttimeRate);

    if (hasDaytimeRate && hasNighttimeRate &&
            !tariff->daytimeFrom.empty() && !tariff->daytimeTo.empty()) {

        int32_t daytimeFrom = 0, daytimeTo = 0;
        if (parseTimeOfDay(tariff->daytimeFrom.c_str(), daytimeFrom) &&
                parseTimeOfDay(tariff->daytimeTo.c_str(), daytimeTo)) {

            int32_t startTime = start.secondsOfDay();

            if (isDaytime(startTime, daytimeFrom, daytimeTo)) {
                breakdown.rateUsed = tariff->daytimeRate;
                breakdown.rateType = "daytime";
            } else {
                breakdown.rateUsed = tariff->nighttimeRate;
                breakdown.rateType = "nighttime";
            }

            char buf [MC_TIMEOFDAY_SIZE];
            if (start.toTimeOfDayString(buf, sizeof(buf))) {
                breakdown.sessionStartTime = buf;
            }

            char fromBuf [MC_TIMEOFDAY_SIZE];
            char toBuf [MC_TIMEOFDAY_SIZE];
            writeHourMinute(daytimeFrom, fromBuf, sizeof(fromBuf));
            writeHourMinute(daytimeTo, toBuf, sizeof(toBuf));
            breakdown.daytimeHours = std::string(fromBuf) + "-" + toBuf;
        } else {
            MC_DBG_WARN("tariff %i: invalid daytime window %s-%s", tariff->tariffId, tariff->daytimeFrom.c_str(), tariff->daytimeTo.c_str());
            breakdown.rateUsed = tariff->daytimeRate;
            breakdown.rateType = "fallback_daytime";
        }
    } else if (hasDaytimeRate) {
        breakdown.rateUsed = tariff->daytimeRate;
        breakdown.rateType = "flat_rate";
    } else if (hasNighttimeRate) {
        breakdown.rateUsed = tariff->nighttimeRate;
        breakdown.rateType = "flat_rate";
    }

    if (!breakdown.rateType.empty()) {
        breakdown.hasEnergyCost = true;
        breakdown.energyCost = energyKwh * breakdown.rateUsed;
        total += breakdown.energyCost;
    }

    breakdown.totalCost = roundCents(total);
    return breakdown.totalCost;
}

TariffService::TariffService(Store& store) : store(store) {

}

double TariffService::cost(int tariffId, double energyKwh, const Timestamp& start, const Timestamp& end, CostBreakdown& breakdown) {
    if (tariffId <= 0) {
        breakdown = CostBreakdown();
        breakdown.energyKwh = energyKwh;
        breakdown.reason = "No pricing plan or zero energy";
        return 0.;
    }

    TariffRecord tariff;
    auto ret = store.getTariff(tariffId, tariff);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("tariff %i lookup failed", tariffId);
        breakdown = CostBreakdown();
        breakdown.energyKwh = energyKwh;
        breakdown.reason = "Tariff lookup failed";
        return 0.;
    } else if (ret == FetchStatus::NotFound) {
        MC_DBG_WARN("tariff %i not found", tariffId);
        return calculateCost(nullptr, energyKwh, start, end, breakdown);
    }

    auto total = calculateCost(&tariff, energyKwh, start, end, breakdown);
    MC_DBG_INFO("cost %.2f for %.3f kWh using tariff %i", total, energyKwh, tariffId);
    return total;
}

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Tariffs/TariffService.h>
#include <MicroCentral/Model/Store/MemoryStore.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroCentral;

namespace {

Timestamp at(const char *jsonDate) {
    Timestamp t;
    REQUIRE( t.setTime(jsonDate) );
    return t;
}

TariffRecord dayNightTariff() {
    TariffRecord tariff;
    tariff.tariffId = 1;
    tariff.name = "Day/Night";
    tariff.enabled = true;
    tariff.hasDaytimeRate = true;
    tariff.daytimeRate = 0.30;
    tariff.hasNighttimeRate = true;
    tariff.nighttimeRate = 0.20;
    tariff.daytimeFrom = "06:00";
    tariff.daytimeTo = "22:00";
    tariff.hasFixedStartFee = true;
    tariff.fixedStartFee = 1.0;
    return tariff;
}

}

TEST_CASE( "Tariff engine" ) {
    printf("\nRun %s\n",  "Tariff engine");

    CostBreakdown breakdown;

    SECTION("No tariff") {
        REQUIRE( calculateCost(nullptr, 10., at("2024-01-01T10:00:00Z"), at("2024-01-01T11:00:00Z"), breakdown) == 0. );
        REQUIRE( breakdown.reason == "Tariff not found" );
    }

    SECTION("Disabled tariff") {
        auto tariff = dayNightTariff();
        tariff.enabled = false;
        REQUIRE( calculateCost(&tariff, 10., at("2024-01-01T10:00:00Z"), at("2024-01-01T11:00:00Z"), breakdown) == 0. );
        REQUIRE( breakdown.reason == "Tariff disabled" );
    }

    SECTION("Zero energy") {
        auto tariff = dayNightTariff();
        REQUIRE( calculateCost(&tariff, 0., at("2024-01-01T10:00:00Z"), at("2024-01-01T11:00:00Z"), breakdown) == 0. );
        REQUIRE( breakdown.reason == "No pricing plan or zero energy" );
        REQUIRE( !breakdown.hasFixedStartFee ); //no start fee without energy
    }

    SECTION("Daytime start") {
        auto tariff = dayNightTariff();
        double cost = calculateCost(&tariff, 10., at("2024-01-01T10:00:00Z"), at("2024-01-01T23:30:00Z"), breakdown);
        REQUIRE( cost == Approx(4.0) );
        REQUIRE( breakdown.totalCost == Approx(4.0) );
        REQUIRE( breakdown.fixedStartFee == Approx(1.0) );
        REQUIRE( breakdown.energyCost == Approx(3.0) );
        REQUIRE( breakdown.rateType == "daytime" );
        REQUIRE( breakdown.rateUsed == Approx(0.30) );
        REQUIRE( breakdown.sessionStartTime == "10:00:00" );
        REQUIRE( breakdown.daytimeHours == "06:00-22:00" );
        REQUIRE( breakdown.tariffName == "Day/Night" );
        REQUIRE( breakdown.reason.empty() );
    }

    SECTION("Nighttime start") {
        auto tariff = dayNightTariff();
        //the start selects the rate for the whole session
        double cost = calculateCost(&tariff, 10., at("2024-01-01T23:00:00Z"), at("2024-01-02T09:00:00Z"), breakdown);
        REQUIRE( cost == Approx(3.0) );
        REQUIRE( breakdown.rateType == "nighttime" );
        REQUIRE( breakdown.rateUsed == Approx(0.20) );
    }

    SECTION("Window bounds are inclusive") {
        auto tariff = dayNightTariff();
        calculateCost(&tariff, 1., at("2024-01-01T22:00:00Z"), at("2024-01-01T23:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "daytime" );
        calculateCost(&tariff, 1., at("2024-01-01T06:00:00Z"), at("2024-01-01T07:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "daytime" );
        calculateCost(&tariff, 1., at("2024-01-01T22:00:01Z"), at("2024-01-01T23:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "nighttime" );
    }

    SECTION("Window across midnight") {
        auto tariff = dayNightTariff();
        tariff.daytimeFrom = "22:00";
        tariff.daytimeTo = "06:00";
        tariff.hasFixedStartFee = false;

        calculateCost(&tariff, 10., at("2024-01-01T23:00:00Z"), at("2024-01-02T01:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "daytime" );
        REQUIRE( breakdown.totalCost == Approx(3.0) );

        calculateCost(&tariff, 10., at("2024-01-01T03:00:00Z"), at("2024-01-01T04:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "daytime" );

        calculateCost(&tariff, 10., at("2024-01-01T12:00:00Z"), at("2024-01-01T13:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "nighttime" );
        REQUIRE( breakdown.totalCost == Approx(2.0) );
    }

    SECTION("Malformed window") {
        auto tariff = dayNightTariff();
        tariff.daytimeTo = "25:99";
        double cost = calculateCost(&tariff, 10., at("2024-01-01T23:00:00Z"), at("2024-01-02T01:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "fallback_daytime" );
        REQUIRE( cost == Approx(4.0) );
    }

    SECTION("Flat rate") {
        TariffRecord tariff;
        tariff.tariffId = 2;
        tariff.enabled = true;
        tariff.hasDaytimeRate = true;
        tariff.daytimeRate = 0.40;

        double cost = calculateCost(&tariff, 12.345, at("2024-01-01T23:00:00Z"), at("2024-01-02T01:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "flat_rate" );
        REQUIRE( cost == Approx(4.94) ); //rounded to cents
        REQUIRE( !breakdown.hasFixedStartFee );
        REQUIRE( breakdown.sessionStartTime.empty() );

        //one of two rates is zero: no time-of-day pricing
        tariff.hasNighttimeRate = true;
        tariff.nighttimeRate = 0.;
        tariff.daytimeFrom = "06:00";
        tariff.daytimeTo = "22:00";
        calculateCost(&tariff, 10., at("2024-01-01T23:00:00Z"), at("2024-01-02T01:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "flat_rate" );
        REQUIRE( breakdown.totalCost == Approx(4.0) );
    }

    SECTION("Only nighttime rate") {
        TariffRecord tariff;
        tariff.enabled = true;
        tariff.hasNighttimeRate = true;
        tariff.nighttimeRate = 0.25;

        calculateCost(&tariff, 4., at("2024-01-01T12:00:00Z"), at("2024-01-01T13:00:00Z"), breakdown);
        REQUIRE( breakdown.rateType == "flat_rate" );
        REQUIRE( breakdown.totalCost == Approx(1.0) );
    }

    SECTION("Start fee only") {
        TariffRecord tariff;
        tariff.enabled = true;
        tariff.hasFixedStartFee = true;
        tariff.fixedStartFee = 2.5;

        REQUIRE( calculateCost(&tariff, 4., at("2024-01-01T12:00:00Z"), at("2024-01-01T13:00:00Z"), breakdown) == Approx(2.5) );
        REQUIRE( !breakdown.hasEnergyCost );
    }

    SECTION("Deterministic") {
        auto tariff = dayNightTariff();
        CostBreakdown other;
        double cost1 = calculateCost(&tariff, 7.77, at("2024-01-01T05:59:59Z"), at("2024-01-01T07:00:00Z"), breakdown);
        double cost2 = calculateCost(&tariff, 7.77, at("2024-01-01T05:59:59Z"), at("2024-01-01T07:00:00Z"), other);
        REQUIRE( cost1 == cost2 );
        REQUIRE( breakdown.rateType == other.rateType );
        REQUIRE( breakdown.rateType == "nighttime" );
    }

    SECTION("Breakdown JSON") {
        auto tariff = dayNightTariff();
        calculateCost(&tariff, 10., at("2024-01-01T10:00:00Z"), at("2024-01-01T11:00:00Z"), breakdown);

        std::string json;
        REQUIRE( breakdown.toJsonString(json) );
        REQUIRE( json.find("\"totalCost\":4") != std::string::npos );
        REQUIRE( json.find("\"rateType\":\"daytime\"") != std::string::npos );
        REQUIRE( json.find("\"daytimeHours\":\"06:00-22:00\"") != std::string::npos );
    }

    SECTION("isDaytime") {
        REQUIRE( isDaytime(12 * 3600, 6 * 3600, 22 * 3600) );
        REQUIRE( !isDaytime(23 * 3600, 6 * 3600, 22 * 3600) );
        REQUIRE( isDaytime(23 * 3600, 22 * 3600, 6 * 3600) );
        REQUIRE( isDaytime(0, 22 * 3600, 6 * 3600) );
        REQUIRE( !isDaytime(12 * 3600, 22 * 3600, 6 * 3600) );
    }
}

TEST_CASE( "Tariff lookup" ) {
    printf("\nRun %s\n",  "Tariff lookup");

    auto faultyStore = std::make_shared<FaultyStore>(makeSeededStore());
    TariffService tariffService {*faultyStore};

    CostBreakdown breakdown;
    Timestamp start, end;
    start.setTime("2024-01-01T10:00:00Z");
    end.setTime("2024-01-01T11:00:00Z");

    SECTION("Seeded tariffs") {
        REQUIRE( tariffService.cost(1, 10., start, end, breakdown) == Approx(4.0) );
        REQUIRE( tariffService.cost(2, 10., start, end, breakdown) == Approx(4.0) );
        REQUIRE( breakdown.rateType == "flat_rate" );
        REQUIRE( tariffService.cost(3, 10., start, end, breakdown) == 0. );
        REQUIRE( breakdown.reason == "Tariff disabled" );
    }

    SECTION("Unknown tariff") {
        REQUIRE( tariffService.cost(99, 10., start, end, breakdown) == 0. );
        REQUIRE( breakdown.reason == "Tariff not found" );
    }

    SECTION("No tariff linked") {
        REQUIRE( tariffService.cost(-1, 10., start, end, breakdown) == 0. );
        REQUIRE( breakdown.reason == "No pricing plan or zero energy" );
    }

    SECTION("Lookup failure") {
        faultyStore->fail("getTariff");
        REQUIRE( tariffService.cost(1, 10., start, end, breakdown) == 0. );
        REQUIRE( breakdown.reason == "Tariff lookup failed" );
    }
}

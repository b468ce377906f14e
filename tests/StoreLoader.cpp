// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Store/MemoryStore.h>
#include <MicroCentral/Model/Store/StoreLoader.h>
#include <MicroCentral/Core/FilesystemAdapter.h>
#include <MicroCentral/Core/FilesystemUtils.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroCentral;

TEST_CASE( "Store seed" ) {
    printf("\nRun %s\n",  "Store seed");

    MemoryStore store;

    SECTION("Seeded records") {
        REQUIRE( StoreLoader::loadSeed(TEST_SEED, store) );

        ChargerRecord charger;
        REQUIRE( store.getChargerByName("CP-2", charger) == FetchStatus::Found );
        REQUIRE( charger.chargerId == 2 );
        REQUIRE( charger.siteId == 2 );
        REQUIRE( charger.enabled );
        REQUIRE( !charger.online );

        REQUIRE( store.getChargerByNameIgnoreCase("cp-old", charger) == FetchStatus::Found );
        REQUIRE( !charger.enabled );

        RfidCardRecord card;
        REQUIRE( store.getRfidCard("NODRIVER", card) == FetchStatus::Found );
        REQUIRE( card.driverId == -1 );

        TariffRecord tariff;
        REQUIRE( store.getTariff(1, tariff) == FetchStatus::Found );
        REQUIRE( tariff.hasDaytimeRate );
        REQUIRE( tariff.daytimeRate == Approx(0.30) );
        REQUIRE( tariff.daytimeFrom == "06:00" );
        REQUIRE( store.getTariff(2, tariff) == FetchStatus::Found );
        REQUIRE( !tariff.hasNighttimeRate );

        PaymentMethodRecord method;
        REQUIRE( store.getDefaultPaymentMethod(1, method) == FetchStatus::Found );
        REQUIRE( method.paymentMethodId == 1 );
        REQUIRE( store.getDefaultPaymentMethod(2, method) == FetchStatus::NotFound );
    }

    SECTION("Invalid seed") {
        REQUIRE( !StoreLoader::loadSeed("[]", store) );
        REQUIRE( !StoreLoader::loadSeed("{\"chargers\": {}}", store) );
        REQUIRE( !StoreLoader::loadSeed("{\"chargers\": [", store) );
        REQUIRE( !StoreLoader::loadSeed((const char*) nullptr, store) );
    }

    SECTION("Invalid entries are skipped") {
        REQUIRE( !StoreLoader::loadSeed(R"({"chargers": [
                {"chargerId": 1, "name": "CP-1"},
                {"chargerId": 2},
                {"chargerId": 3, "name": "CP-1"}
            ]})", store) );

        ChargerRecord charger;
        REQUIRE( store.getChargerByName("CP-1", charger) == FetchStatus::Found );
        REQUIRE( charger.chargerId == 1 );
    }

    SECTION("Seed file") {
        auto filesystem = makeDefaultFilesystemAdapter(FilesystemOpt::Use_Mount);
        REQUIRE( filesystem );

        auto doc = makeJsonDoc("test", 512);
        REQUIRE( doc );
        JsonArray chargers = doc->createNestedArray("chargers");
        JsonObject charger = chargers.createNestedObject();
        charger["chargerId"] = 7;
        charger["name"] = "CP-7";
        REQUIRE( FilesystemUtils::storeJson(filesystem, MC_FILENAME_PREFIX "test-seed.jsn", *doc) );

        REQUIRE( StoreLoader::loadSeed(filesystem, MC_FILENAME_PREFIX "test-seed.jsn", store) );

        ChargerRecord loaded;
        REQUIRE( store.getChargerByName("CP-7", loaded) == FetchStatus::Found );
        REQUIRE( loaded.chargerId == 7 );

        REQUIRE( !StoreLoader::loadSeed(filesystem, MC_FILENAME_PREFIX "missing-seed.jsn", store) );

        filesystem->remove(MC_FILENAME_PREFIX "test-seed.jsn");
    }
}

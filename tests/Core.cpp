// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral.h>
#include <MicroCentral/Core/Configuration.h>
#include <MicroCentral/Core/OperationRegistry.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

#include <string.h>

using namespace MicroCentral;

TEST_CASE( "Time" ) {
    printf("\nRun %s\n",  "Time");

    SECTION("parse and serialize") {
        Timestamp t;
        REQUIRE( !t.isDefined() );
        REQUIRE( t.setTime("2024-01-01T10:00:00.486Z") );
        REQUIRE( t.isDefined() );

        char buf [MC_JSONDATE_SIZE];
        REQUIRE( t.toJsonString(buf, sizeof(buf)) );
        REQUIRE( !strcmp(buf, "2024-01-01T10:00:00.000Z") );

        char timeOfDay [MC_TIMEOFDAY_SIZE];
        REQUIRE( t.toTimeOfDayString(timeOfDay, sizeof(timeOfDay)) );
        REQUIRE( !strcmp(timeOfDay, "10:00:00") );
        REQUIRE( t.secondsOfDay() == 36000 );

        Timestamp unchanged = t;
        REQUIRE( !t.setTime("yesterday") );
        REQUIRE( t == unchanged );
    }

    SECTION("arithmetics") {
        Timestamp t0, t1;
        REQUIRE( t0.setTime("2024-02-28T23:00:00Z") );
        REQUIRE( t1.setTime("2024-03-01T01:00:00Z") );
        REQUIRE( t1 - t0 == 26 * 3600 ); //leap year
        REQUIRE( t0 - t1 == -26 * 3600 );
        REQUIRE( t0 < t1 );

        Timestamp t2 = t0 + 26 * 3600;
        REQUIRE( t2 == t1 );
    }

    SECTION("unix time") {
        Timestamp t;
        REQUIRE( t.setUnixTime(1704103200) );

        Timestamp expected;
        expected.setTime(BASE_TIME);
        REQUIRE( t == expected );
        REQUIRE( expected.toUnixTime() == 1704103200 );

        unix_time = 1704103200;
        REQUIRE( Clock().now() == expected );
    }

    SECTION("time of day") {
        int32_t secs = -1;
        REQUIRE( parseTimeOfDay("22:00", secs) );
        REQUIRE( secs == 22 * 3600 );
        REQUIRE( parseTimeOfDay("06:30:15", secs) );
        REQUIRE( secs == 6 * 3600 + 30 * 60 + 15 );
        REQUIRE( !parseTimeOfDay("25:00", secs) );
        REQUIRE( !parseTimeOfDay("noon", secs) );
    }
}

TEST_CASE( "OCPP-J messaging" ) {
    printf("\nRun %s\n",  "OCPP-J messaging");

    configuration_deinit();
    unix_time = 1704103200;

    CentralSystem centralSystem {makeSeededStore()};
    centralSystem.setWorkerThreads(false);
    REQUIRE( centralSystem.setup() );

    auto connection = std::make_shared<TestConnection>();
    auto session = centralSystem.acceptConnection("/ocpp/CP-1", "ocpp1.6", connection);
    REQUIRE( session != nullptr );

    auto receive = [&] (const char *msg) -> std::string {
        connection->clear();
        session->receiveTXT(msg, strlen(msg));
        loop(centralSystem, 1);
        return connection->count() > 0 ? connection->last() : std::string();
    };

    auto parse = [] (const std::string& answer, DynamicJsonDocument& doc) {
        REQUIRE( !deserializeJson(doc, answer) );
        REQUIRE( doc.is<JsonArray>() );
    };

    SECTION("Unknown action") {
        DynamicJsonDocument doc (1024);
        parse(receive(R"([2,"u1","SignCertificate",{}])"), doc);
        REQUIRE( (int) doc[0] == 4 );
        REQUIRE( !strcmp(doc[1] | "", "u1") );
        REQUIRE( !strcmp(doc[2] | "", "NotImplemented") );
        REQUIRE( doc[4].is<JsonObject>() );
    }

    SECTION("Unsupported action") {
        DynamicJsonDocument doc (1024);
        parse(receive(R"([2,"d1","DataTransfer",{"vendorId":"Acme"}])"), doc);
        REQUIRE( (int) doc[0] == 4 );
        REQUIRE( !strcmp(doc[1] | "", "d1") );
        REQUIRE( !strcmp(doc[2] | "", "NotSupported") );

        parse(receive(R"([2,"f1","FirmwareStatusNotification",{"status":"Idle"}])"), doc);
        REQUIRE( !strcmp(doc[2] | "", "NotSupported") );
    }

    SECTION("Not an array") {
        DynamicJsonDocument doc (1024);
        parse(receive(R"({"action":"Heartbeat"})"), doc);
        REQUIRE( (int) doc[0] == 4 );
        REQUIRE( !strcmp(doc[1] | "", "-1") );
        REQUIRE( !strcmp(doc[2] | "", "FormationViolation") );
    }

    SECTION("Broken JSON") {
        DynamicJsonDocument doc (1024);
        parse(receive(R"([2,"m1","Heartbeat",{)"), doc);
        REQUIRE( (int) doc[0] == 4 );
        REQUIRE( !strcmp(doc[1] | "", "m1") );
        REQUIRE( !strcmp(doc[2] | "", "FormationViolation") );

        parse(receive("garbage"), doc);
        REQUIRE( !strcmp(doc[1] | "", "-1") );
        REQUIRE( !strcmp(doc[2] | "", "FormationViolation") );
    }

    SECTION("Unknown messageTypeId") {
        DynamicJsonDocument doc (1024);
        parse(receive(R"([7,"x1","Heartbeat",{}])"), doc);
        REQUIRE( (int) doc[0] == 4 );
        REQUIRE( !strcmp(doc[1] | "", "x1") );
        REQUIRE( !strcmp(doc[2] | "", "FormationViolation") );
    }

    SECTION("Incomplete CALL") {
        DynamicJsonDocument doc (1024);
        parse(receive(R"([2,"c1","Heartbeat"])"), doc);
        REQUIRE( (int) doc[0] == 4 );
        REQUIRE( !strcmp(doc[1] | "", "c1") );
        REQUIRE( !strcmp(doc[2] | "", "FormationViolation") );

        parse(receive(R"([2,"c2","Heartbeat",[]])"), doc);
        REQUIRE( !strcmp(doc[1] | "", "c2") );
        REQUIRE( !strcmp(doc[2] | "", "FormationViolation") );
    }

    SECTION("Unmatched response") {
        REQUIRE( receive(R"([3,"nobody-asked",{}])").empty() );
        REQUIRE( receive(R"([4,"nobody-asked","GenericError","",{}])").empty() );
        REQUIRE( session->getState() == SessionState::Active );
    }

    SECTION("Session continues after errors") {
        receive("garbage");
        auto answer = receive(R"([2,"h1","Heartbeat",{}])");

        DynamicJsonDocument doc (1024);
        parse(answer, doc);
        REQUIRE( (int) doc[0] == 3 );
        REQUIRE( !strcmp(doc[1] | "", "h1") );
    }

    centralSystem.shutdown();
    configuration_deinit();
}

TEST_CASE( "Dispatch table" ) {
    printf("\nRun %s\n",  "Dispatch table");

    configuration_deinit();

    CentralSystem centralSystem {makeSeededStore()};
    auto& model = centralSystem.getModel();

    ChargerRecord charger;
    SessionConfig config;

    SECTION("All charge point actions covered") {
        OperationRegistry registry;
        registerChargePointOperations(registry, model, charger, config);
        REQUIRE( registry.validate(MC_OCPP16_CP_ACTIONS, MC_OCPP16_CP_ACTIONS_COUNT) );
        REQUIRE( centralSystem.setup() );

        for (size_t i = 0; i < MC_OCPP16_CP_ACTIONS_COUNT; i++) {
            REQUIRE( registry.isRegistered(MC_OCPP16_CP_ACTIONS[i]) );
        }
    }

    SECTION("Missing handler") {
        OperationRegistry incomplete;
        incomplete.registerUnsupported("DataTransfer");
        REQUIRE( !incomplete.validate(MC_OCPP16_CP_ACTIONS, MC_OCPP16_CP_ACTIONS_COUNT) );
    }

    configuration_deinit();
}

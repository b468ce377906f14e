// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral.h>
#include <MicroCentral/Core/Configuration.h>
#include <MicroCentral/Operations/ChangeConfiguration.h>
#include <MicroCentral/Operations/Reset.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

#include <atomic>
#include <chrono>
#include <string.h>
#include <thread>

using namespace MicroCentral;

namespace {

std::unique_ptr<Operation> makeReset(const char *type) {
    return std::unique_ptr<Operation>(new Ocpp16::Reset(type));
}

} //namespace

TEST_CASE( "Outbound calls" ) {
    printf("\nRun %s\n",  "Outbound calls");

    configuration_deinit();
    unix_time = 1704103200;

    CentralSystem centralSystem {makeSeededStore()};
    centralSystem.setWorkerThreads(false);
    REQUIRE( centralSystem.setup() );

    auto connection = std::make_shared<TestConnection>();
    auto session = centralSystem.acceptConnection("/ocpp/CP-1", "ocpp1.6", connection);
    REQUIRE( session != nullptr );

    int callbacks = 0;
    CallResult result;
    auto onResult = [&callbacks, &result] (const CallResult& r) {
        callbacks++;
        result = r;
    };

    //the messageId of the last CALL sent to the charge point
    auto lastMessageId = [&connection] () -> std::string {
        DynamicJsonDocument doc (1024);
        REQUIRE( !deserializeJson(doc, connection->last()) );
        REQUIRE( (int) doc[0] == 2 );
        return doc[1] | "";
    };

    auto respond = [&] (const std::string& msg) {
        session->receiveTXT(msg.c_str(), msg.length());
        loop(centralSystem, 1);
    };

    SECTION("CALL format") {
        REQUIRE( centralSystem.sendCall("CP-1", makeReset("Hard"), onResult) );

        DynamicJsonDocument doc (1024);
        REQUIRE( !deserializeJson(doc, connection->last()) );
        REQUIRE( doc.size() == 4 );
        REQUIRE( (int) doc[0] == 2 );
        REQUIRE( doc[1].is<const char*>() );
        REQUIRE( !strcmp(doc[2] | "", "Reset") );
        REQUIRE( !strcmp(doc[3]["type"] | "", "Hard") );

        ConnectionStats stats;
        REQUIRE( centralSystem.getStats("CP-1", stats) );
        REQUIRE( stats.pendingCalls == 1 );
        REQUIRE( callbacks == 0 );
    }

    SECTION("Confirmed") {
        REQUIRE( centralSystem.sendCall("CP-1",
                std::unique_ptr<Operation>(new Ocpp16::ChangeConfiguration("MeterValueSampleInterval", "60")),
                onResult) );

        DynamicJsonDocument doc (1024);
        REQUIRE( !deserializeJson(doc, connection->last()) );
        REQUIRE( !strcmp(doc[2] | "", "ChangeConfiguration") );
        REQUIRE( !strcmp(doc[3]["key"] | "", "MeterValueSampleInterval") );
        REQUIRE( !strcmp(doc[3]["value"] | "", "60") );

        respond(std::string("[3,\"") + lastMessageId() + "\",{\"status\":\"RebootRequired\"}]");

        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::Confirmed );
        REQUIRE( result.confStatus == "RebootRequired" );
        REQUIRE( result.payload == R"({"status":"RebootRequired"})" );

        //late duplicate is ignored
        respond(std::string("[3,\"") + lastMessageId() + "\",{\"status\":\"Accepted\"}]");
        REQUIRE( callbacks == 1 );

        ConnectionStats stats;
        REQUIRE( centralSystem.getStats("CP-1", stats) );
        REQUIRE( stats.pendingCalls == 0 );
    }

    SECTION("CallError") {
        REQUIRE( centralSystem.sendCall("CP-1", makeReset("Soft"), onResult) );

        respond(std::string("[4,\"") + lastMessageId() + "\",\"NotSupported\",\"no reset\",{}]");

        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::CallError );
        REQUIRE( result.errorCode == "NotSupported" );
        REQUIRE( result.errorDescription == "no reset" );
    }

    SECTION("Timeout") {
        REQUIRE( centralSystem.sendCall("CP-1", makeReset("Soft"), onResult) );

        mtime += 29000;
        loop(centralSystem, 1);
        REQUIRE( callbacks == 0 );

        mtime += 1000;
        loop(centralSystem, 1);
        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::Timeout );

        //response after the timeout has no effect
        respond(std::string("[3,\"") + lastMessageId() + "\",{\"status\":\"Accepted\"}]");
        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::Timeout );
    }

    SECTION("Custom call timeout") {
        auto callTimeout = declareConfiguration<int>(MC_CONFIG_CALL_TIMEOUT, 30);
        REQUIRE( callTimeout );
        callTimeout->setInt(5);

        auto connection2 = std::make_shared<TestConnection>();
        auto session2 = centralSystem.acceptConnection("/ocpp/CP-2", "ocpp1.6", connection2);
        REQUIRE( session2 != nullptr );

        REQUIRE( centralSystem.sendCall("CP-2", makeReset("Soft"), onResult) );
        mtime += 5000;
        loop(centralSystem, 1);
        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::Timeout );
    }

    SECTION("Abort on close") {
        REQUIRE( centralSystem.sendCall("CP-1", makeReset("Hard"), onResult) );
        REQUIRE( centralSystem.forceClose("CP-1", MC_WS_CLOSE_NORMAL, "maintenance") );
        REQUIRE( connection->getCloseCode() == MC_WS_CLOSE_NORMAL );
        REQUIRE( connection->getCloseReason() == "maintenance" );

        loop(centralSystem, 1);

        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::Closed );
        REQUIRE( session->getState() == SessionState::Closed );
        REQUIRE( !centralSystem.isOnline("CP-1") );

        //no session anymore
        REQUIRE( !centralSystem.sendCall("CP-1", makeReset("Hard"), onResult) );
        REQUIRE( callbacks == 2 );
        REQUIRE( result.status == CallStatus::NotConnected );
    }

    SECTION("Transport gone") {
        REQUIRE( centralSystem.sendCall("CP-1", makeReset("Hard"), onResult) );
        session->notifyTransportClosed();
        loop(centralSystem, 1);

        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::Closed );
        REQUIRE( centralSystem.listIdentities().empty() );
    }

    SECTION("Not connected") {
        REQUIRE( !centralSystem.sendCall("CP-2", makeReset("Hard"), onResult) );
        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::NotConnected );

        REQUIRE( !centralSystem.sendCall("CP-1", nullptr, onResult) );
        REQUIRE( callbacks == 2 );
        REQUIRE( result.status == CallStatus::Failure );
    }

    SECTION("Send failure") {
        connection->setSendFailure(true);
        REQUIRE( !centralSystem.sendCall("CP-1", makeReset("Hard"), onResult) );
        REQUIRE( callbacks == 1 );
        REQUIRE( result.status == CallStatus::Closed );

        ConnectionStats stats;
        REQUIRE( centralSystem.getStats("CP-1", stats) );
        REQUIRE( stats.pendingCalls == 0 );
    }

    centralSystem.shutdown();
    configuration_deinit();
}

TEST_CASE( "Blocking calls" ) {
    printf("\nRun %s\n",  "Blocking calls");

    configuration_deinit();
    unix_time = 1704103200;

    CentralSystem centralSystem {makeSeededStore()};
    centralSystem.setWorkerThreads(true);
    REQUIRE( centralSystem.setup() );

    auto connection = std::make_shared<TestConnection>();
    auto session = centralSystem.acceptConnection("/ocpp/CP-1", "ocpp1.6", connection);
    REQUIRE( session != nullptr );

    //charge point which answers the next CALL with `status`
    std::atomic<bool> running {true};
    auto answerNextCall = [&connection, &session, &running] (const char *status) {
        return std::thread([&connection, &session, &running, status] () {
            while (running && connection->count() == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            if (!running) {
                return;
            }
            DynamicJsonDocument doc (1024);
            if (deserializeJson(doc, connection->last())) {
                return;
            }
            std::string msg = std::string("[3,\"") + (doc[1] | "") + "\",{\"status\":\"" + status + "\"}]";
            session->receiveTXT(msg.c_str(), msg.length());
        });
    };

    SECTION("Reset") {
        auto chargePoint = answerNextCall("Accepted");
        auto result = centralSystem.reset("CP-1", "Hard");
        running = false;
        chargePoint.join();

        REQUIRE( result.status == CallStatus::Confirmed );
        REQUIRE( result.confStatus == "Accepted" );

        DynamicJsonDocument doc (1024);
        REQUIRE( !deserializeJson(doc, connection->at(0)) );
        REQUIRE( !strcmp(doc[2] | "", "Reset") );
    }

    SECTION("RemoteStartTransaction") {
        auto chargePoint = answerNextCall("Rejected");
        auto result = centralSystem.remoteStartTransaction("CP-1", "TAG1", 1);
        running = false;
        chargePoint.join();

        REQUIRE( result.status == CallStatus::Confirmed );
        REQUIRE( result.confStatus == "Rejected" );

        DynamicJsonDocument doc (1024);
        REQUIRE( !deserializeJson(doc, connection->at(0)) );
        REQUIRE( !strcmp(doc[2] | "", "RemoteStartTransaction") );
        REQUIRE( !strcmp(doc[3]["idTag"] | "", "TAG1") );
        REQUIRE( (int) doc[3]["connectorId"] == 1 );
    }

    SECTION("UnlockConnector") {
        auto chargePoint = answerNextCall("Unlocked");
        auto result = centralSystem.unlockConnector("CP-1", 2);
        running = false;
        chargePoint.join();

        REQUIRE( result.status == CallStatus::Confirmed );
        REQUIRE( result.confStatus == "Unlocked" );
    }

    SECTION("Not connected") {
        auto result = centralSystem.changeAvailability("CP-2", 0, "Inoperative");
        REQUIRE( result.status == CallStatus::NotConnected );
    }

    running = false;
    centralSystem.shutdown();
    REQUIRE( session->getState() == SessionState::Closed );
    REQUIRE( connection->getCloseCode() == MC_WS_CLOSE_GOING_AWAY );
    configuration_deinit();
}

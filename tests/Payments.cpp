// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Payments/PaymentSyncService.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Model/Store/MemoryStore.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

#include <string.h>

using namespace MicroCentral;

TEST_CASE( "Payment status sync" ) {
    printf("\nRun %s\n",  "Payment status sync");

    unix_time = 1704103200; //2024-01-01T10:00:00Z

    auto memoryStore = makeSeededStore();
    auto faultyStore = std::make_shared<FaultyStore>(memoryStore);
    Clock clock;
    SessionService sessionService {*faultyStore, clock};
    PaymentSyncService paymentSync {*faultyStore, clock};

    ChargerRecord cp1;
    REQUIRE( memoryStore->getChargerByName("CP-1", cp1) == FetchStatus::Found );

    Timestamp start;
    start.setTime(BASE_TIME);

    int paymentTransactionId = -1;
    REQUIRE( paymentSync.openSessionPayment(cp1, 1, 1, paymentTransactionId) );
    REQUIRE( paymentTransactionId == 1 );

    int sessionId = -1;
    REQUIRE( sessionService.openSession(cp1, "TAG1", 1, start, 1, 1, -1, sessionId) );
    REQUIRE( paymentSync.linkSession(paymentTransactionId, sessionId) );

    SECTION("Open and link") {
        PaymentTransactionRecord transaction;
        REQUIRE( memoryStore->getPaymentTransaction(paymentTransactionId, transaction) == FetchStatus::Found );
        REQUIRE( transaction.status == MC_PAYMENT_TX_PENDING_COMPLETION );
        REQUIRE( transaction.paymentStatus == MC_PAYMENT_PENDING );
        REQUIRE( transaction.amount == 0. );
        REQUIRE( transaction.sessionId == sessionId );
        REQUIRE( transaction.paymentMethodId == 1 );
        REQUIRE( transaction.chargerId == 1 );
        REQUIRE( transaction.siteId == 1 );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentTransactionId == paymentTransactionId );
        REQUIRE( session.paymentStatus == "pending" );
        REQUIRE( session.paymentAmount == 0. );
    }

    SECTION("No default payment method") {
        int other = -1;
        REQUIRE( !paymentSync.openSessionPayment(cp1, 1, 2, other) );
        REQUIRE( other == -1 );
    }

    SECTION("Finalize with cost") {
        unix_time += 120;
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId, 4.0) );

        PaymentTransactionRecord transaction;
        REQUIRE( memoryStore->getPaymentTransaction(paymentTransactionId, transaction) == FetchStatus::Found );
        REQUIRE( transaction.amount == Approx(4.0) );
        REQUIRE( transaction.paymentStatus == MC_PAYMENT_PENDING );
        REQUIRE( transaction.status == MC_PAYMENT_TX_COMPLETED );

        Timestamp settledAt;
        settledAt.setTime("2024-01-01T10:02:00Z");
        REQUIRE( transaction.updated == settledAt );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "pending" );
        REQUIRE( session.paymentAmount == Approx(4.0) );
    }

    SECTION("Finalize without cost") {
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId, 0.) );

        PaymentTransactionRecord transaction;
        REQUIRE( memoryStore->getPaymentTransaction(paymentTransactionId, transaction) == FetchStatus::Found );
        REQUIRE( transaction.amount == 0. );
        REQUIRE( transaction.paymentStatus == MC_PAYMENT_NOT_REQUIRED );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "not_required" );
    }

    SECTION("Finalize without payment transaction") {
        int sessionId2 = -1;
        REQUIRE( sessionService.openSession(cp1, "NODRIVER", 2, start, -1, -1, -1, sessionId2) );
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId2, 0.) );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId2, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "not_required" );
        REQUIRE( session.paymentTransactionId == -1 );
    }

    SECTION("Gateway status changes") {
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId, 4.0) );

        REQUIRE( paymentSync.onTransactionStatusChanged(paymentTransactionId, MC_PAYMENT_SUCCEEDED) );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "paid" );
        REQUIRE( session.paymentAmount == Approx(4.0) );

        //repeating the notification changes nothing
        REQUIRE( paymentSync.onTransactionStatusChanged(paymentTransactionId, MC_PAYMENT_SUCCEEDED) );
        ChargeSessionRecord repeated;
        REQUIRE( sessionService.getSession(sessionId, repeated) == FetchStatus::Found );
        REQUIRE( repeated.paymentStatus == session.paymentStatus );
        REQUIRE( repeated.paymentAmount == session.paymentAmount );
        REQUIRE( repeated.paymentTransactionId == session.paymentTransactionId );

        REQUIRE( paymentSync.onTransactionStatusChanged(paymentTransactionId, "chargeback_pending") );
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "unknown" );

        REQUIRE( !paymentSync.onTransactionStatusChanged(99, MC_PAYMENT_SUCCEEDED) );
        REQUIRE( !paymentSync.onTransactionStatusChanged(paymentTransactionId, "") );
    }

    SECTION("Intent status changes") {
        REQUIRE( memoryStore->setPaymentTransactionIntent(paymentTransactionId, "pi_123") );

        REQUIRE( paymentSync.onIntentStatusChanged("pi_123", MC_PAYMENT_REFUNDED) );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "refunded" );

        REQUIRE( !paymentSync.onIntentStatusChanged("pi_unknown", MC_PAYMENT_REFUNDED) );
    }

    SECTION("Latest transaction wins") {
        unix_time += 60;

        int paymentTransactionId2 = -1;
        REQUIRE( paymentSync.openSessionPayment(cp1, 1, 1, paymentTransactionId2) );
        REQUIRE( paymentTransactionId2 == 2 );
        REQUIRE( paymentSync.linkSession(paymentTransactionId2, sessionId) );
        REQUIRE( paymentSync.onTransactionStatusChanged(paymentTransactionId2, MC_PAYMENT_FAILED) );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentTransactionId == paymentTransactionId2 );
        REQUIRE( session.paymentStatus == "failed" );

        //a change of the older transaction is projected from the latest one
        REQUIRE( paymentSync.onTransactionStatusChanged(paymentTransactionId, MC_PAYMENT_SUCCEEDED) );
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentTransactionId == paymentTransactionId2 );
        REQUIRE( session.paymentStatus == "failed" );
    }

    SECTION("Unlinked transaction") {
        int unlinked = -1;
        REQUIRE( paymentSync.openSessionPayment(cp1, 1, 1, unlinked) );

        ChargeSessionRecord before;
        REQUIRE( sessionService.getSession(sessionId, before) == FetchStatus::Found );

        REQUIRE( paymentSync.onTransactionStatusChanged(unlinked, MC_PAYMENT_SUCCEEDED) );

        PaymentTransactionRecord transaction;
        REQUIRE( memoryStore->getPaymentTransaction(unlinked, transaction) == FetchStatus::Found );
        REQUIRE( transaction.paymentStatus == MC_PAYMENT_SUCCEEDED );

        ChargeSessionRecord after;
        REQUIRE( sessionService.getSession(sessionId, after) == FetchStatus::Found );
        REQUIRE( after.paymentStatus == before.paymentStatus );
        REQUIRE( after.paymentTransactionId == before.paymentTransactionId );
    }

    SECTION("statusFor") {
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId, 2.5) );

        SessionPaymentStatus status;
        REQUIRE( paymentSync.statusFor(sessionId, status) == FetchStatus::Found );
        REQUIRE( status.sessionId == sessionId );
        REQUIRE( status.paymentStatus == "pending" );
        REQUIRE( status.hasTransaction );
        REQUIRE( status.transaction.transactionId == paymentTransactionId );
        REQUIRE( status.transaction.amount == Approx(2.5) );

        REQUIRE( paymentSync.statusFor(99, status) == FetchStatus::NotFound );

        faultyStore->fail("getLatestSessionPaymentTransaction");
        REQUIRE( paymentSync.statusFor(sessionId, status) == FetchStatus::Failure );
    }

    SECTION("Persistence failure") {
        faultyStore->fail("updatePaymentTransaction");
        REQUIRE( !paymentSync.onTransactionStatusChanged(paymentTransactionId, MC_PAYMENT_SUCCEEDED) );
        REQUIRE( !paymentSync.finalizeSessionPayment(sessionId, 4.0) );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "pending" );

        PaymentTransactionRecord transaction;
        REQUIRE( memoryStore->getPaymentTransaction(paymentTransactionId, transaction) == FetchStatus::Found );
        REQUIRE( transaction.status == MC_PAYMENT_TX_PENDING_COMPLETION );

        //settling again after the store recovered
        faultyStore->heal();
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId, 4.0) );

        REQUIRE( memoryStore->getPaymentTransaction(paymentTransactionId, transaction) == FetchStatus::Found );
        REQUIRE( transaction.status == MC_PAYMENT_TX_COMPLETED );
        REQUIRE( transaction.amount == Approx(4.0) );
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentAmount == Approx(4.0) );
    }

    SECTION("Finalize once") {
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId, 4.0) );
        REQUIRE( paymentSync.onTransactionStatusChanged(paymentTransactionId, MC_PAYMENT_SUCCEEDED) );

        //a settled transaction keeps the status reported by the gateway
        REQUIRE( paymentSync.finalizeSessionPayment(sessionId, 4.0) );

        PaymentTransactionRecord transaction;
        REQUIRE( memoryStore->getPaymentTransaction(paymentTransactionId, transaction) == FetchStatus::Found );
        REQUIRE( transaction.paymentStatus == MC_PAYMENT_SUCCEEDED );
        REQUIRE( transaction.amount == Approx(4.0) );

        ChargeSessionRecord session;
        REQUIRE( sessionService.getSession(sessionId, session) == FetchStatus::Found );
        REQUIRE( session.paymentStatus == "paid" );
    }

    SECTION("Status mapping") {
        REQUIRE( !strcmp(mapSessionPaymentStatus("pending"), "pending") );
        REQUIRE( !strcmp(mapSessionPaymentStatus("succeeded"), "paid") );
        REQUIRE( !strcmp(mapSessionPaymentStatus("failed"), "failed") );
        REQUIRE( !strcmp(mapSessionPaymentStatus("canceled"), "canceled") );
        REQUIRE( !strcmp(mapSessionPaymentStatus("refunded"), "refunded") );
        REQUIRE( !strcmp(mapSessionPaymentStatus("not_required"), "not_required") );
        REQUIRE( !strcmp(mapSessionPaymentStatus("requires_action"), "unknown") );
        REQUIRE( !strcmp(mapSessionPaymentStatus(nullptr), "unknown") );
    }
}

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_PAYMENTSYNCSERVICE_H
#define MC_PAYMENTSYNCSERVICE_H

#include <MicroCentral/Model/Store/Store.h>

#define MC_PAYMENT_PENDING       "pending"
#define MC_PAYMENT_SUCCEEDED     "succeeded"
#define MC_PAYMENT_FAILED        "failed"
#define MC_PAYMENT_CANCELED      "canceled"
#define MC_PAYMENT_REFUNDED      "refunded"
#define MC_PAYMENT_NOT_REQUIRED  "not_required"

#define MC_PAYMENT_TX_PENDING_COMPLETION "pending_completion"
#define MC_PAYMENT_TX_COMPLETED          "completed"

namespace MicroCentral {

struct SessionPaymentStatus {
    int sessionId = -1;
    std::string paymentStatus; //session-facing status, empty if no payment is linked
    double cost = 0.;
    bool hasTransaction = false;
    PaymentTransactionRecord transaction;
};

/*
 * Maps a gateway payment status to the status projected onto the session
 */
const char *mapSessionPaymentStatus(const char *paymentStatus);

/*
 * Keeps the payment fields of a charge session equal to its latest linked PaymentTransaction. All
 * operations can be repeated without further effect
 */
class PaymentSyncService {
private:
    Store& store;
    Clock& clock;

    bool reprojectSession(int sessionId);
public:
    PaymentSyncService(Store& store, Clock& clock);

    bool onTransactionStatusChanged(int transactionId, const char *paymentStatus);
    bool onIntentStatusChanged(const char *externalIntentId, const char *paymentStatus);

    FetchStatus statusFor(int sessionId, SessionPaymentStatus& out);

    /*
     * Creates a pending PaymentTransaction charged to the default payment method of the driver's company.
     * Returns false if there is no default payment method
     */
    bool openSessionPayment(const ChargerRecord& charger, int driverId, int companyId, int& paymentTransactionIdOut);

    /*
     * Links an open PaymentTransaction to its session and projects it
     */
    bool linkSession(int paymentTransactionId, int sessionId);

    /*
     * Settles the linked PaymentTransaction with the final cost of the session. A transaction which
     * is settled already keeps its amount and payment status
     */
    bool finalizeSessionPayment(int sessionId, double cost);
};

} //namespace MicroCentral

#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Payments/PaymentSyncService.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using namespace MicroCentral;

const char *MicroCentral::mapSessionPaymentStatus(const char *paymentStatus) {
    if (!paymentStatus) {
        return "unknown";
    }
    if (!strcmp(paymentStatus, MC_PAYMENT_PENDING)) {
        return "pending";
    } else if (!strcmp(paymentStatus, MC_PAYMENT_SUCCEEDED)) {
        return "paid";
    } else if (!strcmp(paymentStatus, MC_PAYMENT_FAILED)) {
        return "failed";
    } else if (!strcmp(paymentStatus, MC_PAYMENT_CANCELED)) {
        return "canceled";
    } else if (!strcmp(paymentStatus, MC_PAYMENT_REFUNDED)) {
        return "refunded";
    } else if (!strcmp(paymentStatus, MC_PAYMENT_NOT_REQUIRED)) {
        return "not_required";
    }
    return "unknown";
}

PaymentSyncService::PaymentSyncService(Store& store, Clock& clock) : store(store), clock(clock) {

}

bool PaymentSyncService::reprojectSession(int sessionId) {
    PaymentTransactionRecord latest;
    auto ret = store.getLatestSessionPaymentTransaction(sessionId, latest);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("payment lookup for session %i failed", sessionId);
        return false;
    } else if (ret == FetchStatus::NotFound) {
        return true;
    }

    SessionPaymentUpdate update;
    update.setPaymentTransactionId = true;
    update.paymentTransactionId = latest.transactionId;
    update.setPaymentStatus = true;
    update.paymentStatus = mapSessionPaymentStatus(latest.paymentStatus.c_str());
    update.setPaymentAmount = true;
    update.paymentAmount = latest.amount;

    if (!store.updateSessionPayment(sessionId, update)) {
        MC_DBG_ERR("could not project payment onto session %i", sessionId);
        return false;
    }

    MC_DBG_DEBUG("session %i payment: %s", sessionId, update.paymentStatus.c_str());
    return true;
}

bool PaymentSyncService::onTransactionStatusChanged(int transactionId, const char *paymentStatus) {
    if (!paymentStatus || !*paymentStatus) {
        MC_DBG_ERR("invalid payment status");
        return false;
    }

    PaymentTransactionRecord transaction;
    auto ret = store.getPaymentTransaction(transactionId, transaction);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("payment transaction %i lookup failed", transactionId);
        return false;
    } else if (ret == FetchStatus::NotFound) {
        MC_DBG_WARN("payment transaction %i not found", transactionId);
        return false;
    }

    PaymentTransactionUpdate update;
    update.setPaymentStatus = true;
    update.paymentStatus = paymentStatus;
    update.updated = clock.now();

    if (!store.updatePaymentTransaction(transactionId, update)) {
        MC_DBG_ERR("could not update payment transaction %i", transactionId);
        return false;
    }

    MC_DBG_INFO("payment transaction %i: %s", transactionId, paymentStatus);

    if (transaction.sessionId <= 0) {
        return true;
    }

    return reprojectSession(transaction.sessionId);
}

bool PaymentSyncService::onIntentStatusChanged(const char *externalIntentId, const char *paymentStatus) {
    PaymentTransactionRecord transaction;
    auto ret = store.getPaymentTransactionByIntent(externalIntentId, transaction);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("payment intent lookup failed");
        return false;
    } else if (ret == FetchStatus::NotFound) {
        MC_DBG_WARN("payment intent %s not found", externalIntentId ? externalIntentId : "(null)");
        return false;
    }

    return onTransactionStatusChanged(transaction.transactionId, paymentStatus);
}

FetchStatus PaymentSyncService::statusFor(int sessionId, SessionPaymentStatus& out) {
    ChargeSessionRecord session;
    auto ret = store.getSession(sessionId, session);
    if (ret != FetchStatus::Found) {
        return ret;
    }

    out = SessionPaymentStatus();
    out.sessionId = sessionId;
    out.paymentStatus = session.paymentStatus;
    out.cost = session.cost;

    ret = store.getLatestSessionPaymentTransaction(sessionId, out.transaction);
    if (ret == FetchStatus::Failure) {
        return ret;
    }
    out.hasTransaction = (ret == FetchStatus::Found);

    return FetchStatus::Found;
}

bool PaymentSyncService::openSessionPayment(const ChargerRecord& charger, int driverId, int companyId, int& paymentTransactionIdOut) {
    PaymentMethodRecord method;
    auto ret = store.getDefaultPaymentMethod(companyId, method);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("payment method lookup failed");
        return false;
    } else if (ret == FetchStatus::NotFound) {
        MC_DBG_WARN("no default payment method for company %i", companyId);
        return false;
    }

    auto now = clock.now();

    PaymentTransactionRecord transaction;
    transaction.amount = 0.;
    transaction.status = MC_PAYMENT_TX_PENDING_COMPLETION;
    transaction.paymentStatus = MC_PAYMENT_PENDING;
    transaction.driverId = driverId;
    transaction.companyId = companyId;
    transaction.siteId = charger.siteId;
    transaction.chargerId = charger.chargerId;
    transaction.paymentMethodId = method.paymentMethodId;
    transaction.created = now;
    transaction.updated = now;

    if (!store.insertPaymentTransaction(transaction)) {
        MC_DBG_ERR("could not create payment transaction");
        return false;
    }

    MC_DBG_INFO("created payment transaction %i", transaction.transactionId);
    paymentTransactionIdOut = transaction.transactionId;
    return true;
}

bool PaymentSyncService::linkSession(int paymentTransactionId, int sessionId) {
    PaymentTransactionUpdate update;
    update.setSessionId = true;
    update.sessionId = sessionId;
    update.updated = clock.now();

    if (!store.updatePaymentTransaction(paymentTransactionId, update)) {
        MC_DBG_ERR("could not link payment transaction %i", paymentTransactionId);
        return false;
    }

    return reprojectSession(sessionId);
}

bool PaymentSyncService::finalizeSessionPayment(int sessionId, double cost) {
    PaymentTransactionRecord transaction;
    auto ret = store.getLatestSessionPaymentTransaction(sessionId, transaction);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("payment lookup for session %i failed", sessionId);
        return false;
    } else if (ret == FetchStatus::NotFound) {
        SessionPaymentUpdate update;
        update.setPaymentStatus = true;
        update.paymentStatus = MC_PAYMENT_NOT_REQUIRED;
        if (!store.updateSessionPayment(sessionId, update)) {
            MC_DBG_ERR("could not update session %i", sessionId);
            return false;
        }
        return true;
    }

    if (transaction.status != MC_PAYMENT_TX_PENDING_COMPLETION) {
        MC_DBG_DEBUG("payment transaction %i settled already", transaction.transactionId);
        return true;
    }

    PaymentTransactionUpdate update;
    update.setStatus = true;
    update.status = MC_PAYMENT_TX_COMPLETED;
    update.setAmount = true;
    update.amount = cost > 0. ? cost : 0.;
    update.setPaymentStatus = true;
    update.paymentStatus = cost > 0. ? MC_PAYMENT_PENDING : MC_PAYMENT_NOT_REQUIRED;
    update.updated = clock.now();

    if (!store.updatePaymentTransaction(transaction.transactionId, update)) {
        MC_DBG_ERR("could not settle payment transaction %i", transaction.transactionId);
        return false;
    }

    MC_DBG_INFO("payment transaction %i: amount %.2f", transaction.transactionId, update.amount);

    return reprojectSession(sessionId);
}

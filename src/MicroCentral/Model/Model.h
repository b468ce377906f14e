// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_MODEL_H
#define MC_MODEL_H

#include <memory>

#include <MicroCentral/Core/Time.h>

namespace MicroCentral {

class Store;
class AuthorizationService;
class TariffService;
class SessionService;
class PaymentSyncService;

/*
 * Services of the central system, shared by all charge point sessions
 */
class Model {
private:
    std::shared_ptr<Store> store;
    std::unique_ptr<AuthorizationService> authorizationService;
    std::unique_ptr<TariffService> tariffService;
    std::unique_ptr<SessionService> sessionService;
    std::unique_ptr<PaymentSyncService> paymentSyncService;
    Clock clock;

public:
    Model(std::shared_ptr<Store> store);
    Model() = delete;
    Model(const Model& rhs) = delete;
    ~Model();

    Store& getStore();

    AuthorizationService *getAuthorizationService();
    TariffService *getTariffService();
    SessionService *getSessionService();
    PaymentSyncService *getPaymentSyncService();

    Clock &getClock();
};

} //namespace MicroCentral

#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Store/Store.h>
#include <MicroCentral/Model/Authorization/AuthorizationService.h>
#include <MicroCentral/Model/Tariffs/TariffService.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Model/Payments/PaymentSyncService.h>

using namespace MicroCentral;

Model::Model(std::shared_ptr<Store> store) : store(std::move(store)) {
    authorizationService = std::unique_ptr<AuthorizationService>(new AuthorizationService(*this->store));
    tariffService = std::unique_ptr<TariffService>(new TariffService(*this->store));
    sessionService = std::unique_ptr<SessionService>(new SessionService(*this->store, clock));
    paymentSyncService = std::unique_ptr<PaymentSyncService>(new PaymentSyncService(*this->store, clock));
}

Model::~Model() = default;

Store& Model::getStore() {
    return *store;
}

AuthorizationService *Model::getAuthorizationService() {
    return authorizationService.get();
}

TariffService *Model::getTariffService() {
    return tariffService.get();
}

SessionService *Model::getSessionService() {
    return sessionService.get();
}

PaymentSyncService *Model::getPaymentSyncService() {
    return paymentSyncService.get();
}

Clock& Model::getClock() {
    return clock;
}

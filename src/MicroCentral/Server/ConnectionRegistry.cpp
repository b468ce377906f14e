// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Server/ConnectionRegistry.h>
#include <MicroCentral/Core/Connection.h>
#include <MicroCentral/Core/Time.h>
#include <MicroCentral/Model/Store/Store.h>
#include <MicroCentral/Debug.h>

using namespace MicroCentral;

ConnectionRegistry::ConnectionRegistry(Store& store, Clock& clock) : store(store), clock(clock) {

}

ConnectionRegistry::~ConnectionRegistry() {

}

void ConnectionRegistry::updateOnline(int chargerId, bool online) {
    if (chargerId < 0) {
        return;
    }

    ChargerLivenessUpdate update;
    update.setOnline = true;
    update.online = online;
    if (online) {
        update.setLastConnect = true;
        update.lastConnect = clock.now();
    } else {
        update.setLastDisconnect = true;
        update.lastDisconnect = clock.now();
    }

    if (!store.updateChargerLiveness(chargerId, update)) {
        MC_DBG_ERR("could not update liveness of charger %i", chargerId);
    }
}

void ConnectionRegistry::registerSession(std::shared_ptr<ChargePointSession> session, int chargerId) {
    if (!session) {
        MC_DBG_ERR("invalid arg");
        return;
    }

    std::shared_ptr<ChargePointSession> displaced;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto& entry = sessions[session->getIdentity()];
        displaced = std::move(entry);
        entry = session;
        if (displaced && displaced.get() != session.get()) {
            displacedSessions.push_back(displaced);
        }
    }

    if (displaced && displaced.get() != session.get()) {
        MC_DBG_INFO("%s: replaced by new connection", session->getIdentity());
        displaced->close(MC_WS_CLOSE_GOING_AWAY, "replaced by new connection");
    }

    updateOnline(chargerId, true);
}

bool ConnectionRegistry::unregisterSession(const char *identity, ChargePointSession *session, int chargerId) {
    if (!identity) {
        return false;
    }

    std::shared_ptr<ChargePointSession> removed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto entry = sessions.find(identity);
        if (entry == sessions.end() || entry->second.get() != session) {
            //a newer session is current; it keeps the charger online
            return false;
        }
        removed = std::move(entry->second);
        sessions.erase(entry);
    }

    updateOnline(chargerId, false);
    return true;
}

std::shared_ptr<ChargePointSession> ConnectionRegistry::getSession(const char *identity) {
    if (!identity) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = sessions.find(identity);
    if (entry == sessions.end()) {
        return nullptr;
    }
    return entry->second;
}

std::vector<std::string> ConnectionRegistry::listIdentities() {
    std::vector<std::string> res;
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : sessions) {
        res.push_back(entry.first);
    }
    return res;
}

bool ConnectionRegistry::getStats(const char *identity, ConnectionStats& out) {
    auto session = getSession(identity);
    if (!session) {
        return false;
    }
    out = session->getStats();
    return true;
}

std::vector<std::shared_ptr<ChargePointSession>> ConnectionRegistry::getSessions() {
    std::vector<std::shared_ptr<ChargePointSession>> res;
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : sessions) {
        res.push_back(entry.second);
    }
    res.insert(res.end(), displacedSessions.begin(), displacedSessions.end());
    return res;
}

size_t ConnectionRegistry::reapClosedSessions() {
    std::vector<std::shared_ptr<ChargePointSession>> reaped; //released outside the lock
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto entry = sessions.begin(); entry != sessions.end();) {
            if (entry->second->getState() == SessionState::Closed) {
                reaped.push_back(std::move(entry->second));
                entry = sessions.erase(entry);
            } else {
                entry++;
            }
        }
        for (auto session = displacedSessions.begin(); session != displacedSessions.end();) {
            if ((*session)->getState() == SessionState::Closed) {
                reaped.push_back(std::move(*session));
                session = displacedSessions.erase(session);
            } else {
                session++;
            }
        }
    }
    return reaped.size();
}

void ConnectionRegistry::closeAll(int code, const char *reason) {
    for (auto& session : getSessions()) {
        session->close(code, reason);
    }
}

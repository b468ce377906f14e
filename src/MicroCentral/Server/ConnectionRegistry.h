// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CONNECTIONREGISTRY_H
#define MC_CONNECTIONREGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <MicroCentral/Server/ChargePointSession.h>

namespace MicroCentral {

class Store;
class Clock;

/*
 * Live sessions by charge point identity. At most one session per identity; a newer connection
 * replaces the older one
 */
class ConnectionRegistry {
private:
    Store& store;
    Clock& clock;

    std::mutex mutex;
    std::map<std::string, std::shared_ptr<ChargePointSession>> sessions;
    std::vector<std::shared_ptr<ChargePointSession>> displacedSessions; //replaced but not Closed yet

    void updateOnline(int chargerId, bool online);
public:
    ConnectionRegistry(Store& store, Clock& clock);
    ~ConnectionRegistry();

    /*
     * Make `session` the current session of its identity. A displaced session is closed with 1001
     */
    void registerSession(std::shared_ptr<ChargePointSession> session, int chargerId);

    /*
     * Remove the entry of `identity` if `session` is still the current one. Marks the charger offline
     */
    bool unregisterSession(const char *identity, ChargePointSession *session, int chargerId);

    std::shared_ptr<ChargePointSession> getSession(const char *identity);

    std::vector<std::string> listIdentities();
    bool getStats(const char *identity, ConnectionStats& out);

    /*
     * All sessions which are not reaped yet, including the displaced ones
     */
    std::vector<std::shared_ptr<ChargePointSession>> getSessions();

    size_t reapClosedSessions(); //drops sessions which are Closed

    void closeAll(int code, const char *reason);
};

} //namespace MicroCentral

#endif

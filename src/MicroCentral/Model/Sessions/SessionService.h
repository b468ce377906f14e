// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_SESSIONSERVICE_H
#define MC_SESSIONSERVICE_H

#include <mutex>
#include <vector>

#include <MicroCentral/Model/Store/Store.h>

#define MC_STOPREASON_OTHER "Other"

namespace MicroCentral {

struct SessionCloseResult {
    int32_t durationSeconds = 0;
    double energyKwh = 0.;
    bool alreadyClosed = false; //the stored result of the earlier close is reported
};

EventRecord makeEventRecord(const ChargerRecord& charger, const char *type, const Timestamp& timestamp, int connectorId = -1, int sessionId = -1);

/*
 * Owns the charge session and connector status lifecycle and the event log of a session
 */
class SessionService {
private:
    Store& store;
    Clock& clock;
    std::mutex idMutex; //serializes the max + 1 assignment of session ids

    bool getBaselineEnergy(int sessionId, double& baselineOut, bool& found);
public:
    SessionService(Store& store, Clock& clock);

    /*
     * Opens a new session and writes its id to `sessionIdOut`. A session which is still open on the
     * same connector is closed with reason "Other" first
     */
    bool openSession(const ChargerRecord& charger, const char *idTag, int connectorId, const Timestamp& start,
            int driverId, int tariffId, int paymentTransactionId, int& sessionIdOut);

    bool recordMeterSample(EventRecord& sample);
    bool recordEvent(EventRecord& event);

    /*
     * Finalizes energy and duration. Calling it for a closed session changes nothing and reports
     * the stored result
     */
    FetchStatus closeSession(int sessionId, const Timestamp& end, const char *reason, double meterStop, SessionCloseResult& out);

    FetchStatus getSession(int sessionId, ChargeSessionRecord& out);
    FetchStatus findOpenSession(const ChargerRecord& charger, int connectorId, ChargeSessionRecord& out);

    bool updateRunningEnergy(int sessionId, double energyKwh);
    bool updateCost(int sessionId, double cost, const std::string& costBreakdown);

    bool updateConnectorStatus(const ChargerRecord& charger, int connectorId, const char *status);

    /*
     * Read-side derivations from the event log
     */
    FetchStatus energyFor(int sessionId, double& energyKwhOut);                    //last minus first register value, not negative
    FetchStatus timeline(int sessionId, std::vector<EventRecord>& out);           //energy events by timestamp, then insertion
    FetchStatus maxPower(int sessionId, double& kwOut);                            //max current * voltage / 1000
    FetchStatus meterStartFor(int sessionId, double& whOut);                       //earliest energy register value, else 0
};

} //namespace MicroCentral

#endif

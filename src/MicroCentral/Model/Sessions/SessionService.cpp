// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Debug.h>

#include <algorithm>

using namespace MicroCentral;

EventRecord MicroCentral::makeEventRecord(const ChargerRecord& charger, const char *type, const Timestamp& timestamp, int connectorId, int sessionId) {
    EventRecord event;
    event.chargerId = charger.chargerId;
    event.companyId = charger.companyId;
    event.siteId = charger.siteId;
    event.connectorId = connectorId;
    event.sessionId = sessionId;
    event.type = type ? type : "";
    event.timestamp = timestamp;
    return event;
}

SessionService::SessionService(Store& store, Clock& clock) : store(store), clock(clock) {

}

bool SessionService::getBaselineEnergy(int sessionId, double& baselineOut, bool& found) {
    std::vector<EventRecord> events;
    if (!store.getSessionEvents(sessionId, events)) {
        return false;
    }

    found = false;
    baselineOut = 0.;

    const EventRecord *earliest = nullptr;
    for (auto& event : events) {
        if (!event.hasEnergy) {
            continue;
        }
        if (!earliest || event.timestamp < earliest->timestamp) {
            earliest = &event;
        }
    }

    if (earliest) {
        found = true;
        baselineOut = earliest->energy;
    }
    return true;
}

bool SessionService::openSession(const ChargerRecord& charger, const char *idTag, int connectorId, const Timestamp& start,
            int driverId, int tariffId, int paymentTransactionId, int& sessionIdOut) {

    std::lock_guard<std::mutex> lock(idMutex);

    ChargeSessionRecord stale;
    auto ret = store.findOpenSession(charger.chargerId, connectorId, stale);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("open session lookup failed");
        return false;
    } else if (ret == FetchStatus::Found) {
        MC_DBG_WARN("session %i still open on %s/%i, close it", stale.sessionId, charger.name.c_str(), connectorId);

        double meterStop = 0.;
        std::vector<EventRecord> events;
        if (store.getSessionEvents(stale.sessionId, events)) {
            for (auto& event : events) {
                if (event.hasEnergy) {
                    meterStop = event.energy; //last sample in append order
                }
            }
        }

        SessionCloseResult result;
        if (closeSession(stale.sessionId, start, MC_STOPREASON_OTHER, meterStop, result) != FetchStatus::Found) {
            MC_DBG_ERR("could not close stale session %i", stale.sessionId);
            return false;
        }
    }

    int maxSessionId = 0;
    ret = store.getMaxSessionId(maxSessionId);
    if (ret == FetchStatus::Failure) {
        MC_DBG_ERR("session id lookup failed");
        return false;
    } else if (ret == FetchStatus::NotFound) {
        maxSessionId = 0;
    }

    ChargeSessionRecord session;
    session.sessionId = maxSessionId + 1;
    session.chargerId = charger.chargerId;
    session.connectorId = connectorId;
    session.companyId = charger.companyId;
    session.siteId = charger.siteId;
    session.idTag = idTag ? idTag : "";
    session.driverId = driverId;
    session.start = start;
    session.status = ChargeSessionStatus::Started;
    session.tariffId = tariffId;
    session.paymentTransactionId = paymentTransactionId;

    if (!store.insertSession(session)) {
        MC_DBG_ERR("could not insert session");
        return false;
    }

    MC_DBG_INFO("opened session %i on %s/%i", session.sessionId, charger.name.c_str(), connectorId);

    sessionIdOut = session.sessionId;
    return true;
}

bool SessionService::recordMeterSample(EventRecord& sample) {
    if (sample.type.empty()) {
        sample.type = MC_EVENT_METERVALUES;
    }
    return recordEvent(sample);
}

bool SessionService::recordEvent(EventRecord& event) {
    if (!store.appendEvent(event)) {
        MC_DBG_ERR("could not record %s event", event.type.c_str());
        return false;
    }
    return true;
}

FetchStatus SessionService::closeSession(int sessionId, const Timestamp& end, const char *reason, double meterStop, SessionCloseResult& out) {
    ChargeSessionRecord session;
    auto ret = store.getSession(sessionId, session);
    if (ret != FetchStatus::Found) {
        if (ret == FetchStatus::Failure) {
            MC_DBG_ERR("session %i lookup failed", sessionId);
        }
        return ret;
    }

    if (!session.isOpen()) {
        MC_DBG_DEBUG("session %i already closed", sessionId);
        out.durationSeconds = session.durationSeconds;
        out.energyKwh = session.energyKwh;
        out.alreadyClosed = true;
        return FetchStatus::Found;
    }

    double baseline = 0.;
    bool hasBaseline = false;
    if (!getBaselineEnergy(sessionId, baseline, hasBaseline)) {
        MC_DBG_ERR("session %i events lookup failed", sessionId);
        return FetchStatus::Failure;
    }

    SessionCloseUpdate update;
    update.end = end;
    update.durationSeconds = std::max((int32_t) 0, end - session.start);
    update.energyKwh = std::max(0., (meterStop - baseline) / 1000.);
    update.stopReason = reason ? reason : "";

    if (!store.updateSessionClose(sessionId, update)) {
        MC_DBG_ERR("could not close session %i", sessionId);
        return FetchStatus::Failure;
    }

    MC_DBG_INFO("closed session %i: %.3f kWh in %is", sessionId, update.energyKwh, (int) update.durationSeconds);

    out.durationSeconds = update.durationSeconds;
    out.energyKwh = update.energyKwh;
    out.alreadyClosed = false;
    return FetchStatus::Found;
}

FetchStatus SessionService::getSession(int sessionId, ChargeSessionRecord& out) {
    return store.getSession(sessionId, out);
}

FetchStatus SessionService::findOpenSession(const ChargerRecord& charger, int connectorId, ChargeSessionRecord& out) {
    return store.findOpenSession(charger.chargerId, connectorId, out);
}

bool SessionService::updateRunningEnergy(int sessionId, double energyKwh) {
    SessionBillingUpdate update;
    update.setEnergyKwh = true;
    update.energyKwh = energyKwh;
    return store.updateSessionBilling(sessionId, update);
}

bool SessionService::updateCost(int sessionId, double cost, const std::string& costBreakdown) {
    SessionBillingUpdate update;
    update.setCost = true;
    update.cost = cost;
    update.costBreakdown = costBreakdown;
    return store.updateSessionBilling(sessionId, update);
}

bool SessionService::updateConnectorStatus(const ChargerRecord& charger, int connectorId, const char *status) {
    if (connectorId == 0) {
        //connector 0 is the charger itself
        return true;
    }

    if (connectorId < 0 || !status) {
        MC_DBG_ERR("invalid connector status");
        return false;
    }

    ConnectorRecord connector;
    connector.chargerId = charger.chargerId;
    connector.connectorId = connectorId;
    connector.status = status;
    connector.enabled = true;
    connector.updated = clock.now();

    if (!store.upsertConnector(connector)) {
        MC_DBG_ERR("could not update connector %s/%i", charger.name.c_str(), connectorId);
        return false;
    }

    MC_DBG_DEBUG("connector %s/%i: %s", charger.name.c_str(), connectorId, status);
    return true;
}

FetchStatus SessionService::timeline(int sessionId, std::vector<EventRecord>& out) {
    ChargeSessionRecord session;
    auto ret = store.getSession(sessionId, session);
    if (ret != FetchStatus::Found) {
        return ret;
    }

    std::vector<EventRecord> events;
    if (!store.getSessionEvents(sessionId, events)) {
        return FetchStatus::Failure;
    }

    out.clear();
    for (auto& event : events) {
        if (event.hasEnergy) {
            out.push_back(event);
        }
    }

    std::sort(out.begin(), out.end(), [] (const EventRecord& lhs, const EventRecord& rhs) {
        if (lhs.timestamp != rhs.timestamp) {
            return lhs.timestamp < rhs.timestamp;
        }
        return lhs.eventId < rhs.eventId;
    });

    return FetchStatus::Found;
}

FetchStatus SessionService::energyFor(int sessionId, double& energyKwhOut) {
    std::vector<EventRecord> samples;
    auto ret = timeline(sessionId, samples);
    if (ret != FetchStatus::Found) {
        return ret;
    }

    if (samples.size() < 2) {
        energyKwhOut = 0.;
        return FetchStatus::Found;
    }

    energyKwhOut = std::max(0., (samples.back().energy - samples.front().energy) / 1000.);
    return FetchStatus::Found;
}

FetchStatus SessionService::maxPower(int sessionId, double& kwOut) {
    ChargeSessionRecord session;
    auto ret = store.getSession(sessionId, session);
    if (ret != FetchStatus::Found) {
        return ret;
    }

    std::vector<EventRecord> events;
    if (!store.getSessionEvents(sessionId, events)) {
        return FetchStatus::Failure;
    }

    kwOut = 0.;
    for (auto& event : events) {
        if (event.hasCurrent && event.hasVoltage) {
            kwOut = std::max(kwOut, event.current * event.voltage / 1000.);
        }
    }
    return FetchStatus::Found;
}

FetchStatus SessionService::meterStartFor(int sessionId, double& whOut) {
    bool found = false;
    if (!getBaselineEnergy(sessionId, whOut, found)) {
        return FetchStatus::Failure;
    }
    return FetchStatus::Found;
}

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Server/MongooseServer.h>
#include <MicroCentral/Server/CentralSystem.h>
#include <MicroCentral/Server/ChargePointSession.h>
#include <MicroCentral/Version.h>
#include <MicroCentral/Debug.h>

#include <string.h>

using namespace MicroCentral;

bool MongooseConnection::sendTXT(const char *msg, size_t length) {
    if (!connected) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (closePending) {
        return false;
    }
    outbox.emplace_back(msg, length);
    return true;
}

void MongooseConnection::close(int code, const char *reason) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closePending) {
        return;
    }
    closePending = true;
    closeCode = code;
    closeReason = reason ? reason : "";
    if (closeReason.length() > 123) {
        closeReason.resize(123); //control frame payload is limited to 125 bytes
    }
}

void MongooseConnection::flush(struct mg_connection *c) {
    std::deque<std::string> frames;
    bool sendClose = false;
    std::string closeFrame;
    {
        std::lock_guard<std::mutex> lock(mutex);
        frames.swap(outbox);
        if (closePending && !closeSent) {
            closeSent = true;
            sendClose = true;
            closeFrame.push_back((char) ((closeCode >> 8) & 0xFF));
            closeFrame.push_back((char) (closeCode & 0xFF));
            closeFrame += closeReason;
        }
    }

    for (auto& frame : frames) {
        MC_DBG_VERBOSE("send %.*s", (int) frame.length(), frame.c_str());
        mg_ws_send(c, frame.c_str(), frame.length(), WEBSOCKET_OP_TEXT);
    }

    if (sendClose) {
        mg_ws_send(c, closeFrame.c_str(), closeFrame.length(), WEBSOCKET_OP_CLOSE);
        c->is_draining = 1;
    }
}

MongooseServer::MongooseServer(CentralSystem& centralSystem) : centralSystem(centralSystem) {
    mg_mgr_init(&mgr);
}

MongooseServer::~MongooseServer() {
    for (auto& slot : slots) {
        slot.second.connection->setDisconnected();
        if (slot.second.session) {
            slot.second.session->notifyTransportClosed();
        }
    }
    slots.clear();
    mg_mgr_free(&mgr);
}

bool MongooseServer::listen(const char *url) {
    if (!url || !*url) {
        MC_DBG_ERR("invalid arg");
        return false;
    }
    if (!mg_http_listen(&mgr, url, handleEvent, this)) {
        MC_DBG_ERR("cannot listen on %s", url);
        return false;
    }
    listening = true;
    MC_DBG_INFO("listening on %s", url);
    return true;
}

void MongooseServer::poll(int timeoutMs) {
    mg_mgr_poll(&mgr, timeoutMs);
}

void MongooseServer::handleEvent(struct mg_connection *c, int ev, void *ev_data) {
    auto server = static_cast<MongooseServer*>(c->fn_data);
    if (!server) {
        return;
    }

    switch (ev) {
        case MG_EV_HTTP_MSG:
            server->onHttpMessage(c, (struct mg_http_message *) ev_data);
            break;
        case MG_EV_WS_MSG:
            server->onWsMessage(c, (struct mg_ws_message *) ev_data);
            break;
        case MG_EV_POLL:
            server->onPoll(c);
            break;
        case MG_EV_CLOSE:
            server->onClose(c);
            break;
        case MG_EV_ERROR:
            MC_DBG_WARN("connection %lu: %s", c->id, ev_data ? (const char *) ev_data : "error");
            break;
        default:
            break;
    }
}

void MongooseServer::onHttpMessage(struct mg_connection *c, struct mg_http_message *hm) {
    std::string path (hm->uri.buf, hm->uri.len);

    std::string subprotocols;
    struct mg_str *header = mg_http_get_header(hm, "Sec-WebSocket-Protocol");
    if (header) {
        subprotocols.assign(header->buf, header->len);
    }

    if (!CentralSystem::offersSubprotocol(subprotocols.c_str())) {
        MC_DBG_WARN("refuse %s: subprotocol %s not offered", path.c_str(), MC_OCPP_SUBPROTOCOL);
        mg_http_reply(c, 400, "", "Subprotocol %s required\n", MC_OCPP_SUBPROTOCOL);
        return;
    }

    mg_ws_upgrade(c, hm, "Sec-WebSocket-Protocol: %s\r\n", MC_OCPP_SUBPROTOCOL);

    auto connection = std::make_shared<MongooseConnection>();
    auto session = centralSystem.acceptConnection(path.c_str(), subprotocols.c_str(), connection);

    Slot slot;
    slot.connection = std::move(connection);
    slot.session = std::move(session);
    slots[c->id] = std::move(slot);
}

void MongooseServer::onWsMessage(struct mg_connection *c, struct mg_ws_message *wm) {
    auto slot = slots.find(c->id);
    if (slot == slots.end() || !slot->second.session) {
        return;
    }

    if ((wm->flags & 0x0F) != WEBSOCKET_OP_TEXT) {
        MC_DBG_WARN("%s: ignore non-text frame", slot->second.session->getIdentity());
        return;
    }

    MC_DBG_VERBOSE("recv %.*s", (int) wm->data.len, wm->data.buf);
    slot->second.session->receiveTXT(wm->data.buf, wm->data.len);
}

void MongooseServer::onPoll(struct mg_connection *c) {
    if (!c->is_websocket) {
        return;
    }
    auto slot = slots.find(c->id);
    if (slot == slots.end()) {
        return;
    }
    slot->second.connection->flush(c);
}

void MongooseServer::onClose(struct mg_connection *c) {
    auto slot = slots.find(c->id);
    if (slot == slots.end()) {
        return;
    }

    slot->second.connection->setDisconnected();
    if (slot->second.session) {
        MC_DBG_INFO("%s: transport closed", slot->second.session->getIdentity());
        slot->second.session->notifyTransportClosed();
    }
    slots.erase(slot);
}

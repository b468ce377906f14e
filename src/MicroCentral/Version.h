// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_VERSION_H
#define MC_VERSION_H

/*
 * Version specification of MicroCentral library (not related with the OCPP version)
 */
#define MC_VERSION "1.0.0"

/*
 * OCPP version identifier and the WebSocket subprotocol a charge point must offer
 */
#define MC_OCPP_V16  160 // OCPP 1.6
#define MC_OCPP_SUBPROTOCOL "ocpp1.6"

// Reservations (ReserveNow, CancelReservation)
#ifndef MC_ENABLE_RESERVATION
#define MC_ENABLE_RESERVATION 1
#endif

// Smart charging call surface (SetChargingProfile)
#ifndef MC_ENABLE_SMARTCHARGING
#define MC_ENABLE_SMARTCHARGING 1
#endif

#endif

// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

/*
 * A collection of the fixed-length string types in the OCPP specification
 */

#ifndef MC_CISTRINGS_H
#define MC_CISTRINGS_H

#define CiString20TypeLen 20
#define CiString25TypeLen 25
#define CiString50TypeLen 50
#define CiString255TypeLen 255
#define CiString500TypeLen 500

//specified by OCPP
#define IDTAG_LEN_MAX CiString20TypeLen
#define CONF_KEYLEN_MAX CiString50TypeLen
#define CONF_VALUELEN_MAX CiString500TypeLen
#define VENDOR_LEN_MAX CiString20TypeLen
#define MODEL_LEN_MAX CiString20TypeLen
#define SERIAL_LEN_MAX CiString25TypeLen
#define FIRMWARE_LEN_MAX CiString50TypeLen
#define METERTYPE_LEN_MAX CiString25TypeLen

#endif

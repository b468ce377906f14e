// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/UuidUtils.h>

#include <stdint.h>

namespace MicroCentral {
namespace UuidUtils {

#define UUID_STR_LEN 36

bool generateUUID(uint32_t (*rng)(), char *uuidBuffer, size_t len) {
    if (!rng || len < UUID_STR_LEN + 1) {
        return false;
    }

    uint32_t ar[4];
    for (uint8_t i = 0; i < 4; i++) {
        ar[i] = rng();
    }

    // Conforming to RFC 4122 Specification
    // - byte 7: four most significant bits ==> 0100  --> always 4
    // - byte 9: two  most significant bits ==> 10    --> always {8, 9, A, B}.
    ar[1] &= 0xFFF0FFFF;
    ar[1] |= 0x00040000;
    ar[2] &= 0xFFFFFFF3;
    ar[2] |= 0x00000008;

    // two hex digits per byte, dashes after the 4th, 6th, 8th and 10th byte
    for (uint8_t i = 0, j = 0; i < 16; i++) {
        if ((i & 0x1) == 0) {
            if ((4 <= i) && (i <= 10)) {
                uuidBuffer[j++] = '-';
            }
        }

        uint8_t nr   = i / 4;
        uint8_t xx   = ar[nr];
        uint8_t ch   = xx & 0x0F;
        uuidBuffer[j++] = (ch < 10)? '0' + ch : ('a' - 10) + ch;

        ch = (xx >> 4) & 0x0F;
        ar[nr] >>= 8;
        uuidBuffer[j++] = (ch < 10)? '0' + ch : ('a' - 10) + ch;
    }

    uuidBuffer[UUID_STR_LEN] = 0;
    return true;
}

} //namespace UuidUtils
} //namespace MicroCentral

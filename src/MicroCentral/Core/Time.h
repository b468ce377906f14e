// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_TIME_H
#define MC_TIME_H

#include <stdint.h>
#include <stddef.h>

#define MC_JSONDATE_SIZE (24 + 1) //e.g. 2025-05-18T18:55:13.000Z plus terminating zero
#define MC_TIMEOFDAY_SIZE (8 + 1) //e.g. 18:55:13

namespace MicroCentral {

class Timestamp {
private:
    /*
     * Internal representation of the current time. The initial values correspond to UNIX-time 0. January
     * corresponds to month 0 and the first day in the month is day 0.
     */
    int16_t year = 1970;
    int16_t month = 0;
    int16_t day = 0;
    int32_t hour = 0;
    int32_t minute = 0;
    int32_t second = 0;

public:

    Timestamp();

    Timestamp(int16_t year, int16_t month, int16_t day, int32_t hour, int32_t minute, int32_t second) :
                year(year), month(month), day(day), hour(hour), minute(minute), second(second) { };

    /**
     * Expects a date string like
     * 2020-10-01T20:53:32.486Z
     *
     * Only processes the first 19 characters. The subsequent are ignored until terminating 0.
     * Returns false and leaves this timestamp unchanged if the given string is not a JSON Date string.
     */
    bool setTime(const char* jsonDateString);

    bool toJsonString(char *out, size_t buffsize) const;

    //writes "HH:MM:SS"
    bool toTimeOfDayString(char *out, size_t buffsize) const;

    bool setUnixTime(int64_t unixTime);
    int64_t toUnixTime() const;

    //seconds since midnight of this timestamp's day
    int32_t secondsOfDay() const {return hour * 3600 + minute * 60 + second;}

    //the default-constructed value (UNIX-time 0) is treated as "not set"
    bool isDefined() const;

    Timestamp &operator+=(int secs);
    Timestamp &operator-=(int secs);

    int32_t operator-(const Timestamp &rhs) const;

    friend Timestamp operator+(const Timestamp &lhs, int secs);
    friend Timestamp operator-(const Timestamp &lhs, int secs);

    friend bool operator==(const Timestamp &lhs, const Timestamp &rhs);
    friend bool operator!=(const Timestamp &lhs, const Timestamp &rhs);
    friend bool operator<(const Timestamp &lhs, const Timestamp &rhs);
    friend bool operator<=(const Timestamp &lhs, const Timestamp &rhs);
    friend bool operator>(const Timestamp &lhs, const Timestamp &rhs);
    friend bool operator>=(const Timestamp &lhs, const Timestamp &rhs);
};

extern const Timestamp MIN_TIME;
extern const Timestamp MAX_TIME;

/*
 * Parses a time of day like "22:00" or "22:00:00" into seconds since midnight
 */
bool parseTimeOfDay(const char *src, int32_t& secondsOut);

class Clock {
public:
    Timestamp now() const; //wall clock of the host (see mc_unix_time())
};

} //namespace MicroCentral

#endif

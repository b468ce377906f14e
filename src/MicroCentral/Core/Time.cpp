// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/Time.h>
#include <MicroCentral/Platform.h>
#include <MicroCentral/Debug.h>

#include <string.h>
#include <ctype.h>
#include <stdio.h>

namespace MicroCentral {

const Timestamp MIN_TIME = Timestamp(2010, 0, 0, 0, 0, 0);
const Timestamp MAX_TIME = Timestamp(2037, 0, 0, 0, 0, 0);

Timestamp::Timestamp() {

}

int noDays(int month, int year) {
    return (month == 0 || month == 2 || month == 4 || month == 6 || month == 7 || month == 9 || month == 11) ? 31 :
            ((month == 3 || month == 5 || month == 8 || month == 10) ? 30 :
            ((year % 4 == 0 && (year % 100 != 0 || year % 400 == 0)) ? 29 : 28));
}

bool Timestamp::setTime(const char *jsonDateString) {

    const int JSONDATE_MINLENGTH = 19;

    if (!jsonDateString || strlen(jsonDateString) < JSONDATE_MINLENGTH){
        return false;
    }

    if (!isdigit(jsonDateString[0]) ||  //2
        !isdigit(jsonDateString[1]) ||    //0
        !isdigit(jsonDateString[2]) ||    //1
        !isdigit(jsonDateString[3]) ||    //3
        jsonDateString[4] != '-' ||       //-
        !isdigit(jsonDateString[5]) ||    //0
        !isdigit(jsonDateString[6]) ||    //2
        jsonDateString[7] != '-' ||       //-
        !isdigit(jsonDateString[8]) ||    //0
        !isdigit(jsonDateString[9]) ||    //1
        jsonDateString[10] != 'T' ||      //T
        !isdigit(jsonDateString[11]) ||   //2
        !isdigit(jsonDateString[12]) ||   //0
        jsonDateString[13] != ':' ||      //:
        !isdigit(jsonDateString[14]) ||   //5
        !isdigit(jsonDateString[15]) ||   //3
        jsonDateString[16] != ':' ||      //:
        !isdigit(jsonDateString[17]) ||   //3
        !isdigit(jsonDateString[18])) {   //2
                                        //ignore subsequent characters
        return false;
    }

    int year  =  (jsonDateString[0] - '0') * 1000 +
                (jsonDateString[1] - '0') * 100 +
                (jsonDateString[2] - '0') * 10 +
                (jsonDateString[3] - '0');
    int month =  (jsonDateString[5] - '0') * 10 +
                (jsonDateString[6] - '0') - 1;
    int day   =  (jsonDateString[8] - '0') * 10 +
                (jsonDateString[9] - '0') - 1;
    int hour  =  (jsonDateString[11] - '0') * 10 +
                (jsonDateString[12] - '0');
    int minute = (jsonDateString[14] - '0') * 10 +
                (jsonDateString[15] - '0');
    int second = (jsonDateString[17] - '0') * 10 +
                (jsonDateString[18] - '0');
    //ignore fractals

    if (year < 1970 || year >= 2038 ||
        month < 0 || month >= 12 ||
        day < 0 || day >= noDays(month, year) ||
        hour < 0 || hour >= 24 ||
        minute < 0 || minute >= 60 ||
        second < 0 || second > 60) { //tolerate leap seconds -- (23:59:60) can be a valid time
        return false;
    }

    this->year = year;
    this->month = month;
    this->day = day;
    this->hour = hour;
    this->minute = minute;
    this->second = second;

    return true;
}

bool Timestamp::toJsonString(char *jsonDateString, size_t buffsize) const {
    if (buffsize < MC_JSONDATE_SIZE) return false;

    jsonDateString[0] = ((char) ((year / 1000) % 10)) + '0';
    jsonDateString[1] = ((char) ((year / 100) % 10)) + '0';
    jsonDateString[2] = ((char) ((year / 10) % 10))  + '0';
    jsonDateString[3] = ((char) ((year / 1) % 10))  + '0';
    jsonDateString[4] = '-';
    jsonDateString[5] = ((char) (((month + 1) / 10) % 10))  + '0';
    jsonDateString[6] = ((char) (((month + 1) / 1) % 10))  + '0';
    jsonDateString[7] = '-';
    jsonDateString[8] = ((char) (((day + 1) / 10) % 10))  + '0';
    jsonDateString[9] = ((char) (((day + 1) / 1) % 10))  + '0';
    jsonDateString[10] = 'T';
    jsonDateString[11] = ((char) ((hour / 10) % 10))  + '0';
    jsonDateString[12] = ((char) ((hour / 1) % 10))  + '0';
    jsonDateString[13] = ':';
    jsonDateString[14] = ((char) ((minute / 10) % 10))  + '0';
    jsonDateString[15] = ((char) ((minute / 1) % 10))  + '0';
    jsonDateString[16] = ':';
    jsonDateString[17] = ((char) ((second / 10) % 10))  + '0';
    jsonDateString[18] = ((char) ((second / 1) % 10))  + '0';
    jsonDateString[19] = '.';
    jsonDateString[20] = '0'; //ignore fractals
    jsonDateString[21] = '0';
    jsonDateString[22] = '0';
    jsonDateString[23] = 'Z';
    jsonDateString[24] = '\0';

    return true;
}

bool Timestamp::toTimeOfDayString(char *out, size_t buffsize) const {
    auto ret = snprintf(out, buffsize, "%02i:%02i:%02i", (int)hour, (int)minute, (int)second);
    return ret >= 0 && (size_t)ret < buffsize;
}

bool Timestamp::setUnixTime(int64_t unixTime) {
    if (unixTime < 0 || unixTime >= MAX_TIME.toUnixTime()) {
        MC_DBG_ERR("UNIX time out of range: %lli", (long long)unixTime);
        return false;
    }
    Timestamp res = Timestamp();
    res += (int) unixTime;
    *this = res;
    return true;
}

int64_t Timestamp::toUnixTime() const {
    return (int64_t) (*this - Timestamp());
}

bool Timestamp::isDefined() const {
    return *this != Timestamp();
}

Timestamp &Timestamp::operator+=(int secs) {

    second += secs;

    if (second >= 0 && second < 60) return *this;

    minute += second / 60;
    second %= 60;
    if (second < 0) {
        minute--;
        second += 60;
    }

    if (minute >= 0 && minute < 60) return *this;

    hour += minute / 60;
    minute %= 60;
    if (minute < 0) {
        hour--;
        minute += 60;
    }

    if (hour >= 0 && hour < 24) return *this;

    int32_t days = day + hour / 24;
    hour %= 24;
    if (hour < 0) {
        days--;
        hour += 24;
    }

    while (days >= noDays(month, year)) {
        days -= noDays(month, year);
        month++;

        if (month >= 12) {
            month -= 12;
            year++;
        }
    }

    while (days < 0) {
        month--;
        if (month < 0) {
            month += 12;
            year--;
        }
        days += noDays(month, year);
    }

    day = (int16_t) days;

    return *this;
}

Timestamp &Timestamp::operator-=(int secs) {
    return operator+=(-secs);
}

int32_t Timestamp::operator-(const Timestamp &rhs) const {

    int16_t year_base, year_end;
    if (year <= rhs.year) {
        year_base = year;
        year_end = rhs.year;
    } else {
        year_base = rhs.year;
        year_end = year;
    }

    int32_t lhsDays = day;
    int32_t rhsDays = rhs.day;

    for (int16_t iy = year_base; iy <= year_end; iy++) {
        for (int16_t im = 0; im < 12; im++) {
            if (year > iy || (year == iy && month > im)) {
                lhsDays += noDays(im, iy);
            }
            if (rhs.year > iy || (rhs.year == iy && rhs.month > im)) {
                rhsDays += noDays(im, iy);
            }
        }
    }

    int32_t dt = (lhsDays - rhsDays) * (24 * 3600) + (hour - rhs.hour) * 3600 + (minute - rhs.minute) * 60 + second - rhs.second;
    return dt;
}

Timestamp operator+(const Timestamp &lhs, int secs) {
    Timestamp res = lhs;
    res += secs;
    return res;
}

Timestamp operator-(const Timestamp &lhs, int secs) {
    return operator+(lhs, -secs);
}

bool operator==(const Timestamp &lhs, const Timestamp &rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day && lhs.hour == rhs.hour && lhs.minute == rhs.minute && lhs.second == rhs.second;
}

bool operator!=(const Timestamp &lhs, const Timestamp &rhs) {
    return !(lhs == rhs);
}

bool operator<(const Timestamp &lhs, const Timestamp &rhs) {
    if (lhs.year != rhs.year)
        return lhs.year < rhs.year;
    if (lhs.month != rhs.month)
        return lhs.month < rhs.month;
    if (lhs.day != rhs.day)
        return lhs.day < rhs.day;
    if (lhs.hour != rhs.hour)
        return lhs.hour < rhs.hour;
    if (lhs.minute != rhs.minute)
        return lhs.minute < rhs.minute;
    if (lhs.second != rhs.second)
        return lhs.second < rhs.second;
    return false;
}

bool operator<=(const Timestamp &lhs, const Timestamp &rhs) {
    return lhs < rhs || lhs == rhs;
}

bool operator>(const Timestamp &lhs, const Timestamp &rhs) {
    return rhs < lhs;
}

bool operator>=(const Timestamp &lhs, const Timestamp &rhs) {
    return rhs <= lhs;
}

bool parseTimeOfDay(const char *src, int32_t& secondsOut) {
    if (!src) {
        return false;
    }

    size_t len = strlen(src);
    if ((len != 5 && len != 8) ||
            !isdigit(src[0]) || !isdigit(src[1]) || src[2] != ':' ||
            !isdigit(src[3]) || !isdigit(src[4])) {
        return false;
    }

    int hour = (src[0] - '0') * 10 + (src[1] - '0');
    int minute = (src[3] - '0') * 10 + (src[4] - '0');
    int second = 0;

    if (len == 8) {
        if (src[5] != ':' || !isdigit(src[6]) || !isdigit(src[7])) {
            return false;
        }
        second = (src[6] - '0') * 10 + (src[7] - '0');
    }

    if (hour >= 24 || minute >= 60 || second >= 60) {
        return false;
    }

    secondsOut = hour * 3600 + minute * 60 + second;
    return true;
}

Timestamp Clock::now() const {
    Timestamp res;
    if (!res.setUnixTime(mc_unix_time())) {
        MC_DBG_ERR("host clock not usable");
    }
    return res;
}

} //namespace MicroCentral

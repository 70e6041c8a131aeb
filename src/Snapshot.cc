#include <stdio.h>
#include <string>
#include <pcre++.h>

#include "Snapshot.h"
#include "globalsdef.h"
#include "util_generic.h"

using namespace pcrepp;


static struct tm toTm(const SnapshotTime &t) {
    struct tm fields = {};

    fields.tm_year = t.year - 1900;
    fields.tm_mon  = t.month - 1;
    fields.tm_mday = t.day;
    fields.tm_hour = t.hour;
    fields.tm_min  = t.minute;
    fields.tm_sec  = t.second;
    fields.tm_isdst = -1;

    return fields;
}


time_t SnapshotTime::instant() const {
    struct tm fields = toTm(*this);
    return mktime(&fields);
}


time_t SnapshotTime::endOfDay() const {
    SnapshotTime last = *this;
    last.hour = 23;
    last.minute = 59;
    last.second = 59;
    return last.instant();
}


string SnapshotTime::dateString() const {
    char buffer[20];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}


string SnapshotTime::timeString() const {
    char buffer[20];
    snprintf(buffer, sizeof(buffer), "%02d%02d%02d", hour, minute, second);
    return buffer;
}


bool SnapshotTime::sameDay(const SnapshotTime &other) const {
    return (year == other.year && month == other.month && day == other.day);
}


SnapshotTime SnapshotTime::fromEpoch(time_t when) {
    struct tm fields;
    SnapshotTime result;

    localtime_r(&when, &fields);
    result.year   = fields.tm_year + 1900;
    result.month  = fields.tm_mon + 1;
    result.day    = fields.tm_mday;
    result.hour   = fields.tm_hour;
    result.minute = fields.tm_min;
    result.second = fields.tm_sec;

    return result;
}


/* mktime() normalises out-of-range fields (Feb 30 -> Mar 2), so a date is real
   only if it survives the round trip unchanged.  timegm() is used for the check
   so a DST gap can't shift the hour. */
bool SnapshotTime::valid() const {
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 59 || hour < 0 || minute < 0 || second < 0)
        return false;

    struct tm fields = toTm(*this);
    fields.tm_isdst = 0;
    time_t flat = timegm(&fields);
    struct tm check;
    gmtime_r(&flat, &check);

    return (check.tm_year == year - 1900 && check.tm_mon == month - 1 && check.tm_mday == day);
}


bool SnapshotTime::parseDate(string text, SnapshotTime &result) {
    Pcre dateRE(TARGET_DATE_REGEX);

    if (!dateRE.search(text) || dateRE.matches() < 3)
        return false;

    SnapshotTime parsed;
    parsed.year  = stoi(dateRE.get_match(0));
    parsed.month = stoi(dateRE.get_match(1));
    parsed.day   = stoi(dateRE.get_match(2));

    if (!parsed.valid())
        return false;

    result = parsed;
    return true;
}


Snapshot::Snapshot() {
    kind = skFull;
}


/*******************************************************************************
 * Snapshot::parse(root, dirName, result)
 *
 * Classify a directory name as a full or incremental snapshot.  The whole name
 * has to match; anything else (including a well formed name with an impossible
 * date) returns false and is simply not a snapshot.
 *******************************************************************************/
bool Snapshot::parse(string root, string dirName, Snapshot &result) {
    Pcre fullRE(FULL_NAME_REGEX);
    Pcre incRE(INC_NAME_REGEX);
    Snapshot parsed;

    if (fullRE.search(dirName) && fullRE.matches() >= 3) {
        parsed.kind = skFull;
        parsed.createdAt.year  = stoi(fullRE.get_match(0));
        parsed.createdAt.month = stoi(fullRE.get_match(1));
        parsed.createdAt.day   = stoi(fullRE.get_match(2));
    }
    else
        if (incRE.search(dirName) && incRE.matches() >= 6) {
            parsed.kind = skIncremental;
            parsed.createdAt.year   = stoi(incRE.get_match(0));
            parsed.createdAt.month  = stoi(incRE.get_match(1));
            parsed.createdAt.day    = stoi(incRE.get_match(2));
            parsed.createdAt.hour   = stoi(incRE.get_match(3));
            parsed.createdAt.minute = stoi(incRE.get_match(4));
            parsed.createdAt.second = stoi(incRE.get_match(5));
        }
        else
            return false;

    if (!parsed.createdAt.valid())
        return false;

    parsed.name = dirName;
    parsed.path = slashConcat(root, dirName);
    result = parsed;
    return true;
}


string Snapshot::fullName(const SnapshotTime &when) {
    return when.dateString() + FULL_SUFFIX;
}


string Snapshot::incrementalName(const SnapshotTime &when) {
    return when.dateString() + INC_INFIX + when.timeString();
}


string Snapshot::ledgerFile() const {
    return slashConcat(path, LEDGER_FILENAME);
}


string Snapshot::recoveryFile() const {
    return slashConcat(path, RECOVERY_FILENAME);
}


bool operator<(const Snapshot &a, const Snapshot &b) {
    auto aInstant = a.instant();
    auto bInstant = b.instant();

    return (aInstant == bInstant ? a.name < b.name : aInstant < bInstant);
}


bool operator==(const Snapshot &a, const Snapshot &b) {
    return (a.name == b.name && a.path == b.path);
}


#ifndef SNAPSHOT_H
#define SNAPSHOT_H

#include <string>
#include <time.h>

using namespace std;


enum SnapshotKind { skFull, skIncremental };


/* A calendar timestamp as written into a snapshot's directory name.  Fulls carry
   only a date (time fields are zero); incrementals carry date and time of day. */
struct SnapshotTime {
    int year;
    int month;
    int day;
    int hour;
    int minute;
    int second;

    SnapshotTime() { year = month = day = hour = minute = second = 0; }

    // local time, like the names themselves
    time_t instant() const;
    time_t endOfDay() const;

    string dateString() const;      // YYYY-MM-DD
    string timeString() const;      // HHMMSS

    bool sameDay(const SnapshotTime &other) const;

    static SnapshotTime fromEpoch(time_t when);

    // strict YYYY-MM-DD; false on anything else including impossible dates
    static bool parseDate(string text, SnapshotTime &result);

    // true if the fields describe a real calendar date/time
    bool valid() const;
};


class Snapshot {
    public:
        SnapshotKind    kind;
        SnapshotTime    createdAt;
        string          name;       // directory name only
        string          path;       // absolute

        /* Everything here is derived from the directory name, *NOT* from mtime.  A synced
           full is touched every time it's refreshed and an incremental shares inodes
           (and therefore mtimes) with its base, so mtimes say nothing useful. */

        Snapshot();

        static bool parse(string root, string dirName, Snapshot &result);

        static string fullName(const SnapshotTime &when);
        static string incrementalName(const SnapshotTime &when);

        bool isFull() const { return kind == skFull; }
        time_t instant() const { return createdAt.instant(); }

        string ledgerFile() const;
        string recoveryFile() const;

        friend bool operator<(const Snapshot &a, const Snapshot &b);
        friend bool operator==(const Snapshot &a, const Snapshot &b);
};

#endif


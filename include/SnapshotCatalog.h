#ifndef SCATALOG_H
#define SCATALOG_H

#include <string>
#include <map>
#include <vector>
#include "Snapshot.h"
#include "globalsdef.h"


using namespace std;


/* The catalog is keyed on directory name.  Names start with YYYY-MM-DD so the
   map's natural ordering is chronological for fulls, and for incrementals too
   (the time is zero padded HHMMSS). */
class SnapshotCatalog {
private:
    string root;
    const RunConfig &config;
    map<string, Snapshot> fulls;
    map<string, Snapshot> incrementals;

public:
    SnapshotCatalog(string storageRoot, const RunConfig &runConfig);

    // (re)read the storage root; returns an error string or "" on success
    string scan();

    vector<Snapshot> listFulls() const;
    vector<Snapshot> listIncrementals() const;

    // most recent full by name; false if there isn't one
    bool latestFull(Snapshot &result) const;

    string getRoot() const { return root; }
    size_t size() const { return fulls.size() + incrementals.size(); }
};

#endif


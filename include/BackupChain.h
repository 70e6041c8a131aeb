#ifndef BACKUPCHAIN_H
#define BACKUPCHAIN_H

#include <string>
#include <vector>
#include "Snapshot.h"
#include "SnapshotCatalog.h"
#include "globalsdef.h"

using namespace std;


/* A base full plus the incrementals to lay on top of it, in replay order. */
struct BackupChain {
    Snapshot baseFull;
    vector<Snapshot> incrementals;
    SnapshotTime target;
};


class ChainResolver {
    const SnapshotCatalog &catalog;
    const RunConfig &config;

    public:
        ChainResolver(const SnapshotCatalog &snapshotCatalog, const RunConfig &runConfig);

        /* resolve(target)
         * Pick the latest full dated on or before target, then every incremental from
         * midnight of that full's date through 23:59:59 of target, oldest first.
         * Throws FBException(eResolution) if no full qualifies. */
        BackupChain resolve(const SnapshotTime &target) const;
};

#endif


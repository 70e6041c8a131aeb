#include <algorithm>

#include "BackupChain.h"
#include "exception.h"
#include "debug.h"


ChainResolver::ChainResolver(const SnapshotCatalog &snapshotCatalog, const RunConfig &runConfig) : catalog(snapshotCatalog), config(runConfig) {
}


BackupChain ChainResolver::resolve(const SnapshotTime &target) const {
    BackupChain chain;
    bool haveBase = false;

    chain.target = target;
    string targetDate = target.dateString();

    // fulls come back sorted by name, which is date order; keep the last one that qualifies
    for (auto &full: catalog.listFulls()) {
        if (full.createdAt.dateString() > targetDate)
            break;

        chain.baseFull = full;
        haveBase = true;
    }

    if (!haveBase)
        throw FBException("no full backup in " + catalog.getRoot() + " on or before " + targetDate, eResolution);

    time_t lowerBound = chain.baseFull.instant();
    time_t upperBound = target.endOfDay();

    DEBUG(config, D_chain) DFMT("base " << chain.baseFull.name << ", window " << lowerBound << " - " << upperBound);

    for (auto &inc: catalog.listIncrementals()) {
        auto when = inc.instant();

        if (when >= lowerBound && when <= upperBound) {
            DEBUG(config, D_chain) DFMT("including " << inc.name);
            chain.incrementals.push_back(inc);
        }
    }

    sort(chain.incrementals.begin(), chain.incrementals.end());

    return chain;
}


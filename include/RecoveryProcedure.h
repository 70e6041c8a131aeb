#ifndef RECOVERYPROCEDURE_H
#define RECOVERYPROCEDURE_H

#include <string>
#include <vector>
#include "Snapshot.h"
#include "globalsdef.h"

using namespace std;


/* Writes the stand-alone recovery.sh that lives in the root of every snapshot.
   The scripts need bash and rsync; nothing of ours has to be installed. */
class RecoveryProcedure {
    const RunConfig &config;
    vector<string> excludes;

    string header(const Snapshot &snapshot, string title);
    string excludeArgs();
    string footer();

    public:
        RecoveryProcedure(const RunConfig &runConfig, const vector<string> &restoreExcludes);

        string renderFull(const Snapshot &full);
        string renderIncremental(const Snapshot &inc, const Snapshot &base);

        /* writeFor(snapshot, base)
         * Render and install recovery.sh in the snapshot (0755, via a temp file).
         * base is required for an incremental and ignored for a full.
         * Throws FBException on any write failure. */
        void writeFor(const Snapshot &snapshot, const Snapshot *base = NULL);
};

#endif


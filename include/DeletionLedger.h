#ifndef DELETIONLEDGER_H
#define DELETIONLEDGER_H

#include <string>
#include <vector>
#include "CopyEngine.h"
#include "globalsdef.h"

using namespace std;


/*
 * The ledger (skip-files.txt) is what lets an incremental record deletions.  It
 * lists, one per line with a leading slash, every path that was in the base full
 * but no longer in the source when the incremental was taken.  Replaying an
 * incremental means copying its contents and then removing every ledger path
 * from the target.
 */
class DeletionLedger {
    const RunConfig &config;

    public:
        DeletionLedger(const RunConfig &runConfig);

        // dry run of source -> reference with delete; throws FBException(eCopyEngine)
        vector<string> computeDeletions(CopyEngine &engine, string source, string reference, const vector<string> &excludes);

        // write entries to ledgerPath via a temp file; throws FBException on failure
        void write(string ledgerPath, const vector<string> &entries);

        // a missing ledger reads as empty
        vector<string> read(string ledgerPath);

        // remove every recorded path that exists under target; returns the number removed
        unsigned int applyDeletions(string ledgerPath, string target);

        // leading slash added, trailing slash dropped; "" for blank or unsafe entries
        static string normalize(string entry);
};

#endif


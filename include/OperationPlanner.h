#ifndef OPERATIONPLANNER_H
#define OPERATIONPLANNER_H

#include <string>
#include <vector>
#include "globalsdef.h"
#include "util_generic.h"
#include "Snapshot.h"
#include "SnapshotCatalog.h"
#include "CopyEngine.h"

using namespace std;


typedef int (*spaceProbeFn)(string path, FsSpace &space);


/* Everything the operator is shown before confirming, and everything execute()
   needs afterwards.  Building a plan never touches the filesystem beyond reads. */
struct OperationPlan {
    opMode mode;
    string source;
    string storageRoot;
    string targetPath;          // snapshot being created/refreshed, or the recovery destination
    Snapshot base;
    bool haveBase;
    vector<Snapshot> incrementals;
    SnapshotTime target;        // recover only
    string renameTo;            // sync only; blank if no rename
    uint64_t requiredBytes;
    uint64_t availableBytes;
    bool spaceChecked;
    vector<string> warnings;

    OperationPlan() { mode = opNone; haveBase = spaceChecked = false; requiredBytes = availableBytes = 0; }

    string render(const RunConfig &config) const;
};


class OperationPlanner {
    const RunConfig &config;
    CopyEngine &engine;
    spaceProbeFn spaceProbe;
    SnapshotCatalog catalog;

    OperationPlan planFull();
    OperationPlan planSync();
    OperationPlan planIncremental();
    OperationPlan planRecover();

    void executeFull(const OperationPlan &plan);
    void executeSync(const OperationPlan &plan);
    void executeIncremental(const OperationPlan &plan);
    void executeRecover(const OperationPlan &plan);

    void runEngine(const CopyRequest &request, string step);
    Snapshot requireFull();

    public:
        OperationPlanner(const RunConfig &runConfig, CopyEngine &copyEngine, spaceProbeFn probe = fsSpace);

        // configuration checks; throws FBException(eConfig)
        void preflight();

        // read-only planning; throws FBException
        OperationPlan plan();

        // the mutating steps; throws FBException on the first failure
        void execute(const OperationPlan &plan);

        // what every backup copy skips
        vector<string> excludes();

        // what restores skip: snapshot metadata plus excludes()
        vector<string> restoreExcludes();
};

#endif


#include <sstream>
#include <stdio.h>

#include "OperationPlanner.h"
#include "BackupChain.h"
#include "DeletionLedger.h"
#include "RecoveryProcedure.h"
#include "exception.h"
#include "debug.h"


// virtual and volatile filesystems; never worth backing up or restoring over
static const char *systemExcludes[] = { "/dev/*", "/proc/*", "/sys/*", "/tmp/*", "/run/*", "/mnt/*", "/media/*", "/lost+found" };


string opModeName(opMode mode) {
    switch (mode) {
        case opFull:    return "full backup";
        case opSync:    return "sync of the latest full backup";
        case opInc:     return "incremental backup";
        case opRecover: return "recovery";
        case opNone:    break;
    }

    return "none";
}


string OperationPlan::render(const RunConfig &config) const {
    stringstream out;

    out << BOLDBLUE(config) << "OPERATION PLAN" << RESET(config) << "\n";
    out << "  Operation:     " << opModeName(mode) << "\n";

    if (mode == opRecover) {
        out << "  Target date:   " << target.dateString() << "\n";
        out << "  Storage:       " << storageRoot << "\n";
        out << "  Restore into:  " << targetPath << "\n";
    }
    else {
        out << "  Source:        " << source << "\n";
        out << "  Storage:       " << storageRoot << "\n";
        out << "  Target:        " << targetPath << "\n";
    }

    if (haveBase)
        out << "  Base full:     " << base.path << "\n";

    if (mode == opRecover) {
        out << "  Incrementals:  " << (incrementals.size() ? "" : "(none)") << "\n";

        int step = 0;
        for (auto &inc: incrementals)
            out << "    " << ++step << ". " << inc.path << "\n";
    }

    if (mode == opSync)
        out << "  Rename to:     " << (renameTo.length() ? renameTo : "(no rename)") << "\n";

    if (spaceChecked)
        out << "  Space:         " << approximate(requiredBytes) << " required, " << approximate(availableBytes) << " available\n";

    for (auto &warning: warnings)
        out << BOLDYELLOW(config) << "  WARNING: " << warning << RESET(config) << "\n";

    return out.str();
}


OperationPlanner::OperationPlanner(const RunConfig &runConfig, CopyEngine &copyEngine, spaceProbeFn probe) :
    config(runConfig), engine(copyEngine), spaceProbe(probe), catalog(runConfig.dest, runConfig) {
}


vector<string> OperationPlanner::excludes() {
    vector<string> result;

    for (auto &exclude: systemExcludes)
        result.push_back(exclude);

    // the storage root must never be copied into itself
    result.push_back(slashConcat(config.dest, "*"));

    // and when it's nested under a non-root source the anchored form is relative to that source
    string source = config.source;
    while (source.length() > 1 && source.back() == '/')
        source.pop_back();

    if (source != "/" && config.dest.find(source + "/") == 0)
        result.push_back(slashConcat(config.dest.substr(source.length()), "*"));

    for (auto &exclude: config.extraExcludes)
        result.push_back(exclude);

    return result;
}


vector<string> OperationPlanner::restoreExcludes() {
    vector<string> result = { string("/") + RECOVERY_FILENAME, string("/") + LEDGER_FILENAME };

    for (auto &exclude: excludes())
        result.push_back(exclude);

    return result;
}


/*******************************************************************************
 * preflight()
 *
 * Everything that can be checked without reading the catalog.  Failures here are
 * configuration errors and nothing has been touched yet.
 *******************************************************************************/
void OperationPlanner::preflight() {
    string detail;

    if (config.mode == opNone)
        throw FBException("no operation given; use one of --full, --sync, --inc or --recover", eConfig);

    if (!engine.available(detail))
        throw FBException(detail, eConfig);

    DEBUG(config, D_config) DFMT("copy engine " << engine.name() << " at " << detail);

    struct stat statData;
    if (mystat(config.source, &statData) || !S_ISDIR(statData.st_mode))
        throw FBException((config.mode == opRecover ? "recovery destination " : "source ") + config.source + " doesn't exist or isn't a directory", eConfig);

    if (mystat(config.dest, &statData) || !S_ISDIR(statData.st_mode))
        throw FBException("storage directory " + config.dest + " doesn't exist or isn't a directory", eConfig);

    if (config.mode == opRecover) {
        SnapshotTime target;

        if (!config.recoverDate.length())
            throw FBException("--recover requires a date in YYYY-MM-DD format", eConfig);

        if (!SnapshotTime::parseDate(config.recoverDate, target))
            throw FBException("invalid recovery date '" + config.recoverDate + "' (expected YYYY-MM-DD)", eConfig);

        if (!config.test && !isWritableDir(config.source))
            throw FBException("recovery destination " + config.source + " isn't writable", eConfig);
    }
    else
        if (!config.test && !isWritableDir(config.dest))
            throw FBException("storage directory " + config.dest + " isn't writable", eConfig);

    string error = catalog.scan();
    if (error.length())
        throw FBException(error, eConfig);
}


OperationPlan OperationPlanner::plan() {
    OperationPlan result;

    switch (config.mode) {
        case opFull:    result = planFull(); break;
        case opSync:    result = planSync(); break;
        case opInc:     result = planIncremental(); break;
        case opRecover: result = planRecover(); break;
        case opNone:    throw FBException("no operation given", eConfig);
    }

    DEBUG(config, D_plan) DFMT(opModeName(result.mode) << " -> " << result.targetPath);
    return result;
}


Snapshot OperationPlanner::requireFull() {
    Snapshot full;

    if (!catalog.latestFull(full))
        throw FBException("no full backup found in " + config.dest + "; run --" + CLI_FULL + " first", eResolution);

    return full;
}


OperationPlan OperationPlanner::planFull() {
    OperationPlan result;

    result.mode = opFull;
    result.source = config.source;
    result.storageRoot = config.dest;
    result.targetPath = slashConcat(config.dest, Snapshot::fullName(SnapshotTime::fromEpoch(config.startupTime)));

    if (exists(result.targetPath))
        throw FBException(result.targetPath + " already exists; use --" + CLI_SYNC + " to refresh it", eConfig);

    FsSpace sourceSpace;
    FsSpace destSpace;

    if (spaceProbe(config.source, sourceSpace))
        throw FBException("unable to determine the space used on " + config.source + errtext(), eSpace);

    if (spaceProbe(config.dest, destSpace))
        throw FBException("unable to determine the space available on " + config.dest + errtext(), eSpace);

    result.requiredBytes = sourceSpace.usedBytes;
    result.availableBytes = destSpace.availableBytes;
    result.spaceChecked = true;

    DEBUG(config, D_plan) DFMT("required " << result.requiredBytes << ", available " << result.availableBytes);

    if (result.requiredBytes > result.availableBytes)
        throw FBException("insufficient space in " + config.dest + ": " + approximate(result.requiredBytes) +
            " required, " + approximate(result.availableBytes) + " available", eSpace);

    return result;
}


OperationPlan OperationPlanner::planSync() {
    OperationPlan result;

    result.mode = opSync;
    result.source = config.source;
    result.storageRoot = config.dest;
    result.base = requireFull();
    result.haveBase = true;
    result.targetPath = result.base.path;

    string todayName = Snapshot::fullName(SnapshotTime::fromEpoch(config.startupTime));

    if (result.base.name != todayName) {
        string todayPath = slashConcat(config.dest, todayName);

        // never rename over another snapshot
        if (exists(todayPath))
            result.warnings.push_back(todayPath + " already exists; " + result.base.name + " will keep its name");
        else
            result.renameTo = todayPath;
    }

    result.warnings.push_back("files in " + result.base.path + " that no longer exist in " + config.source + " will be deleted");
    return result;
}


OperationPlan OperationPlanner::planIncremental() {
    OperationPlan result;
    auto now = SnapshotTime::fromEpoch(config.startupTime);

    result.mode = opInc;
    result.source = config.source;
    result.storageRoot = config.dest;
    result.base = requireFull();
    result.haveBase = true;
    result.targetPath = slashConcat(config.dest, Snapshot::incrementalName(now));

    if (result.base.instant() > now.instant())
        throw FBException("latest full backup " + result.base.name + " is dated after the current time", eResolution);

    if (exists(result.targetPath))
        throw FBException(result.targetPath + " already exists", eConfig);

    return result;
}


OperationPlan OperationPlanner::planRecover() {
    OperationPlan result;
    SnapshotTime target;

    if (!SnapshotTime::parseDate(config.recoverDate, target))
        throw FBException("invalid recovery date '" + config.recoverDate + "' (expected YYYY-MM-DD)", eConfig);

    ChainResolver resolver(catalog, config);
    auto chain = resolver.resolve(target);

    result.mode = opRecover;
    result.source = config.dest;
    result.storageRoot = config.dest;
    result.targetPath = config.source;
    result.target = target;
    result.base = chain.baseFull;
    result.haveBase = true;
    result.incrementals = chain.incrementals;
    result.warnings.push_back("the contents of " + config.source + " will be overwritten and anything not in the backup deleted");

    return result;
}


void OperationPlanner::runEngine(const CopyRequest &request, string step) {
    DEBUG(config, D_exec) DFMT(step << ": " << request.source << " -> " << request.dest);

    auto outcome = engine.run(request);
    if (!outcome.success)
        throw FBException(step + " failed (" + engine.name() + " exit " + to_string(outcome.exitCode) + ")" +
            (outcome.detail.length() ? ": " + outcome.detail : ""), outcome.detail, eCopyEngine);

    log(step + " complete: " + request.source + " -> " + request.dest);
}


void OperationPlanner::execute(const OperationPlan &plan) {
    switch (plan.mode) {
        case opFull:    executeFull(plan); break;
        case opSync:    executeSync(plan); break;
        case opInc:     executeIncremental(plan); break;
        case opRecover: executeRecover(plan); break;
        case opNone:    throw FBException("no operation given", eConfig);
    }
}


void OperationPlanner::executeFull(const OperationPlan &plan) {
    Snapshot full;

    if (mkdirp(plan.targetPath))
        throw FBException("unable to create " + plan.targetPath + errtext(), eGeneral);

    log("created " + plan.targetPath);
    runEngine(CopyRequest(plan.source, plan.targetPath, excludes(), cmCopy), "full copy");

    if (!Snapshot::parse(plan.storageRoot, pathSplit(plan.targetPath).file, full))
        throw FBException("unable to parse snapshot name " + plan.targetPath, eGeneral);

    RecoveryProcedure(config, restoreExcludes()).writeFor(full);
}


/*******************************************************************************
 * executeSync(plan)
 *
 * Two passes over the latest full: first only the deletions (paths gone from the
 * source), then a full mirror.  The rename happens last so a failed copy leaves
 * the full under its old name.
 *******************************************************************************/
void OperationPlanner::executeSync(const OperationPlan &plan) {
    Snapshot synced = plan.base;

    runEngine(CopyRequest(plan.source, plan.base.path, excludes(), cmDeleteOnly), "sync delete pass");
    runEngine(CopyRequest(plan.source, plan.base.path, excludes(), cmMirror), "sync copy");

    if (plan.renameTo.length()) {
        if (rename(plan.base.path.c_str(), plan.renameTo.c_str()))
            throw FBException("unable to rename " + plan.base.path + " to " + plan.renameTo + errtext(), eGeneral);

        log("renamed " + plan.base.path + " to " + plan.renameTo);

        if (!Snapshot::parse(plan.storageRoot, pathSplit(plan.renameTo).file, synced))
            throw FBException("unable to parse snapshot name " + plan.renameTo, eGeneral);
    }

    RecoveryProcedure(config, restoreExcludes()).writeFor(synced);
}


void OperationPlanner::executeIncremental(const OperationPlan &plan) {
    Snapshot inc;
    DeletionLedger ledger(config);

    if (mkdirp(plan.targetPath))
        throw FBException("unable to create " + plan.targetPath + errtext(), eGeneral);

    log("created " + plan.targetPath);
    runEngine(CopyRequest(plan.source, plan.targetPath, excludes(), cmLinkReference, plan.base.path), "incremental copy");

    if (!Snapshot::parse(plan.storageRoot, pathSplit(plan.targetPath).file, inc))
        throw FBException("unable to parse snapshot name " + plan.targetPath, eGeneral);

    // the base's recovery.sh is never in the source and mustn't land in the ledger
    auto deletions = ledger.computeDeletions(engine, plan.source, plan.base.path, restoreExcludes());
    ledger.write(inc.ledgerFile(), deletions);

    RecoveryProcedure(config, restoreExcludes()).writeFor(inc, &plan.base);
}


void OperationPlanner::executeRecover(const OperationPlan &plan) {
    DeletionLedger ledger(config);
    auto skip = restoreExcludes();

    runEngine(CopyRequest(plan.base.path, plan.targetPath, skip, cmMirror), "restore of " + plan.base.name);

    for (auto &inc: plan.incrementals) {
        runEngine(CopyRequest(inc.path, plan.targetPath, skip, cmCopy), "replay of " + inc.name);

        auto removed = ledger.applyDeletions(inc.ledgerFile(), plan.targetPath);
        DEBUG(config, D_ledger) DFMT(inc.name << ": " << plural(removed, "deletion") << " applied");
    }

    log("recovered " + plan.targetPath + " to " + plan.target.dateString() + " from " + plan.base.name + " plus " +
        plural(plan.incrementals.size(), "incremental"));
}


#include <fstream>
#include <stdio.h>
#include <unistd.h>

#include "DeletionLedger.h"
#include "exception.h"
#include "util_generic.h"
#include "debug.h"


DeletionLedger::DeletionLedger(const RunConfig &runConfig) : config(runConfig) {
}


/*******************************************************************************
 * normalize(entry)
 *
 * Entries are taken byte for byte.  Leading and trailing blanks are part of the
 * file name, so nothing is trimmed.
 *******************************************************************************/
string DeletionLedger::normalize(string entry) {
    while (entry.length() > 1 && entry.back() == '/')
        entry.pop_back();

    if (!entry.length() || entry == "/")
        return "";

    if (entry[0] != '/')
        entry = "/" + entry;

    // a ".." component could walk out of the restore target
    for (auto &component: perlSplit("/", entry))
        if (component == "..")
            return "";

    return entry;
}


vector<string> DeletionLedger::computeDeletions(CopyEngine &engine, string source, string reference, const vector<string> &excludes) {
    vector<string> result;

    auto outcome = engine.run(CopyRequest(source, reference, excludes, cmReportDeletions));
    if (!outcome.success)
        throw FBException("unable to compute deleted files between " + source + " and " + reference +
            " (" + engine.name() + " exit " + to_string(outcome.exitCode) + ")", outcome.detail, eCopyEngine);

    for (auto &path: outcome.reported) {
        auto entry = normalize(path);

        if (entry.length()) {
            DEBUG(config, D_ledger) DFMT("deleted since base: " << entry);
            result.push_back(entry);
        }
        else
            log("warning: ignoring unusable deletion entry '" + path + "'");
    }

    return result;
}


void DeletionLedger::write(string ledgerPath, const vector<string> &entries) {
    string tempPath = ledgerPath + ".tmp";
    ofstream ledgerFile;

    ledgerFile.open(tempPath, ios::out | ios::trunc);
    if (!ledgerFile.is_open())
        throw FBException("unable to create " + tempPath + errtext(), eGeneral);

    for (auto &entry: entries)
        ledgerFile << entry << "\n";

    ledgerFile.close();
    if (ledgerFile.fail()) {
        unlink(tempPath.c_str());
        throw FBException("unable to write " + tempPath, eGeneral);
    }

    if (rename(tempPath.c_str(), ledgerPath.c_str())) {
        string error = errtext();
        unlink(tempPath.c_str());
        throw FBException("unable to rename " + tempPath + " to " + ledgerPath + error, eGeneral);
    }

    log("wrote " + plural(entries.size(), "path") + " to " + ledgerPath);
}


vector<string> DeletionLedger::read(string ledgerPath) {
    vector<string> result;
    ifstream ledgerFile;
    string line;

    ledgerFile.open(ledgerPath);
    if (!ledgerFile.is_open()) {
        DEBUG(config, D_ledger) DFMT("no ledger at " << ledgerPath);
        return result;
    }

    while (getline(ledgerFile, line)) {
        if (!line.length())
            continue;

        auto entry = normalize(line);

        if (entry.length())
            result.push_back(entry);
        else
            log("warning: refusing ledger entry '" + line + "' in " + ledgerPath);
    }

    return result;
}


/*******************************************************************************
 * applyDeletions(ledgerPath, target)
 *
 * Remove each ledger path from under target.  lstat() is used for the existence
 * check so a dangling symlink is removed rather than skipped.  Anything already
 * gone is skipped, which makes a second run a no-op.
 *******************************************************************************/
unsigned int DeletionLedger::applyDeletions(string ledgerPath, string target) {
    unsigned int removed = 0;
    struct stat statData;

    for (auto &entry: read(ledgerPath)) {
        string fullPath = target.length() && target.back() == '/' ? target + entry.substr(1) : target + entry;

        if (mylstat(fullPath, &statData)) {
            DEBUG(config, D_ledger) DFMT("already absent: " << fullPath);
            continue;
        }

        if (!rmrf(fullPath))
            throw FBException("unable to remove " + fullPath + " listed in " + ledgerPath, eGeneral);

        DEBUG(config, D_ledger) DFMT("removed " << fullPath);
        ++removed;
    }

    if (removed)
        log("removed " + plural(removed, "path") + " listed in " + ledgerPath + " from " + target);

    return removed;
}


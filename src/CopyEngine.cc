#include <string>
#include <vector>
#include <unistd.h>

#include "CopyEngine.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "debug.h"

#define DELETING_PREFIX "deleting "


string copyModeName(CopyMode mode) {
    switch (mode) {
        case cmCopy:            return "copy";
        case cmMirror:          return "copy-with-delete";
        case cmDeleteOnly:      return "delete-only";
        case cmReportDeletions: return "report-deletions";
        case cmLinkReference:   return "link-against-reference";
    }

    return "unknown";
}


RsyncEngine::RsyncEngine(const RunConfig &runConfig) : config(runConfig) {
}


string RsyncEngine::binary() {
    if (config.rsync.find("/") != string::npos)
        return config.rsync;

    return locateBinary(config.rsync);
}


bool RsyncEngine::available(string &detail) {
    string bin = binary();

    if (!bin.length() || access(bin.c_str(), X_OK)) {
        detail = "unable to locate an executable " + config.rsync + " (set --" + CLI_RSYNC + " or the rsync setting)";
        return false;
    }

    detail = bin;
    return true;
}


/*******************************************************************************
 * buildArgs(request)
 *
 * -a -A -X -H plus --numeric-ids covers ownership, permissions, ACLs, xattrs
 * and hard links.  The source always gets a trailing slash so its contents
 * (not the directory itself) land in dest.
 *******************************************************************************/
vector<string> RsyncEngine::buildArgs(const CopyRequest &request) {
    vector<string> args;

    if (config.nice > 0) {
        args.push_back("nice");
        args.push_back("-n");
        args.push_back(to_string(config.nice));
    }

    string bin = binary();
    args.push_back(bin.length() ? bin : config.rsync);
    args.push_back("-aAXH");
    args.push_back("--numeric-ids");

    switch (request.mode) {
        case cmCopy:
            break;

        case cmMirror:
            args.push_back("--delete");
            break;

        case cmDeleteOnly:
            // --existing and --ignore-existing together skip every transfer
            args.push_back("--delete");
            args.push_back("--existing");
            args.push_back("--ignore-existing");
            break;

        case cmReportDeletions:
            args.push_back("--dry-run");
            args.push_back("--delete");
            args.push_back("--info=del1");
            args.push_back("--info=name0");
            break;

        case cmLinkReference:
            args.push_back("--link-dest=" + request.reference);
            break;
    }

    for (auto &exclude: request.excludes)
        args.push_back("--exclude=" + exclude);

    string src = request.source;
    if (!src.length() || src.back() != '/')
        src += "/";

    args.push_back(src);
    args.push_back(request.dest);
    return args;
}


CopyOutcome RsyncEngine::run(const CopyRequest &request) {
    CopyOutcome outcome;
    bool report = request.mode == cmReportDeletions;

    PipeExec rsync(buildArgs(request));
    log("running " + rsync.commandLine());
    DEBUG(config, D_exec) DFMT(copyModeName(request.mode) << ": " << rsync.commandLine());

    if (rsync.execute(report)) {
        outcome.detail = "unable to start " + rsync.commandLine() + errtext();
        return outcome;
    }

    if (report) {
        string line;
        string prefix = DELETING_PREFIX;

        while (rsync.readLine(line))
            if (line.find(prefix) == 0)
                outcome.reported.push_back(line.substr(prefix.length()));
            else
                DEBUG(config, D_exec) DFMT("ignoring engine output: " << line);
    }

    outcome.exitCode = rsync.wait();
    outcome.success = outcome.exitCode == 0;

    if (!outcome.success) {
        outcome.detail = trimSpace(rsync.errorOutput());

        if (outcome.exitCode == 127 && !outcome.detail.length())
            outcome.detail = "unable to execute " + config.rsync;
    }

    DEBUG(config, D_exec) DFMT("exit " << outcome.exitCode << (report ? ", " + plural(outcome.reported.size(), "path") + " reported" : ""));
    return outcome;
}


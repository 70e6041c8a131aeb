#include <fstream>
#include <sstream>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>

#include "RecoveryProcedure.h"
#include "exception.h"
#include "util_generic.h"
#include "debug.h"


RecoveryProcedure::RecoveryProcedure(const RunConfig &runConfig, const vector<string> &restoreExcludes) : config(runConfig), excludes(restoreExcludes) {
}


string RecoveryProcedure::header(const Snapshot &snapshot, string title) {
    stringstream script;
    char timeStr[64];
    struct tm now;

    localtime_r(&config.startupTime, &now);
    strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &now);

    script << "#!/bin/bash\n"
           << "#\n"
           << "# " << title << "\n"
           << "# Generated by fsbackup v" << VERSION << " on " << timeStr << " for " << snapshot.name << ".\n"
           << "#\n"
           << "# Run from a live/rescue environment with root privileges, never on the\n"
           << "# running system being restored.  The restore target defaults to "
           << config.recoveryTarget << "\n"
           << "# and can be given as the first argument.\n"
           << "\n"
           << "set -e\n"
           << "\n"
           << "RECOVERY_TARGET=" << shellQuote(config.recoveryTarget) << "\n"
           << "if [ -n \"$1\" ]; then\n"
           << "    RECOVERY_TARGET=\"$1\"\n"
           << "fi\n"
           << "\n"
           << "SNAPSHOT_DIR=\"$(cd \"$(dirname \"$0\")\" && pwd)\"\n"
           << "\n"
           << "if ! command -v rsync >/dev/null 2>&1; then\n"
           << "    echo \"error: rsync is required and was not found in PATH\" >&2\n"
           << "    exit 1\n"
           << "fi\n"
           << "\n"
           << "echo \"!!! WARNING: " << title << " !!!\"\n"
           << "echo \"Source:      $SNAPSHOT_DIR\"\n"
           << "echo \"Destination: $RECOVERY_TARGET (files not in the backup will be DELETED)\"\n"
           << "read -r -p \"Proceed? [y/N] \" answer\n"
           << "case \"$answer\" in\n"
           << "    y|Y|yes|YES|Yes|j|J|ja|JA|Ja) ;;\n"
           << "    *) echo \"Recovery canceled.\"; exit 1 ;;\n"
           << "esac\n"
           << "\n";

    return script.str();
}


// excludes arrive with the snapshot's own recovery.sh and ledger already at the front
string RecoveryProcedure::excludeArgs() {
    string result;

    for (auto &exclude: excludes)
        result += (result.length() ? " \\\n      " : "") + string("--exclude=") + shellQuote(exclude);

    return result;
}


string RecoveryProcedure::footer() {
    return string("echo \"Recovery complete.\"\n") +
        "echo \"If the virtual filesystem mount points are missing, recreate them:\"\n" +
        "echo \"    mkdir -p /dev /proc /sys /tmp /run /mnt /media && chmod 1777 /tmp\"\n" +
        "echo \"Then reinstall the bootloader (e.g. grub-install and update-grub from a chroot).\"\n";
}


string RecoveryProcedure::renderFull(const Snapshot &full) {
    stringstream script;

    script << header(full, "SYSTEM RECOVERY FROM A FULL BACKUP")
           << "rsync -aAXHv --numeric-ids --delete " << excludeArgs() << " \\\n"
           << "      \"$SNAPSHOT_DIR/\" \"$RECOVERY_TARGET\"\n"
           << "\n"
           << footer();

    return script.str();
}


/* The base full's location is fixed at the time the incremental was taken.  The
   incremental's own directory is found relative to the script. */
string RecoveryProcedure::renderIncremental(const Snapshot &inc, const Snapshot &base) {
    stringstream script;

    script << header(inc, "SYSTEM RECOVERY FROM AN INCREMENTAL BACKUP")
           << "FULL_BACKUP_DIR=" << shellQuote(base.path) << "\n"
           << "\n"
           << "if [ ! -d \"$FULL_BACKUP_DIR\" ]; then\n"
           << "    echo \"error: base full backup $FULL_BACKUP_DIR is missing\" >&2\n"
           << "    exit 1\n"
           << "fi\n"
           << "\n"
           << "echo \"-> Step 1/3: restoring the base full backup $FULL_BACKUP_DIR\"\n"
           << "rsync -aAXHv --numeric-ids --delete " << excludeArgs() << " \\\n"
           << "      \"$FULL_BACKUP_DIR/\" \"$RECOVERY_TARGET\"\n"
           << "\n"
           << "echo \"-> Step 2/3: applying changes from $SNAPSHOT_DIR\"\n"
           << "rsync -aAXHv --numeric-ids " << excludeArgs() << " \\\n"
           << "      \"$SNAPSHOT_DIR/\" \"$RECOVERY_TARGET\"\n"
           << "\n"
           << "LEDGER=\"$SNAPSHOT_DIR/" << LEDGER_FILENAME << "\"\n"
           << "if [ -f \"$LEDGER\" ]; then\n"
           << "    echo \"-> Step 3/3: removing files deleted before this backup was taken\"\n"
           << "    while IFS= read -r entry; do\n"
           << "        [ -z \"$entry\" ] && continue\n"
           << "        case \"/$entry/\" in\n"
           << "            */../*) echo \"skipping unsafe entry: $entry\" >&2; continue ;;\n"
           << "        esac\n"
           << "        doomed=\"${RECOVERY_TARGET%/}$entry\"\n"
           << "        if [ -e \"$doomed\" ] || [ -L \"$doomed\" ]; then\n"
           << "            echo \"Deleting: $doomed\"\n"
           << "            rm -rf -- \"$doomed\"\n"
           << "        fi\n"
           << "    done < \"$LEDGER\"\n"
           << "else\n"
           << "    echo \"-> Step 3/3: no deletions recorded\"\n"
           << "fi\n"
           << "\n"
           << footer();

    return script.str();
}


void RecoveryProcedure::writeFor(const Snapshot &snapshot, const Snapshot *base) {
    string content;

    if (snapshot.isFull())
        content = renderFull(snapshot);
    else {
        if (base == NULL)
            throw FBException("no base full given for the recovery procedure of " + snapshot.path, eGeneral);

        content = renderIncremental(snapshot, *base);
    }

    string finalPath = snapshot.recoveryFile();
    string tempPath = finalPath + ".tmp";
    ofstream scriptFile;

    scriptFile.open(tempPath, ios::out | ios::trunc);
    if (!scriptFile.is_open())
        throw FBException("unable to create " + tempPath + errtext(), eGeneral);

    scriptFile << content;
    scriptFile.close();

    if (scriptFile.fail()) {
        unlink(tempPath.c_str());
        throw FBException("unable to write " + tempPath, eGeneral);
    }

    if (chmod(tempPath.c_str(), 0755) || rename(tempPath.c_str(), finalPath.c_str())) {
        string error = errtext();
        unlink(tempPath.c_str());
        throw FBException("unable to install " + finalPath + error, eGeneral);
    }

    DEBUG(config, D_recovery) DFMT("wrote " << content.length() << " bytes to " << finalPath);
    log("wrote recovery procedure " + finalPath + (base != NULL && !snapshot.isFull() ? " (base " + base->path + ")" : ""));
}


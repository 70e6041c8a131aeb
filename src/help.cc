#include <iostream>
#include <string>
#include <stdio.h>
#include "help.h"
#include "BackupConfig.h"
#include "util_generic.h"


using namespace std;

void showHelp(enum helpType kind, const RunConfig &config) {
    switch (kind) {
        case hDefaults: {
            BackupConfig defaults;
            cout << "# fsbackup configuration defaults" << endl;
            defaults.fullDump();

            cout << "\n# config file: " << CONF_FILE << " (override with --" << CLI_CONFIG << " or $FSB_CONFIG)" << endl;
            break;
        }

        case hOptions: {
            string helpText = "fsbackup [options]\n\n"
            + string(BOLDBLUE(config)) + "OPERATIONS (exactly one)" + RESET(config) + "\n"
            + "   -f, --full          Create a full backup named <date>-backup-full in the storage directory.\n"
            + "   -s, --sync          Bring the latest full backup up to date with the source (deletes files\n"
            + "                       no longer in the source) and rename it to today's date.\n"
            + "   -i, --inc           Create an incremental backup against the latest full backup. Deleted\n"
            + "                       files are recorded in the incremental's " + LEDGER_FILENAME + ".\n"
            + "   -r, --recover [d]   Restore the source directory to its state as of date d (YYYY-MM-DD) from the\n"
            + "                       latest full on or before d plus every later incremental through end of d.\n\n"
            + string(BOLDBLUE(config)) + "LOCATIONS" + RESET(config) + "\n"
            + "   --source [dir]      Directory to back up, or to restore into with --recover (default /).\n"
            + "   --dest [dir]        Storage directory holding the backups (default current directory).\n"
            + "   --storage [dir]     Same as --dest.\n"
            + "   --exclude [glob]    Additional rsync exclude pattern; can be repeated.\n"
            + "   --recovery_target [dir]  Restore target written into each recovery.sh (default /).\n\n"
            + string(BOLDBLUE(config)) + "GENERAL" + RESET(config) + "\n"
            + "   -y, --force         Don't ask for confirmation.\n"
            + "   -t, --test          Show the operation plan and exit without changing anything.\n"
            + "   --rsync [path]      rsync binary to use.\n"
            + "   --nice [x]          Run rsync at nice level x.\n"
            + "   --config [file]     Config file (default " + CONF_FILE + ").\n"
            + "   --defaults          Show the default settings.\n"
            + "   --nocolor           Disable color output.\n"
            + "   -V, --version       Show the version.\n"
            + "   -h, --help          Show this help.\n\n"
            + string(BOLDBLUE(config)) + "DEBUGGING" + RESET(config) + "\n"
            + "   -v                  Debug output (default selectors).\n"
            + "   --vv                Debug output (all selectors).\n"
            + "   -v+sel-sel          Add or remove selectors: catalog, chain, config, exec, ledger, plan,\n"
            + "                       recovery, all.  -v=0x.. sets a literal mask.\n\n"
            + "Every snapshot carries a " + RECOVERY_FILENAME + " that restores it without fsbackup installed.\n";

            cout << helpText;
            break;
        }
    }
}


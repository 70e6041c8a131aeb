#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.0.3"

#include <iostream>
#include <string>
#include <vector>
#include <time.h>
#include "colors.h"

/*
 Adding a commandline option vs adding a config setting.

 All settings have CLI options but not all CLI options have an equivalent setting.

 (A) To add a CLI option:
    (1) add a defined constant for its name #define CLI_xxxx in globalsdef.h
    (2) add the constant along with its type to options.add_options() in fsbackup.cc

 (B) To add a config setting:
    (1) add a defined constant for its regex #define RE_xxxx in globalsdef.h
    (2) add an enum constant to reference it in Setting.h (order matters, add at end of list)
    (3) add a map entry between the defined const and the enum in Setting.cc
    (4) add it to the settings vector with its default in BackupConfig::BackupConfig() in BackupConfig.cc
    (5) do everything under the CLI option list above because you need a matching CLI option to
      override the config setting

 Settings are copied into a RunConfig once at startup (see buildRunConfig() in fsbackup.cc) and the
 RunConfig is what every component reads.  Nothing reads the settings vector after that.
 */


#define CONF_FILE "/etc/fsbackup/fsbackup.conf"
#define TMP_OUTPUT_DIR "/tmp/fsbackup_output"

#define DFMT(x) cerr << __FUNCTION__ << ": " << x << endl
#define SCREENERR(c, x) cerr << RED(c) << x << RESET(c) << endl;

#define SECS_PER_DAY (60*60*24)

// snapshot naming; the regexes must agree with the strftime formats
#define FULL_SUFFIX "-backup-full"
#define INC_INFIX "-backup-inc-"
#define FULL_NAME_REGEX "^(\\d{4})-(\\d{2})-(\\d{2})-backup-full$"
#define INC_NAME_REGEX "^(\\d{4})-(\\d{2})-(\\d{2})-backup-inc-(\\d{2})(\\d{2})(\\d{2})$"
#define TARGET_DATE_REGEX "^(\\d{4})-(\\d{2})-(\\d{2})$"
#define LEDGER_FILENAME "skip-files.txt"
#define RECOVERY_FILENAME "recovery.sh"

/* CLI_ and RE_
 * The CLI_ constants are commandline switches while the RE_ are regex patterns
 * that match lines of the config file. */

// define commandline options
#define CLI_FULL "full"
#define CLI_SYNC "sync"
#define CLI_INC "inc"
#define CLI_RECOVER "recover"
#define CLI_SOURCE "source"
#define CLI_DEST "dest"
#define CLI_STORAGE "storage"
#define CLI_FORCE "force"
#define CLI_TEST "test"
#define CLI_HELP "help"
#define CLI_VERSION "version"
#define CLI_NOCOLOR "nocolor"
#define CLI_CONFIG "config"
#define CLI_EXCLUDE "exclude"
#define CLI_RSYNC "rsync"
#define CLI_RECOVERYTARGET "recovery_target"
#define CLI_NICE "nice"
#define CLI_COLOR "color"
#define CLI_DEFAULTS "defaults"


// conf file regexes
#define CAPTURE_VALUE string("((?:\\s|=|:)+)(.*?)\\s*?")
#define RE_COMMENT "((?:\\s*#).*)*$"
#define RE_BLANK "^((?:\\s*#).*)*$"
#define RE_SOURCE "(source|src)"
#define RE_DEST "(dest|destination|storage)"
#define RE_EXCLUDE "(exclude|excludes)"
#define RE_RSYNC "(rsync|copy_engine)"
#define RE_RECOVERYTARGET "(recovery_target)"
#define RE_NICE "(nice)"
#define RE_COLOR "(color|colour)"

using namespace std;

enum helpType { hDefaults, hOptions };

enum opMode { opNone, opFull, opSync, opInc, opRecover };


/* RunConfig is built once in main() from the config file plus the command line
 * and then passed by reference to everything that needs it. */
struct RunConfig {
    opMode mode;
    string source;          // absolute
    string dest;            // absolute storage root
    string recoverDate;     // YYYY-MM-DD, recover only
    vector<string> extraExcludes;
    string rsync;
    string recoveryTarget;  // baked into generated recovery.sh files
    int nice;
    bool force;
    bool test;
    bool color;
    unsigned int debugSelector;
    time_t startupTime;
    int pid;

    RunConfig() {
        mode = opNone;
        source = "/";
        dest = ".";
        rsync = "rsync";
        recoveryTarget = "/";
        nice = 0;
        force = test = false;
        color = true;
        debugSelector = 0;
        startupTime = time(NULL);
        pid = 0;
    }
};

string opModeName(opMode mode);

#endif


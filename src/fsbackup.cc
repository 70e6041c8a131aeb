/*
 * Copyright (C) 2025 fsbackup contributors
 * This file is part of fsbackup.
 *
 * fsbackup is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * fsbackup is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with fsbackup.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 *  fsbackup
 *
 *  fsbackup takes and restores whole-filesystem backups with rsync.  Backups form
 *  a chain under a single storage directory:
 *
 *  1. Full backups (YYYY-MM-DD-backup-full)
 *
 *     A complete copy of the source.  A full can be refreshed in place with --sync,
 *     which also renames it to the current date.
 *
 *  2. Incremental backups (YYYY-MM-DD-backup-inc-HHMMSS)
 *
 *     Taken against the latest full with rsync's --link-dest so unchanged files are
 *     hard links.  Files deleted since the full are listed in skip-files.txt.
 *
 *  3. Recovery
 *
 *     --recover DATE restores the latest full on or before DATE and replays every
 *     incremental through the end of DATE.  Each snapshot also carries its own
 *     recovery.sh for use when fsbackup itself isn't available.
 */

#include <iostream>
#include <signal.h>
#include <syslog.h>
#include <unistd.h>
#include <pcre++.h>

#include "cxxopts.hpp"
#include "globalsdef.h"
#include "BackupConfig.h"
#include "commandline.h"
#include "CopyEngine.h"
#include "OperationPlanner.h"
#include "exception.h"
#include "interactive.h"
#include "help.h"
#include "debug.h"
#include "util_generic.h"

using namespace pcrepp;


// the snapshot or restore destination being written; only read by the signal handler
static string interruptTarget;


/*******************************************************************************
 * sigTermHandler(sig)
 *
 * Log the interruption.  Whatever was being written is left in place for
 * inspection; there's no rollback.
 *******************************************************************************/
void sigTermHandler(int sig) {
    if (interruptTarget.length()) {
        log("operation aborted on interrupt, signal " + to_string(sig) + " (" + interruptTarget + " left as is)");
        cerr << "\ninterrupt: aborting; " << interruptTarget << " may be incomplete" << endl;
    }
    else
        log("operation aborted on interrupt (signal " + to_string(sig) + ")");

    exit(1);
}


int main(int argc, char *argv[]) {
    signal(SIGTERM, sigTermHandler);
    signal(SIGINT, sigTermHandler);

    openlog("fsbackup", LOG_PID | LOG_NDELAY, LOG_LOCAL1);
    cxxopts::Options options("fsbackup", "Full, incremental and point-in-time recovery backups with rsync");

    defineOptions(options);

    cxxopts::ParseResult cli;
    unsigned int debugSelector = 0;
    RunConfig display;      // color and defaults for anything printed before the real config exists

    try {
        options.allow_unrecognised_options();  // to support -v...
        cli = options.parse(argc, argv);
        display.color = !cli[CLI_NOCOLOR].as<bool>() && isatty(1);

        /* Enable selective debugging
         * (scheme taken from Exim MTA - Philip Hazel)
         */
        for (auto uarg : cli.unmatched()) {
            if (uarg == "--vv") {
                debugSelector = D_all;
                continue;
            }
            else if (uarg.length() > 2) {
                string op = uarg.substr(2, 1);

                if (uarg.substr(0, 2) == "-v" && (op == "=" || op == "-" || op == "+")) {
                    unsigned int selector = D_default;

                    if (decodeDebugSelector(selector, uarg.substr(2, string::npos))) {
                        debugSelector = selector;
                        continue;
                    }

                    SCREENERR(display, "error: unknown debug selector in " << uarg);
                    exit(1);
                }
            }
            else if (uarg == "-v") {
                debugSelector = D_default;
                continue;
            }

            /* ----------------------------------- */

            SCREENERR(display, "error: unrecognized parameter " << uarg
                      << "\nUse --help for a list of options.");
            exit(1);
        }
    }
    catch (cxxopts::OptionParseException &e) {
        cerr << "fsbackup: " << e.what() << endl;
        exit(1);
    }

    if (argc == 1) {
        showHelp(hOptions, display);
        exit(1);
    }

    if (cli[CLI_HELP].as<bool>()) {
        showHelp(hOptions, display);
        exit(0);
    }

    if (cli[CLI_VERSION].as<bool>()) {
        cout << "fsbackup v" << VERSION << endl;
        exit(0);
    }

    if (cli[CLI_DEFAULTS].as<bool>()) {
        showHelp(hDefaults, display);
        exit(0);
    }

    try {
        BackupConfig fileConfig;
        string configFile = CONF_FILE;
        bool explicitConfig = false;

        if (cppgetenv("FSB_CONFIG").length()) {
            configFile = cppgetenv("FSB_CONFIG");
            explicitConfig = true;
        }

        if (cli.count(CLI_CONFIG)) {
            configFile = cli[CLI_CONFIG].as<string>();
            explicitConfig = true;
        }

        // the default config file is optional; one that was asked for isn't
        if (!fileConfig.loadConfig(configFile) && explicitConfig)
            throw FBException("unable to read config file " + configFile + errtext(), eConfig);

        RunConfig config = buildRunConfig(cli, fileConfig, debugSelector);
        if (!isatty(1))
            config.color = false;

        RsyncEngine rsync(config);
        OperationPlanner planner(config, rsync);

        planner.preflight();
        auto plan = planner.plan();

        cout << "\n" << plan.render(config) << flush;

        if (config.test) {
            cout << "\n" << YELLOW(config) << "test mode: nothing was changed" << RESET(config) << endl;
            exit(0);
        }

        if (!confirmPlan(config, plan))
            throw FBException("Operation canceled by the user", eDeclined);

        interruptTarget = plan.targetPath;
        log("starting " + opModeName(plan.mode) + " (" + plan.targetPath + ")");

        planner.execute(plan);

        interruptTarget = "";
        log("completed " + opModeName(plan.mode) + " (" + plan.targetPath + ")");
        cout << "\n" << BOLDGREEN(config) << "Completed " << opModeName(plan.mode) << ": " << plan.targetPath << RESET(config) << endl;
    }
    catch (FBException &e) {
        if (e.getKind() == eDeclined) {
            cout << YELLOW(display) << log(e.detail()) << RESET(display) << endl;
            exit(1);
        }

        SCREENERR(display, log("error: " + e.detail()));

        if (e.getData().length() && e.getData() != e.detail())
            cerr << "    " << e.getData() << endl;

        exit(1);
    }

    return 0;
}


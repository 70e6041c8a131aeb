#define BOOST_TEST_MODULE "ConfigModule"

#include <sstream>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>

#include "BackupConfig.h"
#include "commandline.h"
#include "RecoveryProcedure.h"
#include "debug.h"
#include "interactive.h"
#include "TestSupport.h"

using namespace std;


static bool isConfigError(const FBException &e)
{
    return e.getKind() == eConfig;
}


static cxxopts::ParseResult parseArgs(cxxopts::Options &options, vector<string> args)
{
    vector<const char*> argv;

    for (auto &arg: args)
        argv.push_back(arg.c_str());

    return options.parse((int)argv.size(), argv.data());
}


BOOST_AUTO_TEST_CASE(Defaults_Without_A_File)
{
    BackupConfig config;

    BOOST_CHECK(!config.loadConfig("/nonexistent/fsbackup.conf"));
    BOOST_CHECK_EQUAL(config.settings[sSource].value, "/");
    BOOST_CHECK_EQUAL(config.settings[sDest].value, ".");
    BOOST_CHECK_EQUAL(config.settings[sRsync].value, "rsync");
    BOOST_CHECK_EQUAL(config.settings[sNice].ivalue(), 0);
    BOOST_CHECK(config.settings[sColor].bvalue());
}

BOOST_AUTO_TEST_CASE(Settings_Are_Read_From_File)
{
    TempDir work;
    string filename = work.path + "/fsbackup.conf";
    writeFile(filename,
        "# fsbackup settings\n"
        "\n"
        "source: /srv\n"
        "destination = /mnt/backups    # usb disk\n"
        "exclude: /srv/cache/*, /srv/tmp/*\n"
        "copy_engine: /usr/local/bin/rsync\n"
        "recovery_target: /mnt/newroot\n"
        "nice: 5\n"
        "color: no\n");

    BackupConfig config;
    BOOST_REQUIRE(config.loadConfig(filename));
    BOOST_CHECK_EQUAL(config.config_filename, filename);
    BOOST_CHECK_EQUAL(config.settings[sSource].value, "/srv");
    BOOST_CHECK_EQUAL(config.settings[sDest].value, "/mnt/backups");
    BOOST_CHECK_EQUAL(config.settings[sExclude].value, "/srv/cache/*, /srv/tmp/*");
    BOOST_CHECK_EQUAL(config.settings[sRsync].value, "/usr/local/bin/rsync");
    BOOST_CHECK_EQUAL(config.settings[sRecoveryTarget].value, "/mnt/newroot");
    BOOST_CHECK_EQUAL(config.settings[sNice].ivalue(), 5);
    BOOST_CHECK(!config.settings[sColor].bvalue());
    BOOST_CHECK(config.settings[sNice].seen);
}

BOOST_AUTO_TEST_CASE(Dump_Comments_Out_Defaults)
{
    TempDir work;
    string filename = work.path + "/fsbackup.conf";
    writeFile(filename, "nice: 7\n");

    BackupConfig config;
    BOOST_REQUIRE(config.loadConfig(filename));

    ostringstream dump;
    config.fullDump(dump);

    BOOST_CHECK(dump.str().find("#source:") != string::npos);
    BOOST_CHECK(dump.str().find("# default") != string::npos);
    BOOST_CHECK(dump.str().find("\nnice:") != string::npos);
    BOOST_CHECK(dump.str().find("#nice:") == string::npos);

    // the dump reads back as the same settings
    writeFile(filename, dump.str());
    BackupConfig reread;
    BOOST_REQUIRE(reread.loadConfig(filename));
    BOOST_CHECK_EQUAL(reread.settings[sNice].ivalue(), 7);
    BOOST_CHECK_EQUAL(reread.settings[sSource].value, "/");
}

BOOST_AUTO_TEST_CASE(Unknown_Setting_Is_An_Error)
{
    TempDir work;
    string filename = work.path + "/fsbackup.conf";
    writeFile(filename, "source: /\nretention: 7\n");

    BackupConfig config;
    BOOST_CHECK_EXCEPTION(config.loadConfig(filename), FBException, isConfigError);
}

BOOST_AUTO_TEST_CASE(Bad_Values_Are_Errors)
{
    TempDir work;
    string filename = work.path + "/fsbackup.conf";

    writeFile(filename, "nice: lots\n");
    BackupConfig numeric;
    BOOST_CHECK_EXCEPTION(numeric.loadConfig(filename), FBException, isConfigError);

    writeFile(filename, "color: sometimes\n");
    BackupConfig boolean;
    BOOST_CHECK_EXCEPTION(boolean.loadConfig(filename), FBException, isConfigError);
}

BOOST_AUTO_TEST_CASE(Debug_Selectors_Decode)
{
    unsigned int selector = D_default;

    BOOST_CHECK(!(selector & D_exec));
    BOOST_CHECK(decodeDebugSelector(selector, "+exec-chain"));
    BOOST_CHECK(selector & D_exec);
    BOOST_CHECK(!(selector & D_chain));
    BOOST_CHECK(selector & D_catalog);

    BOOST_CHECK(decodeDebugSelector(selector, "-all+ledger"));
    BOOST_CHECK_EQUAL(selector, (unsigned int)D_ledger);

    BOOST_CHECK(decodeDebugSelector(selector, "=0x3"));
    BOOST_CHECK_EQUAL(selector, 3u);

    unsigned int untouched = D_default;
    BOOST_CHECK(!decodeDebugSelector(untouched, "+nonsense"));
    BOOST_CHECK_EQUAL(untouched, (unsigned int)D_default);
    BOOST_CHECK(!decodeDebugSelector(untouched, "=12z"));
}

BOOST_AUTO_TEST_CASE(Confirmation_Answers)
{
    BOOST_CHECK(affirmative("y"));
    BOOST_CHECK(affirmative("YES"));
    BOOST_CHECK(affirmative(" j "));
    BOOST_CHECK(affirmative("Ja"));
    BOOST_CHECK(!affirmative(""));
    BOOST_CHECK(!affirmative("n"));
    BOOST_CHECK(!affirmative("yess"));

    RunConfig config;
    config.color = false;
    OperationPlan plan;
    plan.mode = opFull;
    plan.targetPath = "/backups/2025-01-01-backup-full";

    istringstream yes("yes\n");
    ostringstream prompt;
    BOOST_CHECK(confirmPlan(config, plan, yes, prompt));
    BOOST_CHECK(prompt.str().find("[y/N]") != string::npos);

    istringstream no("no\n");
    BOOST_CHECK(!confirmPlan(config, plan, no, prompt));

    istringstream eof("");
    BOOST_CHECK(!confirmPlan(config, plan, eof, prompt));

    config.force = true;
    istringstream unused("no\n");
    ostringstream silent;
    BOOST_CHECK(confirmPlan(config, plan, unused, silent));
    BOOST_CHECK(silent.str().empty());
}

BOOST_AUTO_TEST_CASE(Recovery_Procedures_Render)
{
    RunConfig config;
    Snapshot full, inc;
    BOOST_REQUIRE(Snapshot::parse("/backups", "2025-01-01-backup-full", full));
    BOOST_REQUIRE(Snapshot::parse("/backups", "2025-01-02-backup-inc-093000", inc));

    RecoveryProcedure generator(config, { "/recovery.sh", "/skip-files.txt", "/proc/*" });

    auto fullScript = generator.renderFull(full);
    BOOST_CHECK(fullScript.find("#!/bin/bash") == 0);
    BOOST_CHECK(fullScript.find("set -e") != string::npos);
    BOOST_CHECK(fullScript.find("--delete") != string::npos);
    BOOST_CHECK(fullScript.find("--exclude='/proc/*'") != string::npos);
    BOOST_CHECK(fullScript.find("command -v rsync") != string::npos);
    BOOST_CHECK(fullScript.find("grub") != string::npos);

    // each exclude is passed once
    auto first = fullScript.find("--exclude='/recovery.sh'");
    BOOST_REQUIRE(first != string::npos);
    BOOST_CHECK(fullScript.find("--exclude='/recovery.sh'", first + 1) == string::npos);
    first = fullScript.find("--exclude='/skip-files.txt'");
    BOOST_REQUIRE(first != string::npos);
    BOOST_CHECK(fullScript.find("--exclude='/skip-files.txt'", first + 1) == string::npos);

    auto incScript = generator.renderIncremental(inc, full);
    BOOST_CHECK(incScript.find("FULL_BACKUP_DIR='/backups/2025-01-01-backup-full'") != string::npos);
    BOOST_CHECK(incScript.find("Step 1/3") < incScript.find("Step 2/3"));
    BOOST_CHECK(incScript.find("Step 2/3") < incScript.find("Step 3/3"));
    BOOST_CHECK(incScript.find("skip-files.txt") != string::npos);

    config.recoveryTarget = "/mnt/it's here";
    auto quoted = generator.renderFull(full);
    BOOST_CHECK(quoted.find("RECOVERY_TARGET='/mnt/it'\\''s here'") != string::npos);
}

BOOST_AUTO_TEST_CASE(Storage_Names_The_Same_Directory_As_Dest)
{
    TempDir work;
    string store = work.sub("store");
    string source = work.sub("source");
    string canonicalStore = fs::canonical(store).string();
    BackupConfig fileConfig;

    cxxopts::Options options("fsbackup", "test");
    defineOptions(options);

    auto viaStorage = parseArgs(options, { "fsbackup", "--full", "--source", source, "--storage", store });
    BOOST_CHECK_EQUAL(buildRunConfig(viaStorage, fileConfig, 0).dest, canonicalStore);

    auto viaBoth = parseArgs(options, { "fsbackup", "--inc", "--source", source, "--dest", store, "--storage", store });
    auto config = buildRunConfig(viaBoth, fileConfig, 0);
    BOOST_CHECK_EQUAL(config.dest, canonicalStore);
    BOOST_CHECK(config.mode == opInc);

    auto conflicting = parseArgs(options, { "fsbackup", "--full", "--source", source, "--dest", store, "--storage", source });
    BOOST_CHECK_EXCEPTION(buildRunConfig(conflicting, fileConfig, 0), FBException, isConfigError);
}

BOOST_AUTO_TEST_CASE(Exactly_One_Operation_Is_Accepted)
{
    TempDir work;
    string source = work.sub("source");
    BackupConfig fileConfig;

    cxxopts::Options options("fsbackup", "test");
    defineOptions(options);

    auto two = parseArgs(options, { "fsbackup", "--full", "--inc", "--source", source, "--dest", source });
    BOOST_CHECK_EXCEPTION(buildRunConfig(two, fileConfig, 0), FBException, isConfigError);

    auto none = parseArgs(options, { "fsbackup", "--source", source, "--dest", source });
    BOOST_CHECK_EXCEPTION(buildRunConfig(none, fileConfig, 0), FBException, isConfigError);

    auto recover = parseArgs(options, { "fsbackup", "-r", "2025-01-02", "--source", source, "--dest", source, "--nice", "5" });
    auto config = buildRunConfig(recover, fileConfig, 0);
    BOOST_CHECK(config.mode == opRecover);
    BOOST_CHECK_EQUAL(config.recoverDate, "2025-01-02");
    BOOST_CHECK_EQUAL(config.nice, 5);
}

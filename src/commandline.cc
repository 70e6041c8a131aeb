#include <string>
#include <vector>
#include <unistd.h>

#include "commandline.h"
#include "exception.h"
#include "util_generic.h"
#include "debug.h"


void defineOptions(cxxopts::Options &options) {
    options.add_options()(string("f,") + CLI_FULL, "Full backup", cxxopts::value<bool>()->default_value("false"))(
        string("s,") + CLI_SYNC, "Sync latest full", cxxopts::value<bool>()->default_value("false"))(
        string("i,") + CLI_INC, "Incremental backup", cxxopts::value<bool>()->default_value("false"))(
        string("r,") + CLI_RECOVER, "Recover to date", cxxopts::value<std::string>())(
        string("y,") + CLI_FORCE, "No confirmation", cxxopts::value<bool>()->default_value("false"))(
        string("t,") + CLI_TEST, "Test only mode", cxxopts::value<bool>()->default_value("false"))(
        string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"))(
        string("V,") + CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"))(
        CLI_SOURCE, "Source directory", cxxopts::value<std::string>())(
        CLI_DEST, "Storage directory", cxxopts::value<std::string>())(
        CLI_STORAGE, "Storage directory (same as --dest)", cxxopts::value<std::string>())(
        CLI_EXCLUDE, "Exclude pattern", cxxopts::value<std::vector<std::string>>())(
        CLI_RSYNC, "rsync binary", cxxopts::value<std::string>())(
        CLI_RECOVERYTARGET, "Recovery script target", cxxopts::value<std::string>())(
        CLI_NICE, "Nice value", cxxopts::value<int>())(
        CLI_CONFIG, "Config file", cxxopts::value<std::string>())(
        CLI_DEFAULTS, "Show defaults", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"));
}


/*******************************************************************************
 * buildRunConfig(cli, fileConfig)
 *
 * Settings first, then command line overrides, then the sanity checks that
 * need both.
 *******************************************************************************/
RunConfig buildRunConfig(cxxopts::ParseResult &cli, BackupConfig &fileConfig, unsigned int debugSelector) {
    RunConfig config;
    auto &settings = fileConfig.settings;

    config.debugSelector = debugSelector;
    config.pid = getpid();

    // settings first
    config.source = settings[sSource].value;
    config.dest = settings[sDest].value;
    config.rsync = settings[sRsync].value;
    config.recoveryTarget = settings[sRecoveryTarget].value;
    config.nice = settings[sNice].ivalue();
    config.color = settings[sColor].bvalue();

    for (auto &exclude: perlSplit("\\s*,\\s*", settings[sExclude].value))
        if (trimSpace(exclude).length())
            config.extraExcludes.push_back(trimSpace(exclude));

    // then commandline overrides
    if (cli.count(CLI_SOURCE))
        config.source = cli[CLI_SOURCE].as<string>();

    if (cli.count(CLI_DEST) && cli.count(CLI_STORAGE) && cli[CLI_DEST].as<string>() != cli[CLI_STORAGE].as<string>())
        throw FBException(string("--") + CLI_DEST + " and --" + CLI_STORAGE + " name different storage directories", eConfig);

    if (cli.count(CLI_DEST))
        config.dest = cli[CLI_DEST].as<string>();
    else
        if (cli.count(CLI_STORAGE))
            config.dest = cli[CLI_STORAGE].as<string>();

    if (cli.count(CLI_RSYNC))
        config.rsync = cli[CLI_RSYNC].as<string>();

    if (cli.count(CLI_RECOVERYTARGET))
        config.recoveryTarget = cli[CLI_RECOVERYTARGET].as<string>();

    if (cli.count(CLI_NICE))
        config.nice = cli[CLI_NICE].as<int>();

    if (cli.count(CLI_EXCLUDE))
        for (auto &exclude: cli[CLI_EXCLUDE].as<vector<string>>())
            config.extraExcludes.push_back(exclude);

    if (cli[CLI_NOCOLOR].as<bool>())
        config.color = false;

    config.force = cli[CLI_FORCE].as<bool>();
    config.test = cli[CLI_TEST].as<bool>();

    // exactly one operation
    int modes = 0;
    if (cli[CLI_FULL].as<bool>()) { config.mode = opFull; ++modes; }
    if (cli[CLI_SYNC].as<bool>()) { config.mode = opSync; ++modes; }
    if (cli[CLI_INC].as<bool>()) { config.mode = opInc; ++modes; }
    if (cli.count(CLI_RECOVER)) {
        config.mode = opRecover;
        config.recoverDate = cli[CLI_RECOVER].as<string>();
        ++modes;
    }

    if (modes > 1)
        throw FBException(string("--") + CLI_FULL + ", --" + CLI_SYNC + ", --" + CLI_INC + " and --" + CLI_RECOVER + " are mutually exclusive", eConfig);

    if (!modes)
        throw FBException(string("no operation given; use one of --") + CLI_FULL + ", --" + CLI_SYNC + ", --" + CLI_INC + " or --" + CLI_RECOVER, eConfig);

    if (config.nice < 0 || config.nice > 19)
        throw FBException("nice value " + to_string(config.nice) + " is out of range (0-19)", eConfig);

    config.source = resolveGivenDirectory(config.source);
    config.dest = resolveGivenDirectory(config.dest);

    if (!config.source.length() || !config.dest.length())
        throw FBException("unable to determine the current directory" + errtext(), eConfig);

    DEBUG(config, D_config) DFMT("mode " << opModeName(config.mode) << ", source " << config.source << ", dest " << config.dest <<
        ", rsync " << config.rsync << ", nice " << config.nice << ", " << plural(config.extraExcludes.size(), "extra exclude"));

    return config;
}


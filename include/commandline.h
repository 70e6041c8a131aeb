#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include "cxxopts.hpp"
#include "globalsdef.h"
#include "BackupConfig.h"

void defineOptions(cxxopts::Options &options);

/* buildRunConfig(cli, fileConfig, debugSelector)
 * Merge the config file settings with the command line into the one RunConfig
 * the rest of the run reads.  The command line wins.  Throws FBException(eConfig). */
RunConfig buildRunConfig(cxxopts::ParseResult &cli, BackupConfig &fileConfig, unsigned int debugSelector);

#endif


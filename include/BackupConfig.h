#ifndef BACKUPCONFIG_H
#define BACKUPCONFIG_H

#include <iostream>
#include <vector>
#include <string>
#include <pcre++.h>
#include "Setting.h"


using namespace std;
using namespace pcrepp;


class BackupConfig {

public:
    string config_filename;
    vector<Setting> settings;

    BackupConfig();

    // every setting in config file syntax; defaults are commented out
    void fullDump(ostream &out = cout);

    /* loadConfig(filename)
     * Returns false if the file can't be opened (a missing config is allowed).
     * A line that matches no setting, or a value of the wrong type, throws
     * FBException(eConfig) naming the line. */
    bool loadConfig(string filename);
};

#endif


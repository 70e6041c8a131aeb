#include <fstream>
#include <stdexcept>
#include <pcre++.h>

#include "BackupConfig.h"
#include "Setting.h"
#include "util_generic.h"
#include "exception.h"
#include "globalsdef.h"

using namespace pcrepp;


BackupConfig::BackupConfig() {
    config_filename = "";

    // define settings and their defaults
    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting(CLI_SOURCE, RE_SOURCE, STRING, "/"));
    settings.insert(settings.end(), Setting(CLI_DEST, RE_DEST, STRING, "."));
    settings.insert(settings.end(), Setting(CLI_EXCLUDE, RE_EXCLUDE, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_RSYNC, RE_RSYNC, STRING, "rsync"));
    settings.insert(settings.end(), Setting(CLI_RECOVERYTARGET, RE_RECOVERYTARGET, STRING, "/"));
    settings.insert(settings.end(), Setting(CLI_NICE, RE_NICE, INT, "0"));
    settings.insert(settings.end(), Setting(CLI_COLOR, RE_COLOR, BOOL, "true"));
}


bool BackupConfig::loadConfig(string filename) {
    ifstream configFile;

    configFile.open(filename);
    if (!configFile.is_open())
        return false;

    string dataLine;
    Pcre reBlank(RE_BLANK);
    Pcre reBool("^\\s*(t|true|y|yes|1|f|false|n|no|0)?\\s*$", "i");
    config_filename = filename;

    unsigned int line = 0;
    while (getline(configFile, dataLine)) {
        ++line;

        // skip blanks and comments
        if (reBlank.search(dataLine))
            continue;

        // compare the line against each of the config settings until there's a match
        bool identified = false;
        for (auto &setting: settings) {
            if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                setting.value = setting.regex.get_match(2);
                setting.seen = true;
                // STRING is handled implicitly with no conversion

                if (setting.data_type == INT) {
                    try {
                        stoi(setting.value);    // will throw on invalid value
                    }
                    catch (invalid_argument &e) {
                        throw FBException("unable to parse a numeric value for " + setting.display_name + " on line " + to_string(line) + " of " + filename, dataLine, eConfig);
                    }
                    catch (out_of_range &e) {
                        throw FBException("numeric value for " + setting.display_name + " is out of range on line " + to_string(line) + " of " + filename, dataLine, eConfig);
                    }
                }
                else
                    if (setting.data_type == BOOL && !reBool.search(setting.value))
                        throw FBException("unable to parse a true/false value for " + setting.display_name + " on line " + to_string(line) + " of " + filename, dataLine, eConfig);

                identified = true;
                break;
            }
        }

        if (!identified)
            throw FBException("unrecognized setting on line " + to_string(line) + " of " + filename, dataLine, eConfig);
    }

    log("loaded settings from " + filename);
    return true;
}


void BackupConfig::fullDump(ostream &out) {
    for (auto &setting: settings)
        out << setting.confPrint();
}


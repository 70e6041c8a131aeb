#include <sstream>
#include <iomanip>

#include "Setting.h"
#include "globalsdef.h"


Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal) {
    regex = Pcre("(?:^|\\s)" + pattern + CAPTURE_VALUE + RE_COMMENT);
    display_name = name;
    data_type = setType;
    defaultValue = defaultVal;
    value = defaultValue;
    seen = false;
}


string Setting::confPrint() {
    stringstream line;
    bool isDef = value == defaultValue;

    line << left << setw(17) << ((isDef ? "#" : "") + display_name + ":")
         << setw(25) << (data_type == BOOL ? (str2bool(value) ? "true" : "false") : value)
         << (isDef ? "  # default" : "");

    return line.str() + "\n";
}


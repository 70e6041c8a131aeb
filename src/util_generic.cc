#include <iostream>
#include <sstream>
#include <dirent.h>
#include <errno.h>
#include <limits.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>
#include <syslog.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/statfs.h>
#include <list>
#include <tuple>

#include "pcre++.h"
#include "util_generic.h"
#include "exception.h"

using namespace pcrepp;


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


string cppgetenv(string variable) {
    char* c;

    c = getenv(variable.c_str());
    if (c == NULL)
        return "";
    else
        return c;
}


string perlJoin(string delimiter, vector<string> items) {
    string result;

    for (auto &item: items)
        result += (result.length() ? delimiter : "") + item;

    return result;
}


// the RE given matches the delimiter and tokens are found in between
vector<string> perlSplit(string regex, string haystack) {
    Pcre theRE("(" + regex + ")");
    vector<string> result;
    int pos = 0;

    while (pos <= (int)haystack.length() && theRE.search(haystack, pos)) {
        int start = theRE.get_match_start(0);
        int end = theRE.get_match_end(0);

        // zero-length delimiters can't make progress
        if (end < start)
            break;

        result.push_back(haystack.substr(pos, start - pos));
        pos = end + 1;
    }

    result.push_back(pos <= (int)haystack.length() ? haystack.substr(pos) : "");
    return result;
}


/* log() always goes to syslog (opened in main() with the fsbackup ident).  It
 * returns its argument so a message can be logged and shown in one statement:
 *      SCREENERR(config, log("error: ..."));
 */
string log(string message) {
    string flat = message;
    size_t pos = 0;

    // syslog lines are single lines
    while ((pos = flat.find("\n", pos)) != string::npos) {
        flat.replace(pos, 1, ", ");
        pos += 2;
    }

    syslog(LOG_CRIT, "%s", flat.c_str());
    return message;
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() && str1[str1.length() - 1] == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    return (str3.length() ? slashConcat(str1 + "/" + str2, str3) : str1 + "/" + str2);
}


s_pathSplit pathSplit(string path) {
    s_pathSplit s;

    while (path.length() > 1 && path.back() == '/')
        path.pop_back();

    auto pos = path.rfind("/");
    if (pos == string::npos) {
        s.dir = ".";
        s.file = path;
    }
    else {
        s.dir = pos ? path.substr(0, pos) : "/";
        s.file = path.substr(pos + 1);
    }

    return s;
}


string approximate(uint64_t size) {
    int index = 0;
    long double decimalSize = size;
    const char *unit[] = { "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB" };

    while (decimalSize >= 1024 && index < (int)(sizeof(unit) / sizeof(*unit)) - 1) {
        decimalSize /= 1024.0;
        ++index;
    }

    char buffer[150];
    snprintf(buffer, sizeof(buffer), index ? "%.2Lf" : "%.0Lf", index ? decimalSize : floorl(decimalSize));
    return string(buffer) + unit[index];
}


int mkdirp(string dir, mode_t mode) {
    struct stat statBuf;

    if (!mystat(dir, &statBuf))
        return (S_ISDIR(statBuf.st_mode) ? 0 : -1);

    string path = dir[0] == '/' ? "" : ".";
    stringstream tokenizer(dir);
    string part;

    while (getline(tokenizer, part, '/')) {
        if (!part.length())
            continue;

        path += "/" + part;

        if (mystat(path, &statBuf) == -1 && mkdir(path.c_str(), mode) && errno != EEXIST)
            return -1;
    }

    return 0;
}


string trimSpace(const string &s) {
    auto start = s.begin();
    while (start != s.end() && isspace((unsigned char)*start))
        start++;

    auto end = s.end();
    while (end != start && isspace((unsigned char)*(end - 1)))
        end--;

    return string(start, end);
}


string locateBinary(string app) {
    string tempStr;
    string path = cppgetenv("PATH");

    // if a path is specified try it
    if (app.find("/") != string::npos)
        return (!access(app.c_str(), X_OK) ? app : "");

    // try to find the binary in each component of the path
    stringstream pathTokenizer(path);
    while (getline(pathTokenizer, tempStr, ':')) {
        string binary = slashConcat(tempStr.length() ? tempStr : ".", app);
        if (!access(binary.c_str(), X_OK))
            return binary;
    }

    // give up
    return "";
}


bool str2bool(string text) {
    Pcre regTrue("(^\\s*(t|true|y|yes|1)\\s*$)|(^\\s*$)", "i");
    // a blank value (^\\s*$) is parsed as true to support someone writing just the directive name in the config file.
    // e.g. these two lines would be interpreted identically:
    //      color: true
    //      color

    return (regTrue.search(text));
}


bool rmrfCallback(pdCallbackData &file) {
    if (S_ISDIR(file.statData.st_mode) ? rmdir(file.filename.c_str()) : unlink(file.filename.c_str()))
        throw FBException("unable to remove " + file.filename + errtext());

    return true;
}


bool rmrf(string path) {
    return (processDirectory(path, rmrfCallback, NULL, -1, true) == "");
}


bool exists(const std::string& name) {
    struct stat statBuffer;
    return (mylstat(name, &statBuffer) == 0);
}


bool isWritableDir(string dir) {
    struct stat statBuffer;
    return (!mystat(dir, &statBuffer) && S_ISDIR(statBuffer.st_mode) && !access(dir.c_str(), W_OK));
}


string realpathcpp(string origPath) {
    char tmpBuf[PATH_MAX+1];
    return (realpath(origPath.c_str(), tmpBuf) == NULL ? "" : tmpBuf);
}


string resolveGivenDirectory(string inputDir) {
    char dirBuf[PATH_MAX+1];

    if (!inputDir.length())
        return "";

    // prepend pwd
    if (inputDir[0] != '/') {
        if (getcwd(dirBuf, sizeof(dirBuf)) == NULL)
            return "";

        inputDir = slashConcat(dirBuf, inputDir);
    }

    // realpath() fails on a missing dir; hand back the absolute form so the caller can report it
    auto resolved = realpathcpp(inputDir);
    return (resolved.length() ? resolved : inputDir);
}


string shellQuote(string data) {
    string result = "'";

    for (auto c: data)
        if (c == '\'')
            result += "'\\''";
        else
            result += c;

    return result + "'";
}


int fsSpace(string path, FsSpace &space) {
    struct statfs fs;

    if (statfs(path.c_str(), &fs))
        return -1;

    space.usedBytes = (uint64_t)fs.f_bsize * (fs.f_blocks - fs.f_bfree);
    space.availableBytes = (uint64_t)fs.f_bsize * fs.f_bavail;
    return 0;
}


/*
 processDirectory() walks a tree without following symlinks.  The callback is called
 immediately on everything that isn't a directory.  Directories are called back after
 everything inside them (depth-first), which is what lets rmrf() remove a directory
 only once it's empty.

 processDirectory() returns a blank string on success.  On error the error is logged
 and returned to the calling function.
 */
string processDirectory(string directory, bool (*callback)(pdCallbackData&), void *passData, int maxDepth, bool includeTopDir) {
    DIR *dirPtr;
    struct dirent *dirEntry;
    list<tuple<string, unsigned int>> dirsToRead;  // filename and depth in heirarchy
    list<pdCallbackData> dirsToCallback;           // dirs to calback
    struct stat dirStat;
    pdCallbackData file;
    bool stopped = false;
    file.dataPtr = passData;

    dirsToRead.push_back({directory, 0});

    try {
        while (!stopped && !dirsToRead.empty()) {
            auto [baseDir, depth] = dirsToRead.front();
            dirsToRead.pop_front();

            if (mylstat(baseDir, &dirStat))
                return log("error: stat failed for " + baseDir + errtext());

            // given a file (or symlink) instead of a directory
            if (!S_ISDIR(dirStat.st_mode)) {
                file.filename = baseDir;
                file.statData = dirStat;
                file.depth = depth;

                if (includeTopDir || baseDir != directory)
                    stopped = !callback(file);
                continue;
            }

            if ((dirPtr = opendir(baseDir.c_str())) == NULL)
                return log("error: unable to open " + baseDir + errtext());

            while ((dirEntry = readdir(dirPtr)) != NULL) {
                if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
                    continue;

                file.filename = slashConcat(baseDir, dirEntry->d_name);
                if (mylstat(file.filename, &file.statData))
                    continue;

                if (S_ISDIR(file.statData.st_mode)) {
                    if (maxDepth < 0 || (int)depth < maxDepth)
                        dirsToRead.push_back({file.filename, depth + 1});
                }
                else {
                    file.depth = depth + 1;
                    if (!callback(file)) {
                        stopped = true;
                        break;
                    }
                }
            }
            closedir(dirPtr);

            if (stopped)
                break;

            /* the directory itself can't be called back yet because its subdirectories are
             still queued.  push_front() means the deepest directories come off the list first. */
            if (includeTopDir || baseDir != directory) {
                file.filename = baseDir;
                file.statData = dirStat;
                file.depth = depth;
                dirsToCallback.push_front(file);
            }
        }

        while (!stopped && !dirsToCallback.empty()) {
            file = dirsToCallback.front();
            dirsToCallback.pop_front();

            if (!callback(file))
                break;
        }
    }
    catch (FBException &e) {
        return log("error: " + e.detail());
    }

    return "";
}


int mylstat(string filename, struct stat *buf) {
    return (lstat(filename.c_str(), buf));
}


int mystat(string filename, struct stat *buf) {
    return (stat(filename.c_str(), buf));
}


string errtext(bool format) {
    return ((format ? " - " : "") + string(strerror(errno)));
}


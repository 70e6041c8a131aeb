#ifndef UTIL_GENERIC
#define UTIL_GENERIC

#include <string>
#include <vector>
#include <stdint.h>
#include <time.h>
#include <sys/stat.h>

#include "pcre++.h"
#include "globalsdef.h"

using namespace pcrepp;
using namespace std;


// used/available figures for the filesystem a path lives on
struct FsSpace {
    uint64_t usedBytes;
    uint64_t availableBytes;

    FsSpace(uint64_t used = 0, uint64_t avail = 0) {
        usedBytes = used;
        availableBytes = avail;
    }
};


string cppgetenv(string variable);

string plural(size_t number, string text);

string log(string message);

string perlJoin(string delimiter, vector<string> items);

vector<string> perlSplit(string regex, string haystack);


struct s_pathSplit {
    string dir;
    string file;
};

// pathsplit assumes a full dir/file
s_pathSplit pathSplit(string path);

string slashConcat(string str1, string str2, string str3 = "");

string approximate(uint64_t size);

int mkdirp(string dir, mode_t mode = 0755);

string trimSpace(const string &s);

string locateBinary(string app);

bool str2bool(string text);

// delete a file, symlink or directory tree (rm -rf); never follows symlinks
bool rmrf(string path);

bool exists(const std::string& name);

bool isWritableDir(string dir);

string realpathcpp(string origPath);

// absolute, symlink-resolved version of a user supplied directory
string resolveGivenDirectory(string inputDir);

// single-quote a string for /bin/sh
string shellQuote(string data);

// statfs() wrapper; 0 on success like the syscall
int fsSpace(string path, FsSpace &space);

struct pdCallbackData {
    string filename;
    unsigned int depth;
    struct stat statData;
    void *dataPtr;
};

string processDirectory(string directory, bool (*callback)(pdCallbackData&), void *passData, int maxDepth = -1, bool includeTopDir = false);

int mylstat(string filename, struct stat *buf);
int mystat(string filename, struct stat *buf);

string errtext(bool format = true);

#endif


#include <dirent.h>
#include <sys/stat.h>

#include "SnapshotCatalog.h"
#include "util_generic.h"
#include "debug.h"


SnapshotCatalog::SnapshotCatalog(string storageRoot, const RunConfig &runConfig) : root(storageRoot), config(runConfig) {
}


struct scanDataType {
    map<string, Snapshot> *fulls;
    map<string, Snapshot> *incrementals;
    string root;
    const RunConfig *config;
};


static bool scanCallback(pdCallbackData &file) {
    scanDataType *data = (scanDataType*)file.dataPtr;
    Snapshot snap;

    // only the storage root's immediate subdirectories can be snapshots
    if (file.depth != 1 || !S_ISDIR(file.statData.st_mode))
        return true;

    auto dirName = pathSplit(file.filename).file;

    if (!Snapshot::parse(data->root, dirName, snap)) {
        DEBUG(*data->config, D_catalog) DFMT("ignoring " << file.filename);
        return true;
    }

    DEBUG(*data->config, D_catalog) DFMT((snap.isFull() ? "full: " : "incremental: ") << snap.path);

    if (snap.isFull())
        (*data->fulls)[snap.name] = snap;
    else
        (*data->incrementals)[snap.name] = snap;

    return true;
}


/*******************************************************************************
 * scan()
 *
 * Classify everything directly under the storage root.  Non-matching names
 * and non-directories (symlinks included) are ignored.  Snapshots are never
 * descended into; they can hold millions of files.
 *******************************************************************************/
string SnapshotCatalog::scan() {
    scanDataType data;

    fulls.clear();
    incrementals.clear();

    data.fulls = &fulls;
    data.incrementals = &incrementals;
    data.root = root;
    data.config = &config;

    DIR *dirPtr;
    struct dirent *dirEntry;

    if ((dirPtr = opendir(root.c_str())) == NULL)
        return log("error: unable to read storage directory " + root + errtext());

    while ((dirEntry = readdir(dirPtr)) != NULL) {
        pdCallbackData file;

        if (dirEntry->d_name[0] == '.')
            continue;

        file.filename = slashConcat(root, dirEntry->d_name);
        file.depth = 1;
        file.dataPtr = &data;

        if (!mylstat(file.filename, &file.statData))
            scanCallback(file);
    }

    closedir(dirPtr);

    DEBUG(config, D_catalog) DFMT(root << ": " << plural(fulls.size(), "full") << ", " << plural(incrementals.size(), "incremental"));
    return "";
}


vector<Snapshot> SnapshotCatalog::listFulls() const {
    vector<Snapshot> result;

    for (auto &entry: fulls)
        result.push_back(entry.second);

    return result;
}


vector<Snapshot> SnapshotCatalog::listIncrementals() const {
    vector<Snapshot> result;

    for (auto &entry: incrementals)
        result.push_back(entry.second);

    return result;
}


bool SnapshotCatalog::latestFull(Snapshot &result) const {
    if (!fulls.size())
        return false;

    result = (--fulls.end())->second;
    return true;
}


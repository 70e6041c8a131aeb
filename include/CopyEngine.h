#ifndef COPYENGINE_H
#define COPYENGINE_H

#include <string>
#include <vector>
#include "globalsdef.h"

using namespace std;


enum CopyMode {
    cmCopy,                 // add and update, never delete
    cmMirror,               // copy with delete
    cmDeleteOnly,           // delete what's gone from the source, transfer nothing
    cmReportDeletions,      // dry run; list what a mirror would delete
    cmLinkReference         // copy, hard linking unchanged files against a reference tree
};


struct CopyRequest {
    string source;
    string dest;
    vector<string> excludes;
    CopyMode mode;
    string reference;       // cmLinkReference only

    CopyRequest() { mode = cmCopy; }
    CopyRequest(string src, string dst, vector<string> excl, CopyMode m, string ref = "") :
        source(src), dest(dst), excludes(excl), mode(m), reference(ref) {}
};


struct CopyOutcome {
    bool success;
    int exitCode;
    string detail;              // error text from the engine
    vector<string> reported;    // cmReportDeletions: paths relative to dest, dirs with a trailing /

    CopyOutcome() { success = false; exitCode = -1; }
};


/* The byte level copy is delegated.  Implementations must preserve ownership
   (numeric ids), permissions, ACLs, xattrs and hard links; excludes are rsync
   style globs anchored at the source root. */
class CopyEngine {
    public:
        virtual ~CopyEngine() {}

        virtual CopyOutcome run(const CopyRequest &request) = 0;

        // false with an explanation if the engine can't be used
        virtual bool available(string &detail) = 0;

        virtual string name() = 0;
};


class RsyncEngine : public CopyEngine {
    const RunConfig &config;

    public:
        RsyncEngine(const RunConfig &runConfig);

        CopyOutcome run(const CopyRequest &request) override;
        bool available(string &detail) override;
        string name() override { return "rsync"; }

        vector<string> buildArgs(const CopyRequest &request);
        string binary();
};


string copyModeName(CopyMode mode);

#endif


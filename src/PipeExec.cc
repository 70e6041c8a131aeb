#include <string>
#include <iostream>
#include <fstream>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <vector>

#include "util_generic.h"
#include "globalsdef.h"
#include "PipeExec.h"


#define READ_END 0
#define WRITE_END 1

#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

using namespace std;


PipeExec::PipeExec(vector<string> argv) {
    args = argv;
    childPID = 0;
    readFd = -1;
    waited = false;
    exitStatus = -1;
}


PipeExec::~PipeExec() {
    closeRead();

    if (childPID && !waited)
        wait();

    if (errorFilename.length())
        unlink(errorFilename.c_str());
}


int PipeExec::closeRead() {
    int result = 0;

    if (readFd >= 0) {
        result = close(readFd);
        readFd = -1;
    }

    return result;
}


string PipeExec::commandLine() {
    return perlJoin(" ", args);
}


int PipeExec::execute(bool captureOutput) {
    int fd[2] = { -1, -1 };

    if (!args.size())
        return -1;

    mkdirp(TMP_OUTPUT_DIR, 0700);
    errorFilename = slashConcat(TMP_OUTPUT_DIR, "pid_" + to_string(getpid()) + "." + pathSplit(args[0]).file + ".stderr");

    if (captureOutput && pipe(fd))
        return -1;

    // flush before fork so buffered output isn't written twice
    cout << flush;
    cerr << flush;

    if ((childPID = fork()) < 0) {
        childPID = 0;
        if (captureOutput) {
            close(fd[READ_END]);
            close(fd[WRITE_END]);
        }
        return -1;
    }

    if (!childPID) {
        // CHILD
        int errorFd = open(errorFilename.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
        if (errorFd >= 0) {
            DUP2(errorFd, 2);
            close(errorFd);
        }

        if (captureOutput) {
            close(fd[READ_END]);
            DUP2(fd[WRITE_END], 1);
            close(fd[WRITE_END]);
        }

        vector<char*> params;
        for (auto &arg: args)
            params.push_back(const_cast<char*>(arg.c_str()));
        params.push_back(NULL);

        execvp(params[0], params.data());
        cerr << "unable to execute " << args[0] << errtext() << endl;
        _exit(127);
    }

    // PARENT
    if (captureOutput) {
        close(fd[WRITE_END]);
        readFd = fd[READ_END];
    }

    return 0;
}


bool PipeExec::readLine(string &line) {
    while (1) {
        auto pos = strBuf.find("\n");

        if (pos != string::npos) {
            line = strBuf.substr(0, pos);
            strBuf.erase(0, pos + 1);
            return true;
        }

        if (readFd < 0)
            break;

        ssize_t bytes = read(readFd, rawBuf, sizeof(rawBuf));
        if (bytes < 0 && errno == EINTR)
            continue;

        if (bytes <= 0) {
            closeRead();
            break;
        }

        strBuf.append(rawBuf, bytes);
    }

    // final line with no trailing newline
    if (strBuf.length()) {
        line = strBuf;
        strBuf.clear();
        return true;
    }

    return false;
}


int PipeExec::wait() {
    if (waited)
        return exitStatus;

    if (!childPID)
        return -1;

    // anything left unread would block the child on a full pipe
    string discard;
    while (readFd >= 0 && readLine(discard));

    int status;
    while (waitpid(childPID, &status, 0) < 0)
        if (errno != EINTR) {
            waited = true;
            return (exitStatus = -1);
        }

    waited = true;
    exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return exitStatus;
}


string PipeExec::errorOutput() {
    string result;
    ifstream errorFile;

    if (!errorFilename.length())
        return "";

    errorFile.open(errorFilename);
    if (errorFile.is_open()) {
        string data;

        while (getline(errorFile, data))
            result += (result.length() ? "\n" : "") + data;

        errorFile.close();
    }

    return result;
}



#ifndef PIPE_EXEC_H
#define PIPE_EXEC_H

#include <string>
#include <vector>
#include <sys/types.h>

/****************************************************************
 * PipeExec
 *
 * Run a single child process from an argument vector (no shell,
 * so paths with spaces or quotes need no escaping).  STDOUT can
 * either be captured and read back line by line or left on the
 * terminal.  STDERR always goes to a file under TMP_OUTPUT_DIR so
 * it can be quoted back in error messages.
 *
 * Example:
 *
 * PipeExec p({"rsync", "-n", "--delete", "src/", "dst"});
 * p.execute(true);
 * string line;
 * while (p.readLine(line))
 *     cout << line << endl;
 * if (p.wait())
 *     cerr << p.errorOutput() << endl;
 *
 */

using namespace std;


class PipeExec {
    vector<string> args;
    pid_t childPID;
    int readFd;
    string errorFilename;
    string strBuf;
    char rawBuf[1024 * 64];
    bool waited;
    int exitStatus;

    public:
        PipeExec(vector<string> argv);
        ~PipeExec();

        // owns the pipe and the child; a copy would close and reap them twice
        PipeExec(const PipeExec&) = delete;
        PipeExec &operator=(const PipeExec&) = delete;

        /* execute(captureOutput)
         * Forks and execs the command.  With captureOutput the child's STDOUT is a pipe
         * back to us and has to be drained with readLine() before wait().  Returns 0 if
         * the child was started, -1 if pipe() or fork() failed. */
        int execute(bool captureOutput = false);

        bool readLine(string &line);

        /* wait() reaps the child and returns its exit code; 127 means exec() failed
         * and -1 means the child died on a signal. */
        int wait();

        string errorOutput();
        string commandLine();
        int closeRead();
};


#endif


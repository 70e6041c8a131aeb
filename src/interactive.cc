#include <string>
#include <pcre++.h>

#include "interactive.h"
#include "util_generic.h"

using namespace pcrepp;


bool affirmative(string answer) {
    Pcre yes("^\\s*(y|yes|j|ja)\\s*$", "i");
    return yes.search(answer);
}


bool confirmPlan(const RunConfig &config, const OperationPlan &plan, istream &in, ostream &out) {
    if (config.force) {
        log("confirmation skipped (--" + string(CLI_FORCE) + ") for " + opModeName(plan.mode) + " of " + plan.targetPath);
        return true;
    }

    string answer;
    out << BOLDYELLOW(config) << "\nProceed with the " << opModeName(plan.mode) << "? [y/N] " << RESET(config) << flush;

    if (!getline(in, answer))
        answer = "";

    bool approved = affirmative(answer);
    log(string(approved ? "confirmed " : "declined ") + opModeName(plan.mode) + " of " + plan.targetPath);
    return approved;
}


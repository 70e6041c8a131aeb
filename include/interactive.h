#ifndef INTERACTIVE_H
#define INTERACTIVE_H

#include <iostream>
#include <string>
#include "globalsdef.h"
#include "OperationPlanner.h"

using namespace std;

// true if the answer is a yes (y, yes, j, ja; any case)
bool affirmative(string answer);

// show the plan and ask; --force answers yes without asking
bool confirmPlan(const RunConfig &config, const OperationPlan &plan, istream &in = cin, ostream &out = cout);

#endif


#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include "debug.h"

#define nelem(arr) (sizeof(arr) / sizeof(*arr))

static bit_table debug_options[] = { /* must be in alphabetical order */
    { "all",      Di_all },
    { "catalog",  Di_catalog },
    { "chain",    Di_chain },
    { "config",   Di_config },
    { "exec",     Di_exec },
    { "ledger",   Di_ledger },
    { "plan",     Di_plan },
    { "recovery", Di_recovery },
};


static const bit_table *findOption(string name) {
    size_t start = 0;
    size_t end = nelem(debug_options);

    while (start < end) {
        size_t middle = start + (end - start) / 2;
        int c = strcmp(name.c_str(), debug_options[middle].name);

        if (!c)
            return &debug_options[middle];

        if (c < 0)
            end = middle;
        else
            start = middle + 1;
    }

    return NULL;
}


bool decodeDebugSelector(unsigned int &selector, string selectorText) {
    unsigned int result = selector;
    size_t pos = 0;

    if (!selectorText.length())
        return true;

    // literal bitmask
    if (selectorText[0] == '=') {
        char *end;
        result = (unsigned int)strtoul(selectorText.c_str() + 1, &end, 0);

        if (*end)
            return false;

        selector = result;
        return true;
    }

    // symbolic +name/-name list
    while (pos < selectorText.length()) {
        while (pos < selectorText.length() && isspace(selectorText[pos]))
            ++pos;

        if (pos >= selectorText.length())
            break;

        if (selectorText[pos] != '+' && selectorText[pos] != '-')
            return false;

        bool adding = selectorText[pos++] == '+';
        size_t nameStart = pos;

        while (pos < selectorText.length() && (isalnum(selectorText[pos]) || selectorText[pos] == '_'))
            ++pos;

        auto option = findOption(selectorText.substr(nameStart, pos - nameStart));
        if (option == NULL)
            return false;

        if (option->bit == Di_all)
            result = adding ? D_all : 0;
        else
            if (adding)
                result |= BIT(option->bit);
            else
                result &= ~BIT(option->bit);
    }

    selector = result;
    return true;
}


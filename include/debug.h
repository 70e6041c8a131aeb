#ifndef DEBUG_H
#define DEBUG_H

/*
 Selector scheme borrowed from Philip Hazel's Exim Mail Transport Agent:
    -v                  default set
    --vv                everything
    -v+chain-exec       default set, adding chain and removing exec
    -v=0x12             a literal bitmask
 */

#include <string>

using namespace std;

#define BIT(n) (1UL << (n))

#define DEBUG_BIT(name) Di_##name = IOTA(Di_iota), D_##name = (int)BIT(Di_##name)

/* IOTA allows us to keep an implicit sequential count, like a simple enum,
but we can have sequentially numbered identifiers which are not declared
sequentially. */
#define IOTA(iota)      (__LINE__ - iota)
#define IOTA_INIT(zero) (__LINE__ - zero + 1)

enum {
  Di_all        = -1,
  Di_v          = 0,

  Di_iota = IOTA_INIT(1),
  DEBUG_BIT(catalog),              /* 1 */
  DEBUG_BIT(chain),
  DEBUG_BIT(config),
  DEBUG_BIT(exec),
  DEBUG_BIT(ledger),
  DEBUG_BIT(plan),
  DEBUG_BIT(recovery),
};

#define D_all                        0xffffffff

#define D_any                        (D_all)

#define D_default                    (D_all & \
                                       ~(D_config           | \
                                         D_exec))


#define DEBUG(c, x)   if ((c).debugSelector & (x))


struct bit_table {
    const char *name;
    int bit;
};

// returns false (and leaves selector untouched) if selectorText names an unknown selector
bool decodeDebugSelector(unsigned int &selector, string selectorText);


#endif


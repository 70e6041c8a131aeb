#ifndef COLORS_H
#define COLORS_H

/* Color state lives in RunConfig; every macro takes the config it reads from. */
#define ifcolor(c, x) ((c).color ? x : "")

#define RESET(c)       ifcolor(c, "\033[0m")
#define RED(c)         ifcolor(c, "\033[31m")      /* Red */
#define GREEN(c)       ifcolor(c, "\033[32m")      /* Green */
#define YELLOW(c)      ifcolor(c, "\033[33m")      /* Yellow */
#define BLUE(c)        ifcolor(c, "\033[34m")      /* Blue */
#define CYAN(c)        ifcolor(c, "\033[36m")      /* Cyan */
#define BOLDRED(c)     ifcolor(c, "\033[1m\033[31m")      /* Bold Red */
#define BOLDGREEN(c)   ifcolor(c, "\033[1m\033[32m")      /* Bold Green */
#define BOLDYELLOW(c)  ifcolor(c, "\033[1m\033[33m")      /* Bold Yellow */
#define BOLDBLUE(c)    ifcolor(c, "\033[1m\033[34m")      /* Bold Blue */

#endif

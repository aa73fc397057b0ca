#ifndef VERSION_H
#define VERSION_H

#define ONETIMEPASS_VERSION_MAJOR 1
#define ONETIMEPASS_VERSION_MINOR 0
#define ONETIMEPASS_VERSION_PATCH 1
#define ONETIMEPASS_VERSION "1.0.1"

#endif // VERSION_H

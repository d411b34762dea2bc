#ifndef MODELMIG_CONFIG_H_
#define MODELMIG_CONFIG_H_

// Project version
#define MODELMIG_VERSION_MAJOR 1
#define MODELMIG_VERSION_MINOR 0
#define MODELMIG_VERSION_PATCH 0
#define MODELMIG_VERSION "1.0.0"

#endif // MODELMIG_CONFIG_H_

#ifndef MELT_VERSION_HPP
#define MELT_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define MELT_VERSION_MAJOR 0
#define MELT_VERSION_MINOR 1
#define MELT_VERSION_PATCH 0

#define MELT_VERSION_STR "0.1.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* MELT_VERSION = MELT_VERSION_STR;

/* User agent sent with every forge API request. */
constexpr const char* MELT_USER_AGENT = "melt/" MELT_VERSION_STR;

#endif /* MELT_VERSION_HPP */

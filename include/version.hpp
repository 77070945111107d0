#ifndef GITPORT_VERSION_HPP
#define GITPORT_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define GITPORT_VERSION_MAJOR 0
#define GITPORT_VERSION_MINOR 3
#define GITPORT_VERSION_PATCH 0

/*
 * Release tag injected by the packaging workflow.
 * Example format: "2026.10.19-1".
 */
#define GITPORT_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* GITPORT_VERSION = GITPORT_VERSION_STR;

#endif /* GITPORT_VERSION_HPP */

#ifndef ARGPARS_VERSION_HPP
#define ARGPARS_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define ARGPARS_VERSION_MAJOR 0
#define ARGPARS_VERSION_MINOR 2
#define ARGPARS_VERSION_PATCH 0

#define ARGPARS_VERSION_STR "0.2.0"
/* ------------------------------------------------------------------ */

namespace argpars {
/* Human-friendly version string for the C++ codebase */
constexpr const char* VERSION = ARGPARS_VERSION_STR;
} // namespace argpars

#endif /* ARGPARS_VERSION_HPP */

#ifndef FLEETFIX_VERSION_HPP
#define FLEETFIX_VERSION_HPP

#define FLEETFIX_VERSION_MAJOR 0
#define FLEETFIX_VERSION_MINOR 3
#define FLEETFIX_VERSION_PATCH 0

/*
 * Release tag injected by the packaging workflow.
 * Example format: "0.3.0" or "2026.10.19-1".
 */
#ifndef FLEETFIX_VERSION_STR
#define FLEETFIX_VERSION_STR "0.3.0"
#endif

constexpr const char* FLEETFIX_VERSION = FLEETFIX_VERSION_STR;

#endif /* FLEETFIX_VERSION_HPP */

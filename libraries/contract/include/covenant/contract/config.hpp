#pragma once

#include <stdint.h>

/** @file covenant/contract/config.hpp
 *  @brief Defines global constants that determine how pathways are declared
 */
#define COVENANT_CONTRACT_VERSION                           3

/**
 *  Pathway, guard and compile gate names are stable identifiers that the
 *  compiler and any external argument source refer to, so they are limited
 *  to lower case alphanumerics and underscores.
 */
#define COVENANT_MAX_PATHWAY_NAME_LENGTH                    64

/**
 *  The dialect stamped into every generated argument schema.
 */
#define COVENANT_SCHEMA_DIALECT                             "http://json-schema.org/draft-07/schema#"

#define COVENANT_DEFAULT_NETWORK                            "regtest"
#define COVENANT_CONTEXT_PATH_SEPARATOR                     "/"
#define COVENANT_MAX_CONTEXT_DEPTH                          uint32_t(32)

#pragma once

// =============================================================================
// FILE: smat/version.hpp
// BRIEF: Library version
// =============================================================================

#define SMAT_VERSION_MAJOR 1
#define SMAT_VERSION_MINOR 0
#define SMAT_VERSION_PATCH 0

#define SMAT_VERSION_STRINGIFY_IMPL(x) #x
#define SMAT_VERSION_STRINGIFY(x) SMAT_VERSION_STRINGIFY_IMPL(x)

#define SMAT_VERSION_STRING                          \
    SMAT_VERSION_STRINGIFY(SMAT_VERSION_MAJOR) "."   \
    SMAT_VERSION_STRINGIFY(SMAT_VERSION_MINOR) "."   \
    SMAT_VERSION_STRINGIFY(SMAT_VERSION_PATCH)

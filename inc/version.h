// Copyright <Apex Telemetry>
#pragma once

#define APEX_VERSION_MAJOR 1
#define APEX_VERSION_MINOR 4

// Define a version string
#define APEX_VERSION_STRING APEX_STRINGIFY(APEX_VERSION_MAJOR) "." APEX_STRINGIFY(APEX_VERSION_MINOR)

// Helper macro for stringification
#define APEX_STRINGIFY(x) APEX_STRINGIFY_HELPER(x)
#define APEX_STRINGIFY_HELPER(x) #x

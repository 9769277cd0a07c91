#pragma once

#define ABSTATS_VERSION_MAJOR 1
#define ABSTATS_VERSION_MINOR 0
#define ABSTATS_VERSION_PATCH 0
#define ABSTATS_VERSION_STRING "1.0.0"

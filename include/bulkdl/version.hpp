#pragma once

#define BULKDL_VERSION_MAJOR 1
#define BULKDL_VERSION_MINOR 0
#define BULKDL_VERSION_PATCH 0
#define BULKDL_VERSION "1.0.0"

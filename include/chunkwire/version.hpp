#pragma once

#define CHUNKWIRE_VERSION_MAJOR 1
#define CHUNKWIRE_VERSION_MINOR 0
#define CHUNKWIRE_VERSION_PATCH 0
#define CHUNKWIRE_VERSION_STRING "1.0.0"

namespace chunkwire {

void print_version();

}  // namespace chunkwire

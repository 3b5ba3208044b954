#include "chunkwire/version.hpp"

#include <iostream>

namespace chunkwire {

void print_version() {
    std::cout << "chunkwire " << CHUNKWIRE_VERSION_STRING << std::endl;
}

}  // namespace chunkwire

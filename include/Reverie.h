#ifndef REVERIE_LIBRARY_H
#define REVERIE_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/save_load.hpp"
#include "../src/data/data.hpp"
#include "../src/gradient/tiling.hpp"
#include "../src/network/network.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the Dreamer front-end, the network adapters, the image codec
//    and loaders, and the JSON settings helpers.
//  - Header-only: every component lives under src/ and is pulled in here.

#endif // REVERIE_LIBRARY_H

#ifndef REVERIE_DATA_HPP
#define REVERIE_DATA_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "codec/codec.hpp"
#include "load/load.hpp"
#include "transform/format/format.hpp"
#endif //REVERIE_DATA_HPP

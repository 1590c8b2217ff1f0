#ifndef REVERIE_NETWORK_HPP
#define REVERIE_NETWORK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "adapter.hpp"
#include "details/device.hpp"
#include "details/sequential.hpp"
#include "details/staged.hpp"
#include "details/torchscript.hpp"

namespace Reverie::Network {
    using Stage = Details::Stage;
    using StagedAdapter = Details::StagedAdapter;

    using TorchScriptOptions = Details::TorchScriptOptions;
    using TorchScriptAdapter = Details::TorchScriptAdapter;

    using SequentialAdapter = Details::SequentialAdapter;
}

#endif // REVERIE_NETWORK_HPP

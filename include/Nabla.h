#ifndef NABLA_LIBRARY_H
#define NABLA_LIBRARY_H

#include "../src/utils/check.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/optimizer/registry.hpp"
#include "../src/common/save_load.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the optimizer descriptors, the per-parameter optimizers and the
//    module-level adaptor together with the checkpoint helpers.
//  - Include-only components; implementation lives in header-only modules under
//    src/. LibTorch supplies tensors, devices and archives.

#endif // NABLA_LIBRARY_H

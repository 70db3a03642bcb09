#ifndef TESSEL_LIBRARY_H
#define TESSEL_LIBRARY_H

#include "../src/core.hpp"
#include "../src/activation/activation.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/evaluation/evaluation.hpp"

#include "../src/common/checkpoint.hpp"
#include "../src/common/config.hpp"
#include "../src/common/error.hpp"
#include "../src/data/load/load.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Model, its configuration and the train/evaluate entry points (core.hpp).
//  - Checkpoint save/restore and the JSON run configuration (common/).
//  - IDX dataset loaders for MNIST and FashionMNIST (data/load/).
// Everything is header-only; link against LibTorch.

#endif // TESSEL_LIBRARY_H

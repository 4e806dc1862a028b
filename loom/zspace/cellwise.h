/* Copyright 2025 The Loom Authors.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#ifndef LOOM_ZSPACE_CELLWISE_H_
#define LOOM_ZSPACE_CELLWISE_H_

#include <cstdint>

#include "llvm/ADT/STLFunctionalExtras.h"
#include "loom/zspace/ztensor.h"

namespace loom {
namespace cellwise {

using UnaryFn = llvm::function_ref<int64_t(int64_t)>;
using BinaryFn = llvm::function_ref<int64_t(int64_t, int64_t)>;

// Applies `fn` to every cell of `tensor`.
ZTensor mapCells(const ZTensor& tensor, UnaryFn fn);

// Applies `fn` to every pair of cells of `lhs` and `rhs` broadcast to their
// common shape (see `commonBroadcastShape`).
ZTensor zipCells(const ZTensor& lhs, const ZTensor& rhs, BinaryFn fn);

// Like `zipCells`, but writes the result into `lhs`. The common broadcast
// shape must be the shape of `lhs`.
void zipCellsInPlace(ZTensor& lhs, const ZTensor& rhs, BinaryFn fn);

ZTensor neg(const ZTensor& tensor);
ZTensor abs(const ZTensor& tensor);

ZTensor add(const ZTensor& lhs, const ZTensor& rhs);
ZTensor add(const ZTensor& lhs, int64_t rhs);
ZTensor sub(const ZTensor& lhs, const ZTensor& rhs);
ZTensor sub(const ZTensor& lhs, int64_t rhs);
ZTensor mul(const ZTensor& lhs, const ZTensor& rhs);
ZTensor mul(const ZTensor& lhs, int64_t rhs);

// Truncating integer division and remainder. Dies on division by zero.
ZTensor div(const ZTensor& lhs, const ZTensor& rhs);
ZTensor div(const ZTensor& lhs, int64_t rhs);
ZTensor mod(const ZTensor& lhs, const ZTensor& rhs);
ZTensor mod(const ZTensor& lhs, int64_t rhs);

// Cell-wise `intPow(lhs, rhs)`.
ZTensor pow(const ZTensor& lhs, const ZTensor& rhs);
ZTensor pow(const ZTensor& lhs, int64_t rhs);

// Cell-wise `intLog(lhs, rhs)`.
ZTensor log(const ZTensor& lhs, const ZTensor& rhs);
ZTensor log(const ZTensor& lhs, int64_t rhs);

ZTensor minimum(const ZTensor& lhs, const ZTensor& rhs);
ZTensor minimum(const ZTensor& lhs, int64_t rhs);
ZTensor maximum(const ZTensor& lhs, const ZTensor& rhs);
ZTensor maximum(const ZTensor& lhs, int64_t rhs);

void negInPlace(ZTensor& tensor);
void absInPlace(ZTensor& tensor);
void addInPlace(ZTensor& lhs, const ZTensor& rhs);
void addInPlace(ZTensor& lhs, int64_t rhs);
void subInPlace(ZTensor& lhs, const ZTensor& rhs);
void subInPlace(ZTensor& lhs, int64_t rhs);
void mulInPlace(ZTensor& lhs, const ZTensor& rhs);
void mulInPlace(ZTensor& lhs, int64_t rhs);
void divInPlace(ZTensor& lhs, const ZTensor& rhs);
void divInPlace(ZTensor& lhs, int64_t rhs);
void modInPlace(ZTensor& lhs, const ZTensor& rhs);
void modInPlace(ZTensor& lhs, int64_t rhs);
void powInPlace(ZTensor& lhs, const ZTensor& rhs);
void powInPlace(ZTensor& lhs, int64_t rhs);
void logInPlace(ZTensor& lhs, const ZTensor& rhs);
void logInPlace(ZTensor& lhs, int64_t rhs);
void minimumInPlace(ZTensor& lhs, const ZTensor& rhs);
void minimumInPlace(ZTensor& lhs, int64_t rhs);
void maximumInPlace(ZTensor& lhs, const ZTensor& rhs);
void maximumInPlace(ZTensor& lhs, int64_t rhs);

// Returns true if `pred` holds for every pair of broadcast cells.
bool allCells(const ZTensor& lhs, const ZTensor& rhs,
              llvm::function_ref<bool(int64_t, int64_t)> pred);

}  // namespace cellwise
}  // namespace loom

#endif  // LOOM_ZSPACE_CELLWISE_H_

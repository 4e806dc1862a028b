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

#ifndef LOOM_ZSPACE_INDEXING_H_
#define LOOM_ZSPACE_INDEXING_H_

#include <cstdint>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"

namespace loom {

// Shape (or any per-axis vector) of small rank.
using DimVector = llvm::SmallVector<int64_t, 4>;

// Returns `base` raised to `exp`, using exponentiation by squaring.
//
// Requires `exp >= 0`. Dies if the result doesn't fit in an int64_t.
int64_t intPow(int64_t base, int64_t exp);

// Returns the largest `k` such that `base^k <= value`.
//
// Requires `value > 0` and `base > 1`.
int64_t intLog(int64_t value, int64_t base);

// Resolves a possibly negative index against a container of the given size,
// so that -1 refers to the last element.
//
// Dies if the resolved index is not in `[0, size)`.
int64_t resolveIndex(int64_t index, int64_t size);

// Like `resolveIndex`, for a dimension of a tensor of rank `rank`.
int64_t resolveDim(int64_t dim, int64_t rank);

// Resolves each entry of `permutation` and validates that the result is a
// permutation of `[0, rank)`.
DimVector resolvePermutation(llvm::ArrayRef<int64_t> permutation,
                             int64_t rank);

// Returns `values` reordered so that `result[i] = values[permutation[i]]`.
DimVector applyPermutation(llvm::ArrayRef<int64_t> values,
                           llvm::ArrayRef<int64_t> permutation);

// Returns true if all `shapes` can be broadcast to a common shape.
bool areBroadcastCompatible(llvm::ArrayRef<DimVector> shapes);

// Returns the shape all of `shapes` broadcast to.
//
// Shapes are right-aligned; along each axis the sizes must be equal, or one of
// them must be 1 or absent. Dies on incompatible shapes.
DimVector commonBroadcastShape(llvm::ArrayRef<DimVector> shapes);

// Returns the number of elements of a tensor with the given shape. A rank-0
// shape has a single element.
int64_t shapeToSize(llvm::ArrayRef<int64_t> shape);

// Returns the row-major strides of the given shape.
DimVector shapeToStrides(llvm::ArrayRef<int64_t> shape);

}  // namespace loom

#endif  // LOOM_ZSPACE_INDEXING_H_

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

#include "loom/zspace/indexing.h"

#include <algorithm>
#include <cstdint>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/BitVector.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/MathExtras.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/common/logging.h"

namespace loom {

namespace {

// `base^exp` for a positive base, clamped to UINT64_MAX on overflow.
uint64_t saturatingPow(uint64_t base, uint64_t exp) {
  uint64_t result = 1;
  for (uint64_t i = 0; i < exp; ++i) {
    bool overflowed = false;
    result = llvm::SaturatingMultiply(result, base, &overflowed);
    if (overflowed) {
      break;
    }
  }
  return result;
}

}  // namespace

int64_t intPow(int64_t base, int64_t exp) {
  LOOM_CHECK_GE(exp, 0) << "intPow requires a non-negative exponent";
  int64_t original = base;
  int64_t originalExp = exp;
  int64_t result = 1;
  while (exp > 0) {
    bool overflowed = false;
    if (exp & 1) {
      overflowed |= llvm::MulOverflow(result, base, result);
    }
    exp >>= 1;
    if (exp > 0) {
      overflowed |= llvm::MulOverflow(base, base, base);
    }
    LOOM_CHECK(!overflowed)
        << "intPow(" << original << ", " << originalExp
        << ") overflows int64_t";
  }
  return result;
}

int64_t intLog(int64_t value, int64_t base) {
  LOOM_CHECK_GT(base, 1) << "intLog requires a base greater than 1";
  LOOM_CHECK_GT(value, 0) << "intLog requires a positive value";
  // base >= 2, so the answer is at most log2(value).
  int64_t lo = 0;
  int64_t hi = llvm::Log2_64(static_cast<uint64_t>(value));
  while (lo < hi) {
    int64_t mid = lo + (hi - lo + 1) / 2;
    if (saturatingPow(base, mid) <= static_cast<uint64_t>(value)) {
      lo = mid;
    } else {
      hi = mid - 1;
    }
  }
  return lo;
}

int64_t resolveIndex(int64_t index, int64_t size) {
  int64_t resolved = index < 0 ? size + index : index;
  LOOM_CHECK(resolved >= 0 && resolved < size)
      << "index " << index << " out of range for size " << size;
  return resolved;
}

int64_t resolveDim(int64_t dim, int64_t rank) {
  return resolveIndex(dim, rank);
}

DimVector resolvePermutation(llvm::ArrayRef<int64_t> permutation,
                             int64_t rank) {
  LOOM_CHECK_EQ(static_cast<int64_t>(permutation.size()), rank)
      << "permutation has the wrong length";
  DimVector result;
  result.reserve(rank);
  llvm::BitVector seen(rank);
  int64_t sum = 0;
  for (int64_t dim : permutation) {
    int64_t resolved = resolveDim(dim, rank);
    LOOM_CHECK(!seen.test(resolved)) << "duplicate permutation entry " << dim;
    seen.set(resolved);
    sum += resolved;
    result.push_back(resolved);
  }
  LOOM_CHECK_EQ(sum, rank * (rank - 1) / 2) << "invalid permutation";
  return result;
}

DimVector applyPermutation(llvm::ArrayRef<int64_t> values,
                           llvm::ArrayRef<int64_t> permutation) {
  DimVector perm = resolvePermutation(
      permutation, static_cast<int64_t>(values.size()));
  DimVector result;
  result.reserve(values.size());
  for (int64_t dim : perm) {
    result.push_back(values[dim]);
  }
  return result;
}

namespace {

// Broadcasts `shapes` into `result`; returns false on incompatible axes.
bool broadcastShapes(llvm::ArrayRef<DimVector> shapes, DimVector& result) {
  size_t rank = 0;
  for (const DimVector& shape : shapes) {
    rank = std::max(rank, shape.size());
  }
  // -1 marks an axis no shape has set yet.
  result.assign(rank, -1);
  for (const DimVector& shape : shapes) {
    size_t offset = rank - shape.size();
    for (size_t i = 0; i < shape.size(); ++i) {
      int64_t dim = shape[i];
      int64_t& current = result[offset + i];
      if (current == -1 || current == 1) {
        current = dim;
      } else if (dim != 1 && dim != current) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace

bool areBroadcastCompatible(llvm::ArrayRef<DimVector> shapes) {
  DimVector result;
  return broadcastShapes(shapes, result);
}

DimVector commonBroadcastShape(llvm::ArrayRef<DimVector> shapes) {
  DimVector result;
  if (!broadcastShapes(shapes, result)) {
    std::string shapesStr;
    llvm::raw_string_ostream os(shapesStr);
    for (const DimVector& shape : shapes) {
      os << " [";
      llvm::interleaveComma(shape, os);
      os << "]";
    }
    LOOM_LOG(FATAL) << "cannot broadcast shapes:" << os.str();
  }
  return result;
}

int64_t shapeToSize(llvm::ArrayRef<int64_t> shape) {
  int64_t size = 1;
  for (int64_t dim : shape) {
    size *= dim;
  }
  return size;
}

DimVector shapeToStrides(llvm::ArrayRef<int64_t> shape) {
  DimVector strides(shape.size(), 1);
  for (int64_t i = static_cast<int64_t>(shape.size()) - 2; i >= 0; --i) {
    strides[i] = strides[i + 1] * shape[i + 1];
  }
  return strides;
}

}  // namespace loom

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

#ifndef LOOM_ZSPACE_ZTENSOR_H_
#define LOOM_ZSPACE_ZTENSOR_H_

#include <cstdint>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/zspace/indexing.h"

namespace loom {

// A dense, row-major tensor of 64-bit integers.
//
// ZTensor is the carrier for the matrices of affine maps and for the
// broadcasting arithmetic in `cellwise.h`. A default constructed tensor is the
// rank-0 scalar 0.
class ZTensor {
 public:
  ZTensor();

  // Creates a tensor with the given shape and row-major `data`.
  //
  // Dies if `data` doesn't have exactly `shapeToSize(shape)` elements, or if
  // any dimension is negative.
  ZTensor(llvm::ArrayRef<int64_t> shape, llvm::ArrayRef<int64_t> data);

  static ZTensor scalar(int64_t value);
  static ZTensor vector(llvm::ArrayRef<int64_t> values);

  // Creates a rank-2 tensor from `rows`, which must all have the same length.
  // A matrix with no rows has shape `[0, 0]`.
  static ZTensor matrix(llvm::ArrayRef<DimVector> rows);

  static ZTensor zeros(llvm::ArrayRef<int64_t> shape);
  static ZTensor full(llvm::ArrayRef<int64_t> shape, int64_t value);

  llvm::ArrayRef<int64_t> getShape() const { return shape; }
  int64_t getRank() const { return shape.size(); }
  int64_t getSize() const { return data.size(); }
  bool isScalar() const { return shape.empty(); }

  // Returns the size of `dim`, which may be negative.
  int64_t getDimSize(int64_t dim) const;

  llvm::ArrayRef<int64_t> getData() const { return data; }
  llvm::MutableArrayRef<int64_t> getMutableData() { return data; }

  int64_t get(llvm::ArrayRef<int64_t> index) const;
  void set(llvm::ArrayRef<int64_t> index, int64_t value);

  // Returns the single element of a tensor with exactly one element.
  int64_t item() const;

  // Returns a copy of this tensor with the slices along `dim` reordered, so
  // that slice `i` of the result is slice `permutation[i]` of this tensor.
  ZTensor reorderDim(llvm::ArrayRef<int64_t> permutation, int64_t dim) const;

  bool operator==(const ZTensor& other) const {
    return shape == other.shape && data == other.data;
  }
  bool operator!=(const ZTensor& other) const { return !(*this == other); }

  // Prints the tensor as nested brackets, e.g. `[[1, 0], [0, 1]]`.
  void print(llvm::raw_ostream& os) const;
  std::string toString() const;

 private:
  int64_t flatIndex(llvm::ArrayRef<int64_t> index) const;

  DimVector shape;
  llvm::SmallVector<int64_t, 8> data;
};

// Matrix product of a rank-2 `lhs` with a rank-1 or rank-2 `rhs`.
ZTensor matmul(const ZTensor& lhs, const ZTensor& rhs);

inline llvm::raw_ostream& operator<<(llvm::raw_ostream& os,
                                     const ZTensor& tensor) {
  tensor.print(os);
  return os;
}

}  // namespace loom

#endif  // LOOM_ZSPACE_ZTENSOR_H_

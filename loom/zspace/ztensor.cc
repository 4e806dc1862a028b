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

#include "loom/zspace/ztensor.h"

#include <cstdint>
#include <functional>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/common/logging.h"
#include "loom/zspace/indexing.h"

namespace loom {

ZTensor::ZTensor() : data(1, 0) {}

ZTensor::ZTensor(llvm::ArrayRef<int64_t> shape, llvm::ArrayRef<int64_t> data)
    : shape(shape.begin(), shape.end()), data(data.begin(), data.end()) {
  LOOM_CHECK(llvm::all_of(shape, [](int64_t dim) { return dim >= 0; }))
      << "negative dimension in tensor shape";
  LOOM_CHECK_EQ(shapeToSize(shape), static_cast<int64_t>(data.size()))
      << "tensor data doesn't match its shape";
}

ZTensor ZTensor::scalar(int64_t value) { return ZTensor({}, {value}); }

ZTensor ZTensor::vector(llvm::ArrayRef<int64_t> values) {
  return ZTensor({static_cast<int64_t>(values.size())}, values);
}

ZTensor ZTensor::matrix(llvm::ArrayRef<DimVector> rows) {
  int64_t numCols = rows.empty() ? 0 : rows.front().size();
  llvm::SmallVector<int64_t, 8> flat;
  flat.reserve(rows.size() * numCols);
  for (const DimVector& row : rows) {
    LOOM_CHECK_EQ(static_cast<int64_t>(row.size()), numCols)
        << "matrix rows have different lengths";
    flat.append(row.begin(), row.end());
  }
  return ZTensor({static_cast<int64_t>(rows.size()), numCols}, flat);
}

ZTensor ZTensor::zeros(llvm::ArrayRef<int64_t> shape) {
  return full(shape, 0);
}

ZTensor ZTensor::full(llvm::ArrayRef<int64_t> shape, int64_t value) {
  llvm::SmallVector<int64_t, 8> values(shapeToSize(shape), value);
  return ZTensor(shape, values);
}

int64_t ZTensor::getDimSize(int64_t dim) const {
  return shape[resolveDim(dim, getRank())];
}

int64_t ZTensor::flatIndex(llvm::ArrayRef<int64_t> index) const {
  LOOM_CHECK_EQ(static_cast<int64_t>(index.size()), getRank())
      << "index rank doesn't match tensor rank";
  int64_t flat = 0;
  for (size_t i = 0; i < index.size(); ++i) {
    flat = flat * shape[i] + resolveIndex(index[i], shape[i]);
  }
  return flat;
}

int64_t ZTensor::get(llvm::ArrayRef<int64_t> index) const {
  return data[flatIndex(index)];
}

void ZTensor::set(llvm::ArrayRef<int64_t> index, int64_t value) {
  data[flatIndex(index)] = value;
}

int64_t ZTensor::item() const {
  LOOM_CHECK_EQ(getSize(), 1) << "item() requires a single element tensor";
  return data.front();
}

ZTensor ZTensor::reorderDim(llvm::ArrayRef<int64_t> permutation,
                            int64_t dim) const {
  int64_t resolvedDim = resolveDim(dim, getRank());
  DimVector perm = resolvePermutation(permutation, shape[resolvedDim]);

  // View the data as [outer, dimSize, inner] and permute the middle axis.
  llvm::ArrayRef<int64_t> dims = shape;
  int64_t outer = shapeToSize(dims.take_front(resolvedDim));
  int64_t inner = shapeToSize(dims.drop_front(resolvedDim + 1));
  int64_t dimSize = shape[resolvedDim];

  llvm::SmallVector<int64_t, 8> result;
  result.reserve(data.size());
  for (int64_t o = 0; o < outer; ++o) {
    for (int64_t source : perm) {
      auto begin = data.begin() + (o * dimSize + source) * inner;
      result.append(begin, begin + inner);
    }
  }
  return ZTensor(shape, result);
}

void ZTensor::print(llvm::raw_ostream& os) const {
  if (isScalar()) {
    os << data.front();
    return;
  }
  DimVector strides = shapeToStrides(shape);
  // Recursively prints the sub-tensor at `offset` starting at axis `dim`.
  std::function<void(int64_t, int64_t)> printDim = [&](int64_t dim,
                                                       int64_t offset) {
    os << "[";
    for (int64_t i = 0; i < shape[dim]; ++i) {
      if (i > 0) {
        os << ", ";
      }
      if (dim + 1 == getRank()) {
        os << data[offset + i];
      } else {
        printDim(dim + 1, offset + i * strides[dim]);
      }
    }
    os << "]";
  };
  printDim(0, 0);
}

std::string ZTensor::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

ZTensor matmul(const ZTensor& lhs, const ZTensor& rhs) {
  LOOM_CHECK_EQ(lhs.getRank(), 2) << "matmul lhs must be a matrix";
  LOOM_CHECK(rhs.getRank() == 1 || rhs.getRank() == 2)
      << "matmul rhs must be a vector or a matrix";
  int64_t rows = lhs.getDimSize(0);
  int64_t inner = lhs.getDimSize(1);
  LOOM_CHECK_EQ(rhs.getDimSize(0), inner) << "matmul inner dimension mismatch";
  int64_t cols = rhs.getRank() == 1 ? 1 : rhs.getDimSize(1);

  llvm::ArrayRef<int64_t> a = lhs.getData();
  llvm::ArrayRef<int64_t> b = rhs.getData();
  llvm::SmallVector<int64_t, 8> result(rows * cols, 0);
  for (int64_t i = 0; i < rows; ++i) {
    for (int64_t k = 0; k < inner; ++k) {
      int64_t coefficient = a[i * inner + k];
      for (int64_t j = 0; j < cols; ++j) {
        result[i * cols + j] += coefficient * b[k * cols + j];
      }
    }
  }
  if (rhs.getRank() == 1) {
    return ZTensor({rows}, result);
  }
  return ZTensor({rows, cols}, result);
}

}  // namespace loom

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

#include "loom/zspace/cellwise.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "loom/common/logging.h"
#include "loom/zspace/indexing.h"
#include "loom/zspace/ztensor.h"

namespace loom {
namespace cellwise {

namespace {

// Strides of `shape` right-aligned into `targetShape`, with a zero stride on
// every broadcast axis.
DimVector broadcastStrides(llvm::ArrayRef<int64_t> shape,
                           llvm::ArrayRef<int64_t> targetShape) {
  DimVector strides = shapeToStrides(shape);
  DimVector result(targetShape.size(), 0);
  size_t offset = targetShape.size() - shape.size();
  for (size_t i = 0; i < shape.size(); ++i) {
    if (shape[i] != 1) {
      result[offset + i] = strides[i];
    }
  }
  return result;
}

// Calls `fn(outIndex, lhsIndex, rhsIndex)` for every cell of `shape`.
void forEachBroadcastCell(
    llvm::ArrayRef<int64_t> shape, llvm::ArrayRef<int64_t> lhsShape,
    llvm::ArrayRef<int64_t> rhsShape,
    llvm::function_ref<void(int64_t, int64_t, int64_t)> fn) {
  int64_t size = shapeToSize(shape);
  if (size == 0) {
    return;
  }
  DimVector lhsStrides = broadcastStrides(lhsShape, shape);
  DimVector rhsStrides = broadcastStrides(rhsShape, shape);
  DimVector coords(shape.size(), 0);
  int64_t lhsIndex = 0;
  int64_t rhsIndex = 0;
  for (int64_t out = 0; out < size; ++out) {
    fn(out, lhsIndex, rhsIndex);
    // Odometer increment of `coords`, keeping both operand offsets in sync.
    for (int64_t dim = static_cast<int64_t>(shape.size()) - 1; dim >= 0;
         --dim) {
      if (++coords[dim] < shape[dim]) {
        lhsIndex += lhsStrides[dim];
        rhsIndex += rhsStrides[dim];
        break;
      }
      lhsIndex -= lhsStrides[dim] * (shape[dim] - 1);
      rhsIndex -= rhsStrides[dim] * (shape[dim] - 1);
      coords[dim] = 0;
    }
  }
}

DimVector zipShape(const ZTensor& lhs, const ZTensor& rhs) {
  return commonBroadcastShape(
      {DimVector(lhs.getShape().begin(), lhs.getShape().end()),
       DimVector(rhs.getShape().begin(), rhs.getShape().end())});
}

int64_t checkedDiv(int64_t lhs, int64_t rhs) {
  LOOM_CHECK_NE(rhs, 0) << "division by zero";
  return lhs / rhs;
}

int64_t checkedMod(int64_t lhs, int64_t rhs) {
  LOOM_CHECK_NE(rhs, 0) << "division by zero";
  return lhs % rhs;
}

int64_t addFn(int64_t lhs, int64_t rhs) { return lhs + rhs; }
int64_t subFn(int64_t lhs, int64_t rhs) { return lhs - rhs; }
int64_t mulFn(int64_t lhs, int64_t rhs) { return lhs * rhs; }
int64_t minFn(int64_t lhs, int64_t rhs) { return std::min(lhs, rhs); }
int64_t maxFn(int64_t lhs, int64_t rhs) { return std::max(lhs, rhs); }

}  // namespace

ZTensor mapCells(const ZTensor& tensor, UnaryFn fn) {
  ZTensor result = tensor;
  for (int64_t& value : result.getMutableData()) {
    value = fn(value);
  }
  return result;
}

ZTensor zipCells(const ZTensor& lhs, const ZTensor& rhs, BinaryFn fn) {
  DimVector shape = zipShape(lhs, rhs);
  ZTensor result = ZTensor::zeros(shape);
  llvm::ArrayRef<int64_t> lhsData = lhs.getData();
  llvm::ArrayRef<int64_t> rhsData = rhs.getData();
  llvm::MutableArrayRef<int64_t> out = result.getMutableData();
  forEachBroadcastCell(shape, lhs.getShape(), rhs.getShape(),
                       [&](int64_t o, int64_t l, int64_t r) {
                         out[o] = fn(lhsData[l], rhsData[r]);
                       });
  return result;
}

void zipCellsInPlace(ZTensor& lhs, const ZTensor& rhs, BinaryFn fn) {
  DimVector shape = zipShape(lhs, rhs);
  LOOM_CHECK(llvm::ArrayRef<int64_t>(shape) == lhs.getShape())
      << "in-place operation would change the shape of its destination";
  llvm::ArrayRef<int64_t> rhsData = rhs.getData();
  llvm::MutableArrayRef<int64_t> out = lhs.getMutableData();
  forEachBroadcastCell(shape, lhs.getShape(), rhs.getShape(),
                       [&](int64_t o, int64_t l, int64_t r) {
                         out[o] = fn(out[l], rhsData[r]);
                       });
}

bool allCells(const ZTensor& lhs, const ZTensor& rhs,
              llvm::function_ref<bool(int64_t, int64_t)> pred) {
  DimVector shape = zipShape(lhs, rhs);
  llvm::ArrayRef<int64_t> lhsData = lhs.getData();
  llvm::ArrayRef<int64_t> rhsData = rhs.getData();
  bool result = true;
  forEachBroadcastCell(shape, lhs.getShape(), rhs.getShape(),
                       [&](int64_t, int64_t l, int64_t r) {
                         result = result && pred(lhsData[l], rhsData[r]);
                       });
  return result;
}

ZTensor neg(const ZTensor& tensor) {
  return mapCells(tensor, [](int64_t value) { return -value; });
}

ZTensor abs(const ZTensor& tensor) {
  return mapCells(tensor, [](int64_t value) { return std::abs(value); });
}

ZTensor add(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, addFn);
}
ZTensor add(const ZTensor& lhs, int64_t rhs) {
  return add(lhs, ZTensor::scalar(rhs));
}

ZTensor sub(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, subFn);
}
ZTensor sub(const ZTensor& lhs, int64_t rhs) {
  return sub(lhs, ZTensor::scalar(rhs));
}

ZTensor mul(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, mulFn);
}
ZTensor mul(const ZTensor& lhs, int64_t rhs) {
  return mul(lhs, ZTensor::scalar(rhs));
}

ZTensor div(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, checkedDiv);
}
ZTensor div(const ZTensor& lhs, int64_t rhs) {
  return div(lhs, ZTensor::scalar(rhs));
}

ZTensor mod(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, checkedMod);
}
ZTensor mod(const ZTensor& lhs, int64_t rhs) {
  return mod(lhs, ZTensor::scalar(rhs));
}

ZTensor pow(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, intPow);
}
ZTensor pow(const ZTensor& lhs, int64_t rhs) {
  return pow(lhs, ZTensor::scalar(rhs));
}

ZTensor log(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, intLog);
}
ZTensor log(const ZTensor& lhs, int64_t rhs) {
  return log(lhs, ZTensor::scalar(rhs));
}

ZTensor minimum(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, minFn);
}
ZTensor minimum(const ZTensor& lhs, int64_t rhs) {
  return minimum(lhs, ZTensor::scalar(rhs));
}

ZTensor maximum(const ZTensor& lhs, const ZTensor& rhs) {
  return zipCells(lhs, rhs, maxFn);
}
ZTensor maximum(const ZTensor& lhs, int64_t rhs) {
  return maximum(lhs, ZTensor::scalar(rhs));
}

void negInPlace(ZTensor& tensor) {
  for (int64_t& value : tensor.getMutableData()) {
    value = -value;
  }
}

void absInPlace(ZTensor& tensor) {
  for (int64_t& value : tensor.getMutableData()) {
    value = std::abs(value);
  }
}

void addInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, addFn);
}
void addInPlace(ZTensor& lhs, int64_t rhs) {
  addInPlace(lhs, ZTensor::scalar(rhs));
}

void subInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, subFn);
}
void subInPlace(ZTensor& lhs, int64_t rhs) {
  subInPlace(lhs, ZTensor::scalar(rhs));
}

void mulInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, mulFn);
}
void mulInPlace(ZTensor& lhs, int64_t rhs) {
  mulInPlace(lhs, ZTensor::scalar(rhs));
}

void divInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, checkedDiv);
}
void divInPlace(ZTensor& lhs, int64_t rhs) {
  divInPlace(lhs, ZTensor::scalar(rhs));
}

void modInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, checkedMod);
}
void modInPlace(ZTensor& lhs, int64_t rhs) {
  modInPlace(lhs, ZTensor::scalar(rhs));
}

void powInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, intPow);
}
void powInPlace(ZTensor& lhs, int64_t rhs) {
  powInPlace(lhs, ZTensor::scalar(rhs));
}

void logInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, intLog);
}
void logInPlace(ZTensor& lhs, int64_t rhs) {
  logInPlace(lhs, ZTensor::scalar(rhs));
}

void minimumInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, minFn);
}
void minimumInPlace(ZTensor& lhs, int64_t rhs) {
  minimumInPlace(lhs, ZTensor::scalar(rhs));
}

void maximumInPlace(ZTensor& lhs, const ZTensor& rhs) {
  zipCellsInPlace(lhs, rhs, maxFn);
}
void maximumInPlace(ZTensor& lhs, int64_t rhs) {
  maximumInPlace(lhs, ZTensor::scalar(rhs));
}

}  // namespace cellwise
}  // namespace loom

// Copyright 2022 Ringgaard Research ApS
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BULKLOAD_LOADER_REDUCER_H_
#define BULKLOAD_LOADER_REDUCER_H_

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/shuffler.h"
#include "bulkload/loader/state.h"

namespace bulkload {

// The reducer turns batches of map entries into posting lists and writes
// each batch as a segment of its output store. Segments are written by a pool
// of writer threads, and the number of pending segment writes is throttled.
class Reducer {
 public:
  Reducer(LoaderState *state, BatchQueue *input);

  // Reduce batches until the input queue is closed. Returns the first error.
  // After an error the remaining batches are discarded.
  Status Run();

  // Build posting lists for the batch and write them as a segment.
  Status Reduce(ShuffleBatch *batch);

 private:
  // Shared loader state.
  LoaderState *state_;

  // Input queue.
  BatchQueue *input_;
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_REDUCER_H_

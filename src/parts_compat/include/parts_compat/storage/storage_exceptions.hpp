// Copyright 2026 mfaferek93
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

#pragma once

#include <stdexcept>
#include <string>

namespace parts_compat {

/// Generic backend failure (I/O, SQL error, failed transaction)
class StorageException : public std::runtime_error {
 public:
  explicit StorageException(const std::string & message) : std::runtime_error(message) {
  }
};

/// Exception thrown when an insert violates a unique constraint
class UniqueViolationException : public StorageException {
 public:
  explicit UniqueViolationException(const std::string & constraint)
    : StorageException("Unique constraint violated: " + constraint), constraint_(constraint) {
  }

  const std::string & constraint() const noexcept {
    return constraint_;
  }

 private:
  std::string constraint_;
};

/// Exception thrown when a backend observes a fired cancellation token mid-query
class QueryCancelledException : public StorageException {
 public:
  QueryCancelledException() : StorageException("Query cancelled") {
  }
};

}  // namespace parts_compat

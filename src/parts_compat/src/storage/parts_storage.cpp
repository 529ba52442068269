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

#include "parts_compat/storage/parts_storage.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace parts_compat {

std::string generate_uuid() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;

  uint64_t high = dist(gen);
  uint64_t low = dist(gen);

  // Version 4 (random) and RFC 4122 variant bits
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  oss << std::setw(8) << static_cast<uint32_t>(high >> 32) << '-';
  oss << std::setw(4) << static_cast<uint32_t>((high >> 16) & 0xFFFF) << '-';
  oss << std::setw(4) << static_cast<uint32_t>(high & 0xFFFF) << '-';
  oss << std::setw(4) << static_cast<uint32_t>(low >> 48) << '-';
  oss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
  return oss.str();
}

}  // namespace parts_compat

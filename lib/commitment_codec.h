// Copyright 2025 Fidesinnova.
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
#include "scheme.h"
#include "table_commitment.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace commit_utility {

using ordered_json = nlohmann::ordered_json;

using AnyTableCommitment = std::variant<
    TableCommitment<RistrettoCommitment>,
    TableCommitment<DoryCommitment>,
    TableCommitment<DynamicDoryCommitment>>;

// One row per scheme. decode throws PostcardError on malformed input;
// render expects the alternative its own decode produced.
struct SchemeCodec {
    Scheme scheme;
    AnyTableCommitment (*decode)(const std::vector<uint8_t>& bytes);
    ordered_json (*render)(const AnyTableCommitment& value);
};

const SchemeCodec& codecFor(Scheme scheme);

struct RenderOptions {
    bool digest = false;   // add input length and SHA-256
};

// Decode bytes under the scheme and pretty-print the result.
// Throws CommitUtilityException(DeserializationError) if the bytes do not
// decode; nothing is rendered in that case.
std::string decodeAndRender(Scheme scheme, const std::vector<uint8_t>& bytes,
                            const RenderOptions& opts = RenderOptions());

// Lowercase hex SHA-256 of the bytes (OpenSSL EVP).
std::string sha256Hex(const std::vector<uint8_t>& bytes);

std::string i128ToString(i128 v);

} // namespace commit_utility

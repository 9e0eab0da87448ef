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

#include "commit_error.h"
#include <utility>

namespace commit_utility {

namespace {

struct Describer {
    std::string operator()(const OpenInputFile& e) const {
        return "Failed to open input file '" + e.filename + "'";
    }
    std::string operator()(const ReadInputFile& e) const {
        return "Failed to read from input file '" + e.filename + "'";
    }
    std::string operator()(const ReadStdin&) const {
        return "Failed to read from stdin";
    }
    std::string operator()(const CreateOutputFile& e) const {
        return "Failed to create output file '" + e.filename + "'";
    }
    std::string operator()(const WriteOutputFile& e) const {
        return "Failed to write to output file '" + e.filename + "'";
    }
    std::string operator()(const WriteStdout&) const {
        return "Failed to write to stdout";
    }
    std::string operator()(const DeserializationError&) const {
        return "Failed to deserialize commitment";
    }
    std::string operator()(const UnknownScheme& e) const {
        return "Unknown scheme: '" + e.scheme + "'";
    }
};

} // namespace

std::string describe(const CommitUtilityError& err){
    return std::visit(Describer{}, err);
}

CommitUtilityException::CommitUtilityException(CommitUtilityError err)
    : std::runtime_error(describe(err)), err_(std::move(err)) {}

} // namespace commit_utility

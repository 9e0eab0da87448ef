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
#include <stdexcept>
#include <string>
#include <variant>

namespace commit_utility {

// Failures of the read -> resolve -> decode -> write pipeline.
// Every kind is terminal: the run stops at the first one.
struct OpenInputFile        { std::string filename; };
struct ReadInputFile        { std::string filename; };
struct ReadStdin            {};
struct CreateOutputFile     { std::string filename; };
struct WriteOutputFile      { std::string filename; };
struct WriteStdout          {};
struct DeserializationError {};
struct UnknownScheme        { std::string scheme; };

using CommitUtilityError = std::variant<
    OpenInputFile,
    ReadInputFile,
    ReadStdin,
    CreateOutputFile,
    WriteOutputFile,
    WriteStdout,
    DeserializationError,
    UnknownScheme>;

// Operator-facing message for an error kind.
std::string describe(const CommitUtilityError& err);

class CommitUtilityException : public std::runtime_error {
public:
    explicit CommitUtilityException(CommitUtilityError err);

    const CommitUtilityError& error() const noexcept { return err_; }

private:
    CommitUtilityError err_;
};

} // namespace commit_utility

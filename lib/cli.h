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
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace commit_utility {

struct Options {
    std::optional<std::string> input;    // stdin when absent
    std::optional<std::string> output;   // stdout when absent
    std::string scheme;
    bool digest  = false;
    bool debug   = false;
    bool help    = false;
    bool version = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// args excludes the program name. --help and --version short-circuit the
// --scheme requirement. Throws UsageError.
Options parseArgs(const std::vector<std::string>& args);

std::string usageText();
std::string versionText();

// Read -> resolve -> decode/render -> write. Throws CommitUtilityException
// from the first stage that fails.
void runCommitUtility(const Options& opts);

} // namespace commit_utility

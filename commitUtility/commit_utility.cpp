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

// commit_utility.cpp
//
// Reads a serialized Proof of SQL table commitment from a file or stdin and
// prints it as indented JSON.
//
// USAGE
// -----
//   ./commit_utility --scheme dory -i table.commit
//   cat table.commit | ./commit_utility --scheme ipa -o table.json
//   ./commit_utility --scheme dynamic_dory -i table.commit --digest --debug
//
// Exit status: 0 on success, 1 when any stage fails, 2 on bad arguments.

#include "../lib/cli.h"
#include "../lib/debug_log.h"
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

int main(int argc, char** argv){
    using namespace commit_utility;

    std::vector<std::string> args(argv + 1, argv + argc);
    Options opts;
    try{
        opts = parseArgs(args);
    }catch(const UsageError& e){
        fprintf(stderr, "Error: %s\n\n%s", e.what(), usageText().c_str());
        return 2;
    }

    if(opts.help){
        printf("%s", usageText().c_str());
        return 0;
    }
    if(opts.version){
        printf("%s", versionText().c_str());
        return 0;
    }
    setDebug(opts.debug);

    try{
        runCommitUtility(opts);
    }catch(const std::exception& e){
        // CommitUtilityException carries the operator-facing message in what()
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}

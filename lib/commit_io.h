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
#include <cstdint>
#include <cstdio>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace commit_utility {

// Whole contents of the file, or of stdin when no path is given.
// Throws CommitUtilityException: OpenInputFile, ReadInputFile or ReadStdin.
std::vector<uint8_t> readInput(const std::optional<std::string>& path);

// Read a stream to exhaustion; false on a read error.
bool readStream(std::istream& in, std::vector<uint8_t>& out);
bool readStream(FILE* in, std::vector<uint8_t>& out);

// Write text in one go to the file (created or truncated) or to stdout.
// Throws CommitUtilityException: CreateOutputFile, WriteOutputFile or WriteStdout.
// A file that was created is left in place if the write fails.
void writeOutput(const std::optional<std::string>& path, const std::string& text);

} // namespace commit_utility

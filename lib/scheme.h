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
#include <string>

namespace commit_utility {

enum class Scheme {
    InnerProductArgument,
    Dory,
    DynamicDory,
};

// Case-insensitive lookup in the alias table.
// Throws CommitUtilityException(UnknownScheme{name}) with the name as given.
Scheme resolveScheme(const std::string& name);

// Canonical lowercase name ("ipa", "dory", "dynamic_dory").
const char* schemeName(Scheme scheme);

} // namespace commit_utility

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

#include "scheme.h"
#include "commit_error.h"
#include "debug_log.h"
#include <algorithm>
#include <cctype>

namespace commit_utility {

namespace {

struct SchemeAlias {
    const char* alias;
    Scheme scheme;
};

// Aliases accepted on the command line, already lowercase
const SchemeAlias kSchemeAliases[] = {
    {"dynamic_dory",         Scheme::DynamicDory},
    {"dynamic-dory",         Scheme::DynamicDory},
    {"dory",                 Scheme::Dory},
    {"ipa",                  Scheme::InnerProductArgument},
    {"innerproductargument", Scheme::InnerProductArgument},
};

} // namespace

Scheme resolveScheme(const std::string& name){
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c){ return (char)std::tolower(c); });

    for(const auto& entry : kSchemeAliases){
        if(lowered == entry.alias){
            dbg(std::string("scheme '") + name + "' -> " + schemeName(entry.scheme));
            return entry.scheme;
        }
    }
    throw CommitUtilityException(UnknownScheme{name});
}

const char* schemeName(Scheme scheme){
    switch(scheme){
        case Scheme::InnerProductArgument: return "ipa";
        case Scheme::Dory:                 return "dory";
        case Scheme::DynamicDory:          return "dynamic_dory";
    }
    return "unknown";
}

} // namespace commit_utility

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

#include "cli.h"
#include "commit_io.h"
#include "commitment_codec.h"
#include "debug_log.h"
#include "scheme.h"

#ifndef COMMIT_UTILITY_VERSION
#define COMMIT_UTILITY_VERSION "0.0.0"
#endif

namespace commit_utility {

Options parseArgs(const std::vector<std::string>& args){
    Options opts;
    bool haveScheme = false;
    for(size_t i=0;i<args.size();i++){
        std::string a = args[i];
        // --flag=value spelling
        std::optional<std::string> inlineValue;
        size_t eq = a.find('=');
        if(a.rfind("--", 0)==0 && eq!=std::string::npos){
            inlineValue = a.substr(eq + 1);
            a.resize(eq);
        }
        auto value = [&](const char* flag) -> std::string {
            if(inlineValue) return *inlineValue;
            if(i+1>=args.size()) throw UsageError(std::string("missing value for ") + flag);
            return args[++i];
        };
        auto noValue = [&]{
            if(inlineValue) throw UsageError("'" + a + "' does not take a value");
        };

        if(a=="-i" || a=="--input"){
            opts.input = value(a.c_str());
        }else if(a=="-o" || a=="--output"){
            opts.output = value(a.c_str());
        }else if(a=="--scheme"){
            opts.scheme = value("--scheme");
            haveScheme = true;
        }else if(a=="--digest"){
            noValue();
            opts.digest = true;
        }else if(a=="--debug"){
            noValue();
            opts.debug = true;
        }else if(a=="-h" || a=="--help"){
            noValue();
            opts.help = true;
        }else if(a=="-V" || a=="--version"){
            noValue();
            opts.version = true;
        }else{
            throw UsageError("unknown argument '" + args[i] + "'");
        }
    }
    if(!haveScheme && !opts.help && !opts.version){
        throw UsageError("--scheme <name> is required");
    }
    return opts;
}

std::string usageText(){
    return
        "Deserialize a table commitment and print it in readable form.\n"
        "\n"
        "Usage:\n"
        "  commit_utility --scheme <name> [-i <file>] [-o <file>] [--digest] [--debug]\n"
        "\n"
        "Options:\n"
        "  -i, --input <file>   input file (default: stdin)\n"
        "  -o, --output <file>  output file (default: stdout)\n"
        "      --scheme <name>  ipa | innerproductargument | dory | dynamic_dory | dynamic-dory\n"
        "      --digest         include input size and SHA-256 in the output\n"
        "      --debug          diagnostic messages on stderr\n"
        "  -h, --help           print this help\n"
        "  -V, --version        print version\n";
}

std::string versionText(){
    return std::string("commit_utility ") + COMMIT_UTILITY_VERSION + "\n";
}

void runCommitUtility(const Options& opts){
    std::vector<uint8_t> bytes = readInput(opts.input);
    Scheme scheme = resolveScheme(opts.scheme);
    RenderOptions ro;
    ro.digest = opts.digest;
    std::string text = decodeAndRender(scheme, bytes, ro);
    writeOutput(opts.output, text);
}

} // namespace commit_utility

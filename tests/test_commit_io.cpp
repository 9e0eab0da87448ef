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

#include <gtest/gtest.h>
#include "../lib/commit_error.h"
#include "../lib/commit_io.h"
#include "commitment_fixtures.h"
#include <cstdio>
#include <filesystem>
#include <sstream>

using namespace commit_utility;
using namespace commit_utility::testing_fixtures;

namespace {

template<class Kind, class F>
void expectError(F&& f, const std::string& filename){
    try {
        f();
        FAIL() << "expected CommitUtilityException";
    } catch (const CommitUtilityException& e) {
        ASSERT_TRUE(std::holds_alternative<Kind>(e.error())) << e.what();
        EXPECT_EQ(std::get<Kind>(e.error()).filename, filename);
    }
}

} // namespace

TEST(CommitIoTest, ReadsWholeFile) {
    std::string path = tempPath("io_read.bin");
    std::vector<uint8_t> data(200000);
    for (size_t i = 0; i < data.size(); ++i) data[i] = (uint8_t)(i * 31 + 7);
    writeFile(path, data);

    EXPECT_EQ(readInput(path), data);
    std::remove(path.c_str());
}

TEST(CommitIoTest, EmptyFileIsEmptyInput) {
    std::string path = tempPath("io_empty.bin");
    writeFile(path, {});
    EXPECT_TRUE(readInput(path).empty());
    std::remove(path.c_str());
}

TEST(CommitIoTest, MissingInputFile) {
    std::string path = tempPath("io_does_not_exist.bin");
    std::remove(path.c_str());
    expectError<OpenInputFile>([&]{ readInput(path); }, path);
}

TEST(CommitIoTest, DirectoryAsInputFailsToRead) {
    std::string dir = tempPath("io_dir");
    std::filesystem::create_directories(dir);
    EXPECT_THROW(readInput(dir), CommitUtilityException);
    std::filesystem::remove_all(dir);
}

TEST(CommitIoTest, ReadStreamCollectsEverything) {
    std::istringstream in(std::string("\x00\x01\xff", 3));
    std::vector<uint8_t> out;
    EXPECT_TRUE(readStream(in, out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x00, 0x01, 0xff}));
}

TEST(CommitIoTest, ReadStreamReportsStdioReadError) {
    std::string dir = tempPath("io_stdio_dir");
    std::filesystem::create_directories(dir);
    FILE* f = fopen(dir.c_str(), "rb");
    if (!f) {
        std::filesystem::remove_all(dir);
        GTEST_SKIP() << "directories cannot be opened as streams here";
    }
    std::vector<uint8_t> out;
    EXPECT_FALSE(readStream(f, out));
    EXPECT_TRUE(out.empty());
    fclose(f);
    std::filesystem::remove_all(dir);
}

TEST(CommitIoTest, ReadStreamFromStdioFile) {
    std::string path = tempPath("io_stdio.bin");
    writeFile(path, {0x01, 0x02, 0x03});
    FILE* f = fopen(path.c_str(), "rb");
    ASSERT_NE(f, nullptr);
    std::vector<uint8_t> out;
    EXPECT_TRUE(readStream(f, out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x01, 0x02, 0x03}));
    fclose(f);
    std::remove(path.c_str());
}

TEST(CommitIoTest, WritesAndTruncatesOutputFile) {
    std::string path = tempPath("io_write.txt");
    writeOutput(path, "a much longer first version\n");
    writeOutput(path, "{}\n");
    EXPECT_EQ(readFile(path), "{}\n");
    std::remove(path.c_str());
}

TEST(CommitIoTest, OutputIntoMissingDirectory) {
    std::string path = tempPath("io_no_such_dir") + "/out.txt";
    std::filesystem::remove_all(tempPath("io_no_such_dir"));
    expectError<CreateOutputFile>([&]{ writeOutput(path, "x\n"); }, path);
}

TEST(CommitIoTest, WriteFailureAfterCreate) {
    if (!std::filesystem::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    expectError<WriteOutputFile>([&]{ writeOutput(std::string("/dev/full"), "{}\n"); }, "/dev/full");
}

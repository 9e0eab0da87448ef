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
#include "curve_mcl.hpp"
#include "postcard.h"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace commit_utility {

// ---------------------------- Column metadata ---------------------------------
struct Ident {
    std::string value;
    std::optional<std::string> quoteStyle;   // a single character, UTF-8 encoded

    bool operator==(const Ident& o) const { return value==o.value && quoteStyle==o.quoteStyle; }
};

enum class TimeUnit { Second, Millisecond, Microsecond, Nanosecond };

struct ColumnType {
    enum class Kind {
        Boolean, Uint8, TinyInt, SmallInt, Int, BigInt, Int128,
        Decimal75, VarChar, TimestampTZ, Scalar, VarBinary,
    };
    Kind kind = Kind::Boolean;
    uint8_t precision = 0;   // Decimal75
    int8_t  scale = 0;       // Decimal75
    TimeUnit timeUnit = TimeUnit::Second;   // TimestampTZ
    int32_t  tzOffset = 0;                  // TimestampTZ, seconds east of UTC
};

// Min/max of the committed values of an ordered column type.
// Values of every width are held as 128-bit; kind says which width was read.
struct ColumnBounds {
    enum class Kind { NoOrder, Uint8, TinyInt, SmallInt, Int, BigInt, Int128, TimestampTZ };
    enum class Shape { Empty, Sharp, Bounded };
    Kind kind = Kind::NoOrder;
    Shape shape = Shape::Empty;
    i128 min = 0;
    i128 max = 0;
};

struct ColumnCommitmentMetadata {
    ColumnType columnType;
    ColumnBounds bounds;
};

struct ColumnMetadataEntry {
    Ident ident;
    ColumnCommitmentMetadata metadata;
};

// --------------------------- Commitment elements ------------------------------
struct RistrettoCommitment {
    std::vector<uint8_t> compressed;
    curve::Fe x, y;

    static constexpr size_t kMinEncodedBytes = curve::kRistrettoBytes;
    static RistrettoCommitment read(PostcardReader& r);
};

struct DoryCommitment {
    curve::GT value;

    static constexpr size_t kMinEncodedBytes = 1 + curve::kGTBytes;   // length + element
    static DoryCommitment read(PostcardReader& r);
};

struct DynamicDoryCommitment {
    std::vector<uint8_t> compressed;
    curve::G1 point;

    static constexpr size_t kMinEncodedBytes = 1 + curve::kG1CompressedBytes;
    static DynamicDoryCommitment read(PostcardReader& r);
};

// ---------------------------- Table commitment --------------------------------
template<class C>
struct ColumnCommitments {
    std::vector<C> commitments;
    std::vector<ColumnMetadataEntry> columnMetadata;   // insertion order
};

template<class C>
struct TableCommitment {
    ColumnCommitments<C> columnCommitments;
    uint64_t rangeStart = 0;
    uint64_t rangeEnd = 0;
};

Ident readIdent(PostcardReader& r);
ColumnType readColumnType(PostcardReader& r);
ColumnBounds readColumnBounds(PostcardReader& r);
ColumnCommitmentMetadata readColumnCommitmentMetadata(PostcardReader& r);
std::vector<ColumnMetadataEntry> readColumnMetadataMap(PostcardReader& r);

template<class C>
TableCommitment<C> readTableCommitment(PostcardReader& r){
    TableCommitment<C> tc;
    uint64_t n = r.readLength();
    // a count can never exceed the elements the remaining bytes can hold
    tc.columnCommitments.commitments.reserve((size_t)std::min<uint64_t>(n, r.remaining() / C::kMinEncodedBytes));
    for(uint64_t i=0;i<n;i++){
        tc.columnCommitments.commitments.push_back(C::read(r));
    }
    tc.columnCommitments.columnMetadata = readColumnMetadataMap(r);
    tc.rangeStart = r.readUsize();
    tc.rangeEnd = r.readUsize();
    return tc;
}

} // namespace commit_utility

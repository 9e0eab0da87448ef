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

#include "table_commitment.h"
#include <utility>

namespace commit_utility {

namespace {

constexpr uint8_t kMaxDecimalPrecision = 75;
// empty name, no quote, unit column type, NoOrder
constexpr size_t kMinMetadataEntryBytes = 4;

template<class ReadValue>
void readBounds(PostcardReader& r, ColumnBounds& b, ReadValue readValue){
    uint32_t tag = r.readVariant();
    switch(tag){
        case 0: b.shape = ColumnBounds::Shape::Empty; return;
        case 1: b.shape = ColumnBounds::Shape::Sharp; break;
        case 2: b.shape = ColumnBounds::Shape::Bounded; break;
        default: r.fail("unknown Bounds variant " + std::to_string(tag));
    }
    b.min = readValue();
    b.max = readValue();
}

} // namespace

// --------------------------- Commitment elements ------------------------------
RistrettoCommitment RistrettoCommitment::read(PostcardReader& r){
    RistrettoCommitment c;
    // fixed-size tuple: no length prefix
    c.compressed = r.readFixed(curve::kRistrettoBytes);
    if(!curve::decodeRistretto(c.compressed.data(), c.x, c.y)){
        r.fail("invalid Ristretto255 encoding");
    }
    return c;
}

DoryCommitment DoryCommitment::read(PostcardReader& r){
    DoryCommitment c;
    std::vector<uint8_t> bytes = r.readByteBuf();
    if(!curve::decodeGT(bytes.data(), bytes.size(), c.value)){
        r.fail("invalid GT element (" + std::to_string(bytes.size()) + " bytes)");
    }
    return c;
}

DynamicDoryCommitment DynamicDoryCommitment::read(PostcardReader& r){
    DynamicDoryCommitment c;
    c.compressed = r.readByteBuf();
    if(!curve::decodeG1Compressed(c.compressed.data(), c.compressed.size(), c.point)){
        r.fail("invalid compressed G1 point (" + std::to_string(c.compressed.size()) + " bytes)");
    }
    return c;
}

// ---------------------------- Column metadata ---------------------------------
Ident readIdent(PostcardReader& r){
    Ident id;
    id.value = r.readString();
    if(r.readOptionTag()) id.quoteStyle = r.readChar();
    return id;
}

ColumnType readColumnType(PostcardReader& r){
    using Kind = ColumnType::Kind;
    ColumnType t;
    uint32_t tag = r.readVariant();
    switch(tag){
        case 0:  t.kind = Kind::Boolean; break;
        case 1:  t.kind = Kind::Uint8; break;
        case 2:  t.kind = Kind::TinyInt; break;
        case 3:  t.kind = Kind::SmallInt; break;
        case 4:  t.kind = Kind::Int; break;
        case 5:  t.kind = Kind::BigInt; break;
        case 6:  t.kind = Kind::Int128; break;
        case 7: {
            t.kind = Kind::Decimal75;
            t.precision = r.readU8();
            if(t.precision==0 || t.precision>kMaxDecimalPrecision){
                r.fail("decimal precision " + std::to_string(t.precision) + " out of range");
            }
            t.scale = r.readI8();
            break;
        }
        case 8:  t.kind = Kind::VarChar; break;
        case 9: {
            t.kind = Kind::TimestampTZ;
            uint32_t unit = r.readVariant();
            if(unit>3) r.fail("unknown time unit variant " + std::to_string(unit));
            t.timeUnit = (TimeUnit)unit;
            t.tzOffset = r.readI32();
            break;
        }
        case 10: t.kind = Kind::Scalar; break;
        case 11: t.kind = Kind::VarBinary; break;
        default: r.fail("unknown ColumnType variant " + std::to_string(tag));
    }
    return t;
}

ColumnBounds readColumnBounds(PostcardReader& r){
    using Kind = ColumnBounds::Kind;
    ColumnBounds b;
    uint32_t tag = r.readVariant();
    switch(tag){
        case 0: b.kind = Kind::NoOrder; break;
        case 1: b.kind = Kind::Uint8;       readBounds(r, b, [&]{ return (i128)r.readU8(); }); break;
        case 2: b.kind = Kind::TinyInt;     readBounds(r, b, [&]{ return (i128)r.readI8(); }); break;
        case 3: b.kind = Kind::SmallInt;    readBounds(r, b, [&]{ return (i128)r.readI16(); }); break;
        case 4: b.kind = Kind::Int;         readBounds(r, b, [&]{ return (i128)r.readI32(); }); break;
        case 5: b.kind = Kind::BigInt;      readBounds(r, b, [&]{ return (i128)r.readI64(); }); break;
        case 6: b.kind = Kind::Int128;      readBounds(r, b, [&]{ return r.readI128(); }); break;
        case 7: b.kind = Kind::TimestampTZ; readBounds(r, b, [&]{ return (i128)r.readI64(); }); break;
        default: r.fail("unknown ColumnBounds variant " + std::to_string(tag));
    }
    return b;
}

ColumnCommitmentMetadata readColumnCommitmentMetadata(PostcardReader& r){
    ColumnCommitmentMetadata m;
    m.columnType = readColumnType(r);
    m.bounds = readColumnBounds(r);
    return m;
}

// Insertion-ordered map: a repeated identifier replaces the value in place.
std::vector<ColumnMetadataEntry> readColumnMetadataMap(PostcardReader& r){
    std::vector<ColumnMetadataEntry> entries;
    uint64_t n = r.readLength();
    entries.reserve((size_t)std::min<uint64_t>(n, r.remaining() / kMinMetadataEntryBytes));
    for(uint64_t i=0;i<n;i++){
        Ident id = readIdent(r);
        ColumnCommitmentMetadata meta = readColumnCommitmentMetadata(r);
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const ColumnMetadataEntry& e){ return e.ident==id; });
        if(it!=entries.end()) it->metadata = meta;
        else entries.push_back({std::move(id), meta});
    }
    return entries;
}

} // namespace commit_utility

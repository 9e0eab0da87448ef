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

#include "commitment_codec.h"
#include "commit_error.h"
#include "debug_log.h"
#include <openssl/evp.h>
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace commit_utility {

namespace {

// ----------------------------- Metadata JSON ----------------------------------
const char* columnTypeName(ColumnType::Kind k){
    using Kind = ColumnType::Kind;
    switch(k){
        case Kind::Boolean:     return "Boolean";
        case Kind::Uint8:       return "Uint8";
        case Kind::TinyInt:     return "TinyInt";
        case Kind::SmallInt:    return "SmallInt";
        case Kind::Int:         return "Int";
        case Kind::BigInt:      return "BigInt";
        case Kind::Int128:      return "Int128";
        case Kind::Decimal75:   return "Decimal75";
        case Kind::VarChar:     return "VarChar";
        case Kind::TimestampTZ: return "TimestampTZ";
        case Kind::Scalar:      return "Scalar";
        case Kind::VarBinary:   return "VarBinary";
    }
    return "?";
}

const char* timeUnitName(TimeUnit u){
    switch(u){
        case TimeUnit::Second:      return "Second";
        case TimeUnit::Millisecond: return "Millisecond";
        case TimeUnit::Microsecond: return "Microsecond";
        case TimeUnit::Nanosecond:  return "Nanosecond";
    }
    return "?";
}

const char* boundsKindName(ColumnBounds::Kind k){
    using Kind = ColumnBounds::Kind;
    switch(k){
        case Kind::NoOrder:     return "NoOrder";
        case Kind::Uint8:       return "Uint8";
        case Kind::TinyInt:     return "TinyInt";
        case Kind::SmallInt:    return "SmallInt";
        case Kind::Int:         return "Int";
        case Kind::BigInt:      return "BigInt";
        case Kind::Int128:      return "Int128";
        case Kind::TimestampTZ: return "TimestampTZ";
    }
    return "?";
}

ordered_json identJson(const Ident& id){
    ordered_json j;
    j["value"] = id.value;
    j["quote_style"] = id.quoteStyle ? ordered_json(*id.quoteStyle) : ordered_json(nullptr);
    return j;
}

ordered_json columnTypeJson(const ColumnType& t){
    if(t.kind==ColumnType::Kind::Decimal75){
        ordered_json inner;
        inner["precision"] = t.precision;
        inner["scale"] = t.scale;
        return ordered_json{{"Decimal75", inner}};
    }
    if(t.kind==ColumnType::Kind::TimestampTZ){
        ordered_json inner;
        inner["time_unit"] = timeUnitName(t.timeUnit);
        inner["time_zone"] = ordered_json{{"offset", t.tzOffset}};
        return ordered_json{{"TimestampTZ", inner}};
    }
    return columnTypeName(t.kind);
}

// 128-bit bounds do not fit a JSON number
ordered_json boundValueJson(ColumnBounds::Kind k, i128 v){
    if(k==ColumnBounds::Kind::Int128) return i128ToString(v);
    return (int64_t)v;
}

ordered_json boundsJson(const ColumnBounds& b){
    if(b.kind==ColumnBounds::Kind::NoOrder) return "NoOrder";
    ordered_json shape;
    if(b.shape==ColumnBounds::Shape::Empty){
        shape = "Empty";
    }else{
        ordered_json inner;
        inner["min"] = boundValueJson(b.kind, b.min);
        inner["max"] = boundValueJson(b.kind, b.max);
        shape = ordered_json{{b.shape==ColumnBounds::Shape::Sharp ? "Sharp" : "Bounded", inner}};
    }
    return ordered_json{{boundsKindName(b.kind), shape}};
}

ordered_json metadataJson(const std::vector<ColumnMetadataEntry>& entries){
    ordered_json arr = ordered_json::array();
    for(const auto& e : entries){
        ordered_json j;
        j["identifier"] = identJson(e.ident);
        j["column_type"] = columnTypeJson(e.metadata.columnType);
        j["bounds"] = boundsJson(e.metadata.bounds);
        arr.push_back(std::move(j));
    }
    return arr;
}

// ---------------------------- Element JSON ------------------------------------
ordered_json elementJson(const RistrettoCommitment& c){
    ordered_json j;
    j["compressed"] = curve::hexOf(c.compressed.data(), c.compressed.size());
    j["x"] = curve::fieldHex(c.x);
    j["y"] = curve::fieldHex(c.y);
    return j;
}

ordered_json fp2Json(const mcl::bn::Fp2& f){
    ordered_json j;
    j["c0"] = curve::fieldHex(f.a);
    j["c1"] = curve::fieldHex(f.b);
    return j;
}

ordered_json fp6Json(const mcl::bn::Fp6& f){
    ordered_json j;
    j["c0"] = fp2Json(f.a);
    j["c1"] = fp2Json(f.b);
    j["c2"] = fp2Json(f.c);
    return j;
}

ordered_json elementJson(const DoryCommitment& c){
    ordered_json j;
    j["c0"] = fp6Json(c.value.a);
    j["c1"] = fp6Json(c.value.b);
    return j;
}

ordered_json elementJson(const DynamicDoryCommitment& c){
    curve::G1 P = c.point;
    P.normalize();
    ordered_json j;
    j["compressed"] = curve::hexOf(c.compressed.data(), c.compressed.size());
    j["infinity"] = P.isZero();
    j["x"] = P.isZero() ? ordered_json(nullptr) : ordered_json(curve::fieldHex(P.x));
    j["y"] = P.isZero() ? ordered_json(nullptr) : ordered_json(curve::fieldHex(P.y));
    return j;
}

// ------------------------------ Scheme table ----------------------------------
template<class C>
AnyTableCommitment decodeTable(const std::vector<uint8_t>& bytes){
    PostcardReader r(bytes);
    TableCommitment<C> tc = readTableCommitment<C>(r);
    // the producer's from_bytes ignores whatever follows a complete value
    if(r.remaining()) dbg("ignoring " + std::to_string(r.remaining()) + " trailing bytes");
    return tc;
}

template<class C>
ordered_json renderTable(const AnyTableCommitment& value){
    const auto& tc = std::get<TableCommitment<C>>(value);
    ordered_json commitments = ordered_json::array();
    for(const auto& c : tc.columnCommitments.commitments) commitments.push_back(elementJson(c));

    ordered_json columns;
    columns["commitments"] = std::move(commitments);
    columns["column_metadata"] = metadataJson(tc.columnCommitments.columnMetadata);

    ordered_json j;
    j["column_commitments"] = std::move(columns);
    j["range"] = ordered_json{{"start", tc.rangeStart}, {"end", tc.rangeEnd}};
    return j;
}

const SchemeCodec kSchemeCodecs[] = {
    {Scheme::InnerProductArgument, &decodeTable<RistrettoCommitment>,   &renderTable<RistrettoCommitment>},
    {Scheme::Dory,                 &decodeTable<DoryCommitment>,        &renderTable<DoryCommitment>},
    {Scheme::DynamicDory,          &decodeTable<DynamicDoryCommitment>, &renderTable<DynamicDoryCommitment>},
};

} // namespace

const SchemeCodec& codecFor(Scheme scheme){
    for(const auto& codec : kSchemeCodecs){
        if(codec.scheme==scheme) return codec;
    }
    throw std::logic_error("no codec registered for scheme");
}

std::string decodeAndRender(Scheme scheme, const std::vector<uint8_t>& bytes, const RenderOptions& opts){
    curve::initCurves();
    const SchemeCodec& codec = codecFor(scheme);

    std::optional<AnyTableCommitment> value;
    try{
        value = codec.decode(bytes);
    }catch(const PostcardError& e){
        dbg(std::string("decode failed: ") + e.what());
        throw CommitUtilityException(DeserializationError{});
    }
    dbg(std::string("decoded ") + std::to_string(bytes.size()) + " bytes as " + schemeName(scheme));

    ordered_json out;
    out["scheme"] = schemeName(scheme);
    if(opts.digest){
        out["artifact"] = ordered_json{{"bytes", bytes.size()}, {"sha256", sha256Hex(bytes)}};
    }
    out["table_commitment"] = codec.render(*value);
    return out.dump(4) + "\n";
}

// OpenSSL EVP-based SHA-256
std::string sha256Hex(const std::vector<uint8_t>& bytes){
    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int hlen=0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)==1
           && (bytes.empty() || EVP_DigestUpdate(ctx, bytes.data(), bytes.size())==1)
           && EVP_DigestFinal_ex(ctx, h, &hlen)==1;
    EVP_MD_CTX_free(ctx);
    if(!ok) throw std::runtime_error("SHA-256 digest failed");
    std::string hex = curve::hexOf(h, hlen);
    return hex.substr(2);
}

std::string i128ToString(i128 v){
    if(v==0) return "0";
    bool neg = v<0;
    // magnitude as unsigned so that the minimum value survives negation
    u128 m = neg ? (u128)0 - (u128)v : (u128)v;
    std::string s;
    while(m>0){
        s.push_back((char)('0' + (int)(m % 10)));
        m /= 10;
    }
    if(neg) s.push_back('-');
    std::reverse(s.begin(), s.end());
    return s;
}

} // namespace commit_utility

// ============================================================================
//  File: src/g60_codec.cpp — Codec G60 : encode / decode / verify (DOC+)
//  Project: G60 Text Codec
//
//  DISPOSITION D’UN GROUPE (octets a..h, a en tête)
//  ------------------------------------------------
//   d0 d1  = 14·a + b/20            (base 60 sur 2 chiffres, max 3582)
//   d2     = 3·(b%20) + c/90
//   d3     = (2·(c%90) + bit7(d)) / 3
//   d4     = 20·(reste précédent) + (9·(d&0x7F) + e/30) / 60
//   d5     = (9·(d&0x7F) + e/30) % 60
//   d6     = 2·(e%30) + f/150
//   d7     = (2·(f%150) + g/144) / 5
//   d8     = 12·(reste précédent) + (g%144)/12
//   d9     = 5·((g%144)%12) + h/60
//   d10    = h%60
//  Les k(n) premiers chiffres ne dépendent que des n premiers octets, d’où la
//  troncature d’un bloc partiel complété par des zéros.
//
//  DÉCODAGE
//  --------
//  Disposition inverse (chiffres absents = 0), puis contrôle de canonicité :
//  chaque octet < 256, octets de bourrage nuls, et ré-encodage identique.
//  Aucune arithmétique au-delà de 32 bits n’est nécessaire.
// ============================================================================

#include "g60_codec.hpp"
#include "g60_utf8.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <sstream>

namespace g60 {

namespace {

using Digits = std::array<uint8_t,GROUP_SYMBOLS>;
using Block  = std::array<uint8_t,BLOCK_BYTES>;

void set_error(Error* err, ErrorCode code, size_t index)
{
    if(!err) return;
    *err = Error{};
    err->code  = code;
    err->index = index;
}

// n octets (1..8), complétés par des zéros → 11 chiffres 0..59.
Digits pack_block(const uint8_t* p, size_t n)
{
    uint32_t v[BLOCK_BYTES] = {0};
    for(size_t i=0; i<n; ++i) v[i] = p[i];
    const uint32_t a=v[0], b=v[1], c=v[2], d=v[3], e=v[4], f=v[5], g=v[6], h=v[7];

    const uint32_t t01 = 14*a + b/20;
    const uint32_t t3  = 2*(c%90) + (d>>7);
    const uint32_t t45 = 9*(d&0x7Fu) + e/30;
    const uint32_t t7  = 2*(f%150) + g/144;
    const uint32_t g12 = g%144;

    Digits out{};
    out[0]  = (uint8_t)(t01/60);
    out[1]  = (uint8_t)(t01%60);
    out[2]  = (uint8_t)(3*(b%20) + c/90);
    out[3]  = (uint8_t)(t3/3);
    out[4]  = (uint8_t)(20*(t3%3) + t45/60);
    out[5]  = (uint8_t)(t45%60);
    out[6]  = (uint8_t)(2*(e%30) + f/150);
    out[7]  = (uint8_t)(t7/5);
    out[8]  = (uint8_t)(12*(t7%5) + g12/12);
    out[9]  = (uint8_t)(5*(g12%12) + h/60);
    out[10] = (uint8_t)(h%60);
    return out;
}

// 11 chiffres → 8 valeurs d’octet. Pas bornées : un groupe non canonique
// peut produire une valeur > 255.
void unpack_digits(const Digits& d, uint32_t out[BLOCK_BYTES])
{
    const uint32_t t01 = 60u*d[0] + d[1];
    const uint32_t aux = 3u*d[3] + d[4]/20;
    const uint32_t t45 = 60u*(d[4]%20) + d[5];
    const uint32_t t78 = 60u*d[7] + d[8];

    out[0] = t01/14;
    out[1] = 20*(t01%14) + d[2]/3;
    out[2] = 90*(d[2]%3) + (aux>>1);
    out[3] = 128*(aux&1u) + t45/9;
    out[4] = 30*(t45%9) + (d[6]>>1);
    out[5] = 150*(d[6]&1u) + t78/24;
    out[6] = 12*(t78%24) + d[9]/5;
    out[7] = 60*(d[9]%5) + d[10];
}

// Décode un groupe de k symboles (déjà validés). false si non canonique.
bool decode_group(const char* sym, size_t k, Block& out)
{
    const size_t n = kBytesForSymbols[k];

    Digits d{};
    for(size_t i=0; i<k; ++i) d[i] = value_of(sym[i]);

    uint32_t v[BLOCK_BYTES];
    unpack_digits(d, v);
    for(size_t i=0; i<BLOCK_BYTES; ++i){
        if(v[i] > 0xFFu) return false;
        if(i >= n && v[i] != 0) return false;
        out[i] = (uint8_t)v[i];
    }

    const Digits back = pack_block(out.data(), n);
    return std::equal(d.begin(), d.begin()+k, back.begin());
}

// Décodage permissif : valeurs réduites modulo 256, seuls les n premiers octets comptent.
void decode_group_lenient(const char* sym, size_t k, uint8_t* out)
{
    Digits d{};
    for(size_t i=0; i<k; ++i) d[i] = value_of(sym[i]);

    uint32_t v[BLOCK_BYTES];
    unpack_digits(d, v);
    const size_t n = kBytesForSymbols[k];
    for(size_t i=0; i<n; ++i) out[i] = (uint8_t)(v[i] & 0xFFu);
}

void write_groups(const uint8_t* data, size_t n, char* out)
{
    for(size_t i=0; i<n; i+=BLOCK_BYTES){
        const size_t len = std::min(BLOCK_BYTES, n-i);
        const Digits d = pack_block(data+i, len);
        const size_t k = kSymbolsForBytes[len];
        for(size_t j=0; j<k; ++j) *out++ = symbol_of(d[j]);
    }
}

bool check_symbols_and_length(const std::string& text, Error* err)
{
    for(size_t i=0; i<text.size(); ++i){
        if(!is_symbol(text[i])){
            set_error(err, ErrorCode::InvalidCharacter, i);
            if(err) err->byte = (uint8_t)text[i];
            return false;
        }
    }
    if(!is_valid_encoded_length(text.size())){
        set_error(err, ErrorCode::InvalidLength, text.size() - text.size()%GROUP_SYMBOLS);
        if(err) err->actual = text.size();
        return false;
    }
    return true;
}

// Parcourt les groupes d’un texte déjà contrôlé. `out` peut être nul (vérification seule).
bool decode_groups(const std::string& text, uint8_t* out, Error* err)
{
    Block blk{};
    for(size_t pos=0; pos<text.size(); pos+=GROUP_SYMBOLS){
        const size_t k = std::min(GROUP_SYMBOLS, text.size()-pos);
        if(!decode_group(text.data()+pos, k, blk)){
            set_error(err, ErrorCode::ValueOutOfRange, pos);
            return false;
        }
        if(out){
            const size_t n = kBytesForSymbols[k];
            std::memcpy(out, blk.data(), n);
            out += n;
        }
    }
    return true;
}

} // namespace

// ================================ Erreurs ===================================

const char* error_name(ErrorCode code)
{
    switch(code){
        case ErrorCode::None:             return "None";
        case ErrorCode::InvalidCharacter: return "InvalidCharacter";
        case ErrorCode::InvalidLength:    return "InvalidLength";
        case ErrorCode::ValueOutOfRange:  return "ValueOutOfRange";
        case ErrorCode::InvalidText:      return "InvalidText";
        case ErrorCode::BufferTooSmall:   return "BufferTooSmall";
    }
    return "Unknown";
}

std::string Error::message() const
{
    std::ostringstream os;
    os << error_name(code);
    switch(code){
        case ErrorCode::InvalidCharacter:
            os << ": byte 0x" << std::hex << (int)byte << std::dec;
            if(byte >= 0x20 && byte < 0x7F) os << " ('" << (char)byte << "')";
            os << " at index " << index;
            break;
        case ErrorCode::InvalidLength:
            os << ": length " << actual << " leaves a trailing group of "
               << actual % GROUP_SYMBOLS << " symbols";
            break;
        case ErrorCode::ValueOutOfRange:
            os << ": non-canonical group at index " << index;
            break;
        case ErrorCode::InvalidText:
            os << ": decoded bytes are not valid UTF-8 at byte " << index;
            break;
        case ErrorCode::BufferTooSmall:
            os << ": capacity " << actual << ", required " << required;
            break;
        default:
            break;
    }
    return os.str();
}

// ================================ Tailles ===================================

size_t encoded_size(size_t n_bytes)
{
    return GROUP_SYMBOLS*(n_bytes/BLOCK_BYTES) + kSymbolsForBytes[n_bytes%BLOCK_BYTES];
}

size_t decoded_size(size_t n_symbols)
{
    return BLOCK_BYTES*(n_symbols/GROUP_SYMBOLS) + BLOCK_BYTES*(n_symbols%GROUP_SYMBOLS)/GROUP_SYMBOLS;
}

bool is_valid_encoded_length(size_t n_symbols)
{
    return kBytesForSymbols[n_symbols%GROUP_SYMBOLS] != kInvalid;
}

// =============================== Encodage ===================================

std::string encode(const uint8_t* data, size_t n)
{
    std::string out(encoded_size(n), '\0');
    if(n) write_groups(data, n, &out[0]);
    return out;
}

std::string encode(const std::vector<uint8_t>& bytes)
{
    return encode(bytes.data(), bytes.size());
}

std::string encode_str(const std::string& text)
{
    return encode((const uint8_t*)text.data(), text.size());
}

bool encode_into(const uint8_t* data, size_t n,
                 char* out, size_t cap,
                 size_t& written,
                 Error* err)
{
    const size_t need = encoded_size(n);
    if(cap < need){
        set_error(err, ErrorCode::BufferTooSmall, 0);
        if(err){ err->actual = cap; err->required = need; }
        return false;
    }
    if(n) write_groups(data, n, out);
    written = need;
    return true;
}

// =============================== Décodage ===================================

bool decode(const std::string& text, std::vector<uint8_t>& out, Error* err)
{
    if(!check_symbols_and_length(text, err)) return false;

    std::vector<uint8_t> bytes(decoded_size(text.size()));
    if(!decode_groups(text, bytes.data(), err)) return false;

    out.swap(bytes);
    return true;
}

bool decode_to_string(const std::string& text, std::string& out, Error* err)
{
    std::vector<uint8_t> bytes;
    if(!decode(text, bytes, err)) return false;

    size_t bad=0;
    if(!utf8_valid(bytes.data(), bytes.size(), &bad)){
        set_error(err, ErrorCode::InvalidText, bad);
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

bool decode_into(const std::string& text,
                 uint8_t* out, size_t cap,
                 size_t& written,
                 Error* err)
{
    if(!verify(text, err)) return false;

    const size_t need = decoded_size(text.size());
    if(cap < need){
        set_error(err, ErrorCode::BufferTooSmall, 0);
        if(err){ err->actual = cap; err->required = need; }
        return false;
    }
    if(!decode_groups(text, out, err)) return false;
    written = need;
    return true;
}

// ============================= Vérification =================================

bool verify(const std::string& text, Error* err)
{
    if(!check_symbols_and_length(text, err)) return false;
    return decode_groups(text, nullptr, err);
}

bool canonicalize(const std::string& text, std::string& out, Error* err)
{
    if(!check_symbols_and_length(text, err)) return false;

    std::vector<uint8_t> bytes(decoded_size(text.size()));
    uint8_t* p = bytes.data();
    for(size_t pos=0; pos<text.size(); pos+=GROUP_SYMBOLS){
        const size_t k = std::min(GROUP_SYMBOLS, text.size()-pos);
        decode_group_lenient(text.data()+pos, k, p);
        p += kBytesForSymbols[k];
    }
    out = encode(bytes);
    return true;
}

} // namespace g60

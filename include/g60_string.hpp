// ============================================================================
//  File: include/g60_string.hpp — Type valeur G60String
//  Project: G60 Text Codec
//
//  • Ne peut contenir qu’une chaîne G60 vérifiée (alphabet, longueur,
//    canonicité) : le décodage d’un G60String ne peut donc pas échouer.
//  • Construction : from_encoded() (vérifie) ou encode() (produit).
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <utility>
#include <string>
#include <vector>

#include "g60_codec.hpp"

namespace g60 {

class G60String {
public:
    G60String() = default;

    // Vérifie `encoded` ; en cas d’échec `out` est inchangé.
    static bool from_encoded(const std::string& encoded, G60String& out, Error* err = nullptr);

    static G60String encode(const uint8_t* data, size_t n);
    static G60String encode(const std::vector<uint8_t>& bytes);
    static G60String encode_str(const std::string& text);

    const std::string& str() const { return value_; }
    size_t size() const { return value_.size(); }
    bool empty() const { return value_.empty(); }
    size_t decoded_size() const { return g60::decoded_size(value_.size()); }

    std::vector<uint8_t> decode() const;

    // Seule erreur possible : BufferTooSmall.
    bool decode_into(uint8_t* out, size_t cap, size_t& written, Error* err = nullptr) const;

    bool operator==(const G60String& o) const { return value_ == o.value_; }
    bool operator!=(const G60String& o) const { return value_ != o.value_; }
    // L’ordre des chaînes suit celui des octets encodés.
    bool operator<(const G60String& o) const { return value_ < o.value_; }

private:
    explicit G60String(std::string v) : value_(std::move(v)) {}

    std::string value_;
};

std::ostream& operator<<(std::ostream& os, const G60String& s);

} // namespace g60

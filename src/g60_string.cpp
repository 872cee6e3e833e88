// ============================================================================
//  File: src/g60_string.cpp — Type valeur G60String
//  Project: G60 Text Codec
// ============================================================================

#include "g60_string.hpp"

#include <ostream>
#include <utility>

namespace g60 {

bool G60String::from_encoded(const std::string& encoded, G60String& out, Error* err)
{
    if(!verify(encoded, err)) return false;
    out.value_ = encoded;
    return true;
}

G60String G60String::encode(const uint8_t* data, size_t n)
{
    return G60String(g60::encode(data, n));
}

G60String G60String::encode(const std::vector<uint8_t>& bytes)
{
    return G60String(g60::encode(bytes));
}

G60String G60String::encode_str(const std::string& text)
{
    return G60String(g60::encode_str(text));
}

std::vector<uint8_t> G60String::decode() const
{
    std::vector<uint8_t> out;
    // value_ est vérifié à la construction : decode() réussit toujours.
    g60::decode(value_, out);
    return out;
}

bool G60String::decode_into(uint8_t* out, size_t cap, size_t& written, Error* err) const
{
    return g60::decode_into(value_, out, cap, written, err);
}

std::ostream& operator<<(std::ostream& os, const G60String& s)
{
    return os << s.str();
}

} // namespace g60

// ============================================================================
//  File: src/g60_random.cpp — Génération de chaînes G60 aléatoires
//  Project: G60 Text Codec
// ============================================================================

#include "g60_random.hpp"
#include "g60_codec.hpp"

#include <random>
#include <vector>

namespace g60 {

namespace {

void fill_from_device(uint8_t* buf, size_t n)
{
    std::random_device rd;
    std::uniform_int_distribution<unsigned> d(0, 255);
    for(size_t i=0; i<n; ++i) buf[i] = (uint8_t)d(rd);
}

void fill_from_engine(std::mt19937_64& gen, uint8_t* buf, size_t n)
{
    // 8 octets par tirage
    size_t i=0;
    while(i<n){
        uint64_t r = gen();
        for(int k=0; k<8 && i<n; ++k){ buf[i++] = (uint8_t)(r & 0xFFu); r >>= 8; }
    }
}

} // namespace

size_t floor_valid_length(size_t length)
{
    // Deux longueurs interdites ne sont jamais consécutives : len-1 suffit.
    return is_valid_encoded_length(length) ? length : length - 1;
}

std::string custom_random_bytes(size_t n_bytes, const FillFn& fill)
{
    std::vector<uint8_t> buf(n_bytes);
    if(n_bytes) fill(buf.data(), buf.size());
    return encode(buf);
}

std::string random_bytes(size_t n_bytes)
{
    return custom_random_bytes(n_bytes, fill_from_device);
}

std::string fast_random_bytes(size_t n_bytes)
{
    std::random_device rd;
    return fast_random_bytes(n_bytes, ((uint64_t)rd() << 32) ^ rd());
}

std::string fast_random_bytes(size_t n_bytes, uint64_t seed)
{
    std::mt19937_64 gen(seed);
    return custom_random_bytes(n_bytes, [&gen](uint8_t* buf, size_t n){ fill_from_engine(gen, buf, n); });
}

std::string custom_random(size_t length, const FillFn& fill)
{
    return custom_random_bytes(decoded_size(floor_valid_length(length)), fill);
}

std::string random(size_t length)
{
    return random_bytes(decoded_size(floor_valid_length(length)));
}

std::string fast_random(size_t length)
{
    return fast_random_bytes(decoded_size(floor_valid_length(length)));
}

std::string fast_random(size_t length, uint64_t seed)
{
    return fast_random_bytes(decoded_size(floor_valid_length(length)), seed);
}

} // namespace g60

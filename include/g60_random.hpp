// ============================================================================
//  File: include/g60_random.hpp — Génération de chaînes G60 aléatoires
//  Project: G60 Text Codec
//
//  • Toutes les chaînes produites sont canoniques (encode() d’octets tirés).
//  • *_bytes(n)  : n octets aléatoires → encoded_size(n) symboles.
//  • random(len) : au plus `len` symboles ; si `len` n’est pas une longueur
//    encodée valide (reste 1, 4 ou 8), on produit `len - 1` symboles.
//
//  Sources d’aléa :
//   random_*      : std::random_device (non déterministe)
//   fast_random_* : std::mt19937_64 (graine random_device ou explicite)
//   custom_*      : callback de l’appelant qui remplit un tampon d’octets
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace g60 {

using FillFn = std::function<void(uint8_t* /*buf*/, size_t /*n*/)>;

// Longueur valide la plus proche par défaut (len ou len-1).
size_t floor_valid_length(size_t length);

std::string random_bytes(size_t n_bytes);
std::string fast_random_bytes(size_t n_bytes);
std::string fast_random_bytes(size_t n_bytes, uint64_t seed);
std::string custom_random_bytes(size_t n_bytes, const FillFn& fill);

std::string random(size_t length);
std::string fast_random(size_t length);
std::string fast_random(size_t length, uint64_t seed);
std::string custom_random(size_t length, const FillFn& fill);

} // namespace g60

#pragma once

#include <custodia/crypto/hash.hpp>
#include <custodia/crypto/key_pair.hpp>
#include <custodia/crypto/public_key.hpp>
#include <custodia/crypto/secret_key.hpp>

#pragma once

#include <custodia/encode/base58.hpp>
#include <custodia/encode/error.hpp>
#include <custodia/encode/hex.hpp>

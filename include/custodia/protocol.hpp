#pragma once

#include <custodia/protocol/address.hpp>
#include <custodia/protocol/error.hpp>

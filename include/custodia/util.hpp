#pragma once

#include <custodia/util/error.hpp>
#include <custodia/util/options.hpp>

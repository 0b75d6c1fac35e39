#pragma once

#include <custodia/serialization/archive.hpp>
#include <custodia/serialization/error.hpp>
#include <custodia/serialization/field.hpp>

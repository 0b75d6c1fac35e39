#pragma once

#include <custodia/net/endpoint.hpp>
#include <custodia/net/error.hpp>

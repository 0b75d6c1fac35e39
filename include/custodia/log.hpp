#pragma once

#include <custodia/log/formatter.hpp>
#include <custodia/log/frontend.hpp>
#include <custodia/log/log.hpp>

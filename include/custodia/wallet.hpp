#pragma once

#include <custodia/wallet/account.hpp>
#include <custodia/wallet/error.hpp>

#pragma once

#include <bursar/ledger/account.hpp>
#include <bursar/ledger/error.hpp>
#include <bursar/ledger/ledger.hpp>

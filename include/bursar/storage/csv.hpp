#pragma once

#include <filesystem>

#include <bursar/ledger/ledger.hpp>
#include <bursar/storage/error.hpp>

namespace bursar::storage {

/**
 * Reads a ledger from a CSV file with a "name,balance" header and one account per
 * line, balances given in minor units. A missing file is an empty ledger.
 */
result< ledger::ledger > load( const std::filesystem::path& p );

/**
 * Writes every account of the ledger, in order, replacing the file contents.
 */
result< void > save( const ledger::ledger& l, const std::filesystem::path& p );

} // namespace bursar::storage

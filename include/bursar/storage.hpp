#pragma once

#include <bursar/storage/csv.hpp>
#include <bursar/storage/error.hpp>

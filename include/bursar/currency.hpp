#pragma once

#include <bursar/currency/cents.hpp>
#include <bursar/currency/error.hpp>

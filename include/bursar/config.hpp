#pragma once

#include <bursar/config/options.hpp>

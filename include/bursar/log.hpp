#pragma once

#include <bursar/log/log.hpp>

#pragma once

#include "common.hpp"
#include "expr.hpp"
#include "pattern.hpp"
#include "stmt.hpp"

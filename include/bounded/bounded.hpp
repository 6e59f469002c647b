#pragma once

#include "check.hpp"
#include "conversion.hpp"
#include "display.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "primitive.hpp"
#include "shapes.hpp"
#include "widths.hpp"

/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_PRECOMPILED_HPP_INCLUDED__
#define __ZXFER_PRECOMPILED_HPP_INCLUDED__

#include "platform.hpp"

#define __STDC_LIMIT_MACROS

// zxfer definitions and exported functions
#include "../../include/zxfer.h"

// standard C headers
#include <errno.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// standard C++ headers
#include <algorithm>
#include <string>

#endif //ifndef __ZXFER_PRECOMPILED_HPP_INCLUDED__

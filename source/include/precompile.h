// precompile.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <map>
#include <set>
#include <deque>
#include <memory>
#include <string>
#include <tuple>
#include <vector>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>
#include <concepts>
#include <optional>
#include <algorithm>
#include <functional>
#include <string_view>
#include <type_traits>

#include <zpr.h>
#include <zst/zst.h>

#include "defs.h"
#include "util.h"
#include "types.h"

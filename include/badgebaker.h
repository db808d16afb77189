/*
 * badgebaker.h - Master header
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef __BADGEBAKER_H__
#define __BADGEBAKER_H__

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// defines
#define BADGEBAKER_VERSION "1.0.0"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// C Standard Library (wrapped)
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// Third-party
#include <zlib.h>

// BadgeBaker
#include "debug.h"
#include "png/PNGError.h"
#include "core/utility/UTF8Util.h"
#include "core/compression/Zlib.h"
#include "png/CRC32.h"
#include "png/Chunk.h"
#include "png/ChunkReader.h"
#include "png/ChunkWriter.h"
#include "png/InternationalText.h"
#include "baker/BakerOptions.h"
#include "baker/BadgeBaker.h"

#endif // __BADGEBAKER_H__

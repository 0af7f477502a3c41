#ifndef FASTVLQ_HPP
#define FASTVLQ_HPP

#include "fastvlq/core/bits.hpp"
#include "fastvlq/core/capacity.hpp"
#include "fastvlq/core/codec.hpp"
#include "fastvlq/core/errors.hpp"
#include "fastvlq/core/vlq.hpp"
#include "fastvlq/core/width.hpp"
#include "fastvlq/core/zigzag.hpp"
#include "fastvlq/io/incremental.hpp"
#include "fastvlq/io/print.hpp"
#include "fastvlq/io/stream.hpp"

#endif // FASTVLQ_HPP

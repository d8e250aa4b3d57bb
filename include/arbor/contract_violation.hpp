// MIT License
//
// Copyright (c) 2020 degski
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.


#pragma once

#include <exception>
#include <stdexcept>

#include "config.hpp"

#if ARBOR_USE_IO
#    include <iostream>
#endif

#include <hedley.h>

namespace arbor {

// Thrown when a caller breaks the contract of a forest operation (unknown parent, mutation while a traversal
// is alive, ...). Always thrown before the offending operation touches any state.
struct contract_violation final : public std::logic_error {
    using std::logic_error::logic_error;
};

namespace detail {

HEDLEY_NO_RETURN HEDLEY_NEVER_INLINE inline void contract_failure ( char const * what_ ) {
    throw contract_violation ( what_ );
}

// A forest found its own state broken. Nothing sane is left to unwind to.
HEDLEY_NO_RETURN HEDLEY_NEVER_INLINE inline void fatal_failure ( char const * what_ ) noexcept {
#if ARBOR_USE_IO
    std::cerr << what_ << '\n';
#else
    (void) what_;
#endif
    std::terminate ( );
}

} // namespace detail

} // namespace arbor

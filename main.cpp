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


// Times the forest operations on large random forests: insertion, a full walk, height, and detaching and
// re-attaching subtrees.

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include <algorithm>
#include <array>
#include <atomic>
#include <iostream>
#include <optional>
#include <random>
#include <vector>

#include <plf/plf_nanotimer.h>

#include <sax/iostream.hpp>
#include <sax/prng_sfc.hpp>
#include <sax/uniform_int_distribution.hpp>

#include <arbor/arbor.hpp>

#if defined( _DEBUG )
#    define RANDOM 0
#else
#    define RANDOM 1
#endif

namespace ThreadID {
// Creates a new ID.
[[nodiscard]] inline int next ( ) noexcept {
    static std::atomic<int> id = 0;
    return id++;
}
// Returns ID of this thread.
[[nodiscard]] inline int get ( ) noexcept {
    static thread_local int tl_id = next ( );
    return tl_id;
}
} // namespace ThreadID

namespace Rng {
// A global instance of a C++ implementation of Chris Doty-Humphrey's Small Fast Chaotic Prng.
[[nodiscard]] inline sax::Rng & generator ( ) noexcept {
    if constexpr ( RANDOM ) {
        static thread_local sax::Rng generator ( sax::os_seed ( ), sax::os_seed ( ), sax::os_seed ( ), sax::os_seed ( ) );
        return generator;
    }
    else {
        static thread_local sax::Rng generator ( sax::fixed_seed ( ) + ThreadID::get ( ) );
        return generator;
    }
}
} // namespace Rng

#undef RANDOM

sax::Rng & rng = Rng::generator ( );

using Forest = arbor::basic_forest<int>;

// Every new node picks its parent uniformly among the nodes added so far (1 in 100 becomes a new root).
void add_nodes_low_workload ( Forest & forest_, std::vector<arbor::instance_id> & ids_, int n_ ) {
    for ( int i = 0; i < n_; ++i ) {
        std::optional<arbor::instance_id> parent;
        if ( ids_.size ( ) and sax::uniform_int_distribution<int> ( 0, 99 ) ( rng ) )
            parent = ids_[ static_cast<std::size_t> ( sax::uniform_int_distribution<int> ( 0, static_cast<int> ( ids_.size ( ) ) - 1 ) ( rng ) ) ];
        ids_.push_back ( forest_.insert_instance ( i, parent ) );
    }
}

// Some piecewise distribution, new nodes are added more often at the bottom (the most recently added nodes), which
// gives deeper trees.
void add_nodes_high_workload ( Forest & forest_, std::vector<arbor::instance_id> & ids_, int n_ ) {
    ids_.push_back ( forest_.insert_instance ( 0, std::nullopt ) );
    for ( int i = 1; i < n_; ++i ) {
        auto back = ids_.size ( );
        std::size_t n;
        // The boundaries only increase strictly from 4 nodes on.
        if ( back < 4 ) {
            n = static_cast<std::size_t> ( sax::uniform_int_distribution<int> ( 0, static_cast<int> ( back ) - 1 ) ( rng ) );
        }
        else {
            std::array<float, 4> ai           = { 0.0f, back / 2.0f, 2 * back / 3.0f, static_cast<float> ( back - 1 ) };
            constexpr std::array<float, 3> aw = { 1, 3, 9 };
            n = static_cast<std::size_t> ( std::piecewise_constant_distribution<float> ( ai.begin ( ), ai.end ( ), aw.begin ( ) ) ( rng ) );
        }
        ids_.push_back ( forest_.insert_instance ( i, ids_[ std::min ( n, back - 1 ) ] ) );
    }
}

template<typename Fill>
void run ( char const * name_, Fill fill_, int n_ ) {
    std::cout << name_ << nl;
    Forest forest;
    std::vector<arbor::instance_id> ids;
    ids.reserve ( static_cast<std::size_t> ( n_ ) );

    plf::nanotimer timer;
    timer.start ( );
    fill_ ( forest, ids, n_ );
    std::uint64_t duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << "insert    " << duration << "ms" << sp << forest.size ( ) << sp << forest.roots ( ).size ( ) << nl;

    timer.start ( );
    std::size_t sum = 0;
    for ( arbor::instance_id const root : forest.roots ( ) )
        for ( auto it = forest.descendants ( root ); it.is_valid ( ); ++it )
            sum += 1;
    duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << "walk      " << duration << "ms" << sp << sum << nl;

    timer.start ( );
    std::size_t height = 0, width = 0;
    for ( arbor::instance_id const root : forest.roots ( ) ) {
        std::size_t w = 0, h = forest.height ( root, &w );
        height = std::max ( height, h );
        width  = std::max ( width, w );
    }
    duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << "height    " << duration << "ms" << sp << height << sp << width << nl;

    // Detach a thousand random subtrees and hang each back under its old parent.
    timer.start ( );
    std::size_t moved = 0;
    for ( int i = 0; i < 1'000; ++i ) {
        arbor::instance_id const id = ids[ static_cast<std::size_t> ( sax::uniform_int_distribution<int> ( 0, n_ - 1 ) ( rng ) ) ];
        Forest::node_type const * node = forest.lookup ( id );
        std::optional<arbor::instance_id> const parent = node->parent_id ( );
        if ( std::optional<Forest> subtree = forest.remove_instance ( id ) ) {
            moved += subtree->size ( );
            forest.transplant ( *subtree, id, parent );
        }
    }
    duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << "transplant" << sp << duration << "ms" << sp << moved << nl;

    if ( not forest.validate_invariants ( ) )
        std::cout << "inconsistent forest" << nl;
}

int main ( ) {
    run ( "forest lw", add_nodes_low_workload, 1'000'000 );
    run ( "forest hw", add_nodes_high_workload, 200'000 );
    return EXIT_SUCCESS;
}

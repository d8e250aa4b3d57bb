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


// Tests for the walks over a forest: descendants ( ) in both sibling orders, ancestors ( ), height ( ), and the
// guard against changing a forest while a walk is alive.

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <arbor/arbor.hpp>

using arbor::instance_id;

namespace {

// a
// +-- b
// |   +-- d
// |   +-- e
// +-- c
//     +-- f
struct sample {
    arbor::forest forest;
    instance_id a, b, c, d, e, f;

    sample ( ) {
        a = forest.insert_instance ( arbor::instance{ "a", "Model" } );
        b = forest.insert_instance ( arbor::instance{ "b", "Part" }, a );
        c = forest.insert_instance ( arbor::instance{ "c", "Model" }, a );
        d = forest.insert_instance ( arbor::instance{ "d", "Decal" }, b );
        e = forest.insert_instance ( arbor::instance{ "e", "Decal" }, b );
        f = forest.insert_instance ( arbor::instance{ "f", "Part" }, c );
    }
};

std::vector<instance_id> walk ( arbor::forest const & forest_, instance_id id_,
                                arbor::traversal_order order_ = arbor::traversal_order::reverse_child_order ) {
    std::vector<instance_id> out;
    for ( auto it = forest_.descendants ( id_, order_ ); it.is_valid ( ); ++it )
        out.push_back ( it.id ( ) );
    return out;
}

template<typename Forest>
concept walkable_down = requires ( Forest && forest_, instance_id id_ ) { std::forward<Forest> ( forest_ ).descendants ( id_ ); };

template<typename Forest>
concept walkable_up = requires ( Forest && forest_, instance_id id_ ) { std::forward<Forest> ( forest_ ).ancestors ( id_ ); };

} // namespace

TEST ( Descendants, StartsWithTheNodeItself ) {
    sample s;
    auto it = s.forest.descendants ( s.b );
    ASSERT_TRUE ( it.is_valid ( ) );
    EXPECT_EQ ( it.id ( ), s.b );
    EXPECT_EQ ( it->payload ( ).name, "b" );
}

TEST ( Descendants, VisitsSiblingsLastToFirstByDefault ) {
    sample s;
    EXPECT_EQ ( walk ( s.forest, s.a ), ( std::vector<instance_id>{ s.a, s.c, s.f, s.b, s.e, s.d } ) );
}

TEST ( Descendants, ChildOrderIsDocumentOrder ) {
    sample s;
    EXPECT_EQ ( walk ( s.forest, s.a, arbor::traversal_order::child_order ),
                ( std::vector<instance_id>{ s.a, s.b, s.d, s.e, s.c, s.f } ) );
}

TEST ( Descendants, LeafYieldsOnlyItself ) {
    sample s;
    EXPECT_EQ ( walk ( s.forest, s.f ), std::vector<instance_id>{ s.f } );
}

TEST ( Descendants, UnknownIdYieldsNothing ) {
    sample s;
    auto it = s.forest.descendants ( instance_id::new_unique ( ) );
    EXPECT_FALSE ( it.is_valid ( ) );
    EXPECT_TRUE ( it.id ( ).is_invalid ( ) );
}

TEST ( Descendants, RangeForCoversTheSubtreeOnce ) {
    sample s;
    std::multiset<std::string> names;
    for ( arbor::node const & node : s.forest.descendants ( s.a ) )
        names.insert ( node->name );
    EXPECT_EQ ( names, ( std::multiset<std::string>{ "a", "b", "c", "d", "e", "f" } ) );

    std::vector<instance_id> below_c;
    for ( arbor::node const & node : s.forest.descendants ( s.c, arbor::traversal_order::child_order ) )
        below_c.push_back ( node.id ( ) );
    EXPECT_EQ ( below_c, ( std::vector<instance_id>{ s.c, s.f } ) );
}

TEST ( Descendants, CoverageOnAWideAndDeepTree ) {
    arbor::basic_forest<int> forest;
    instance_id const root = forest.insert_instance ( 0 );
    std::set<instance_id> expected{ root };
    std::vector<instance_id> level{ root };
    for ( int depth = 1; depth < 6; ++depth ) {
        std::vector<instance_id> next;
        for ( instance_id const parent : level )
            for ( int i = 0; i < 3; ++i ) {
                instance_id const id = forest.insert_instance ( depth, parent );
                expected.insert ( id );
                next.push_back ( id );
            }
        level = std::move ( next );
    }
    forest.insert_instance ( -1 ); // a second tree, never reached.

    for ( arbor::traversal_order const order : { arbor::traversal_order::reverse_child_order, arbor::traversal_order::child_order } ) {
        std::vector<instance_id> visited;
        for ( auto it = forest.descendants ( root, order ); it.is_valid ( ); ++it )
            visited.push_back ( it.id ( ) );
        EXPECT_EQ ( visited.size ( ), expected.size ( ) );
        EXPECT_EQ ( std::set<instance_id> ( visited.begin ( ), visited.end ( ) ), expected );
    }
}

TEST ( Descendants, StructuralChangesWhileWalkingThrow ) {
    sample s;
    arbor::forest other;
    instance_id const o = other.insert_instance ( arbor::instance{ "o", "Folder" } );
    {
        auto it = s.forest.descendants ( s.a );
        EXPECT_THROW ( s.forest.insert_instance ( arbor::instance{ "x", "Part" }, s.a ), arbor::contract_violation );
        EXPECT_THROW ( s.forest.remove_instance ( s.b ), arbor::contract_violation );
        EXPECT_THROW ( s.forest.transplant ( other, o, s.a ), arbor::contract_violation );
        EXPECT_THROW ( other.transplant ( s.forest, s.c, o ), arbor::contract_violation );
        EXPECT_THROW ( s.forest.clear ( ), arbor::contract_violation );
        EXPECT_THROW ( s.forest = arbor::forest{ }, arbor::contract_violation );
        EXPECT_THROW ( arbor::forest{ std::move ( s.forest ) }, arbor::contract_violation );

        // Payload edits are not structural.
        s.forest.lookup_mut ( s.d )->payload ( ).name = "renamed";

        int count = 0;
        for ( ; it.is_valid ( ); ++it )
            count += 1;
        EXPECT_EQ ( count, 6 );
        // Exhausted, but still alive.
        EXPECT_THROW ( s.forest.insert_instance ( arbor::instance{ "x", "Part" } ), arbor::contract_violation );
    }
    EXPECT_EQ ( s.forest.size ( ), 6u );
    EXPECT_EQ ( s.forest.lookup ( s.d )->payload ( ).name, "renamed" );
    EXPECT_NO_THROW ( s.forest.insert_instance ( arbor::instance{ "x", "Part" }, s.a ) );
    EXPECT_TRUE ( s.forest.remove_instance ( s.b ).has_value ( ) );
    EXPECT_TRUE ( s.forest.validate_invariants ( ) );
}

TEST ( Descendants, AMovedWalkKeepsTheForestBorrowed ) {
    sample s;
    auto first = s.forest.descendants ( s.a );
    {
        auto second = std::move ( first );
        EXPECT_FALSE ( first.is_valid ( ) );
        EXPECT_TRUE ( second.is_valid ( ) );
        EXPECT_THROW ( s.forest.insert_instance ( arbor::instance{ "x", "Part" } ), arbor::contract_violation );
    }
    EXPECT_NO_THROW ( s.forest.insert_instance ( arbor::instance{ "x", "Part" } ) );
}

TEST ( Ancestors, WalkUpToTheRoot ) {
    sample s;
    std::vector<instance_id> path;
    for ( auto it = s.forest.ancestors ( s.e ); it.is_valid ( ); ++it )
        path.push_back ( it.id ( ) );
    EXPECT_EQ ( path, ( std::vector<instance_id>{ s.e, s.b, s.a } ) );

    EXPECT_FALSE ( s.forest.ancestors ( instance_id::new_unique ( ) ).is_valid ( ) );
    {
        auto it = s.forest.ancestors ( s.a );
        EXPECT_THROW ( s.forest.remove_instance ( s.a ), arbor::contract_violation );
    }
    EXPECT_TRUE ( s.forest.remove_instance ( s.a ).has_value ( ) );
}

TEST ( Height, LevelsAndWidth ) {
    sample s;
    std::size_t width = 0;
    EXPECT_EQ ( s.forest.height ( s.a, &width ), 3u );
    EXPECT_EQ ( width, 3u );
    EXPECT_EQ ( s.forest.height ( s.b, &width ), 2u );
    EXPECT_EQ ( width, 2u );
    EXPECT_EQ ( s.forest.height ( s.f, &width ), 1u );
    EXPECT_EQ ( width, 1u );
    EXPECT_EQ ( s.forest.height ( instance_id::new_unique ( ), &width ), 0u );
    EXPECT_EQ ( width, 0u );
    EXPECT_EQ ( s.forest.height ( s.c ), 2u );
}

TEST ( Descendants, NoWalksOverTemporaryForests ) {
    static_assert ( walkable_down<arbor::forest &> );
    static_assert ( walkable_down<arbor::forest const &> );
    static_assert ( not walkable_down<arbor::forest> );
    static_assert ( not walkable_down<arbor::forest const> );
    static_assert ( walkable_up<arbor::forest &> );
    static_assert ( not walkable_up<arbor::forest> );
    static_assert ( not walkable_up<arbor::forest const> );
}

TEST ( DescendantsDeathTest, DestroyingAForestWhileWalkingIsFatal ) {
    EXPECT_DEATH (
        {
            std::optional<arbor::forest> forest{ std::in_place };
            instance_id const root = forest->insert_instance ( arbor::instance{ "root", "Folder" } );
            auto it                = forest->descendants ( root );
            forest.reset ( );
        },
        "destroyed while a traversal" );
}

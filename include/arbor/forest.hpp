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

#include <cstddef>
#include <cstdint>

#include "config.hpp"

#if ARBOR_USE_IO
#    include <iostream>
#endif

#include <algorithm>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <hedley.h>

#include <tbb/tbb_allocator.h>

#include "contract_violation.hpp"
#include "instance_id.hpp"

#if ARBOR_USE_CEREAL
#    include <cereal/cereal.hpp>
#    include <cereal/details/helpers.hpp>
#    include <cereal/types/optional.hpp>
#    include <cereal/types/vector.hpp>
#endif

namespace arbor {

namespace detail {

using id_vector = std::vector<instance_id, tbb::tbb_allocator<instance_id>>;
using id_deque  = std::deque<instance_id, tbb::tbb_allocator<instance_id>>;
using id_set    = std::unordered_set<instance_id, std::hash<instance_id>, std::equal_to<instance_id>, tbb::tbb_allocator<instance_id>>;

// De-queue.
[[nodiscard]] inline instance_id de ( id_deque & deq_ ) noexcept {
    instance_id v = deq_.front ( );
    deq_.pop_front ( );
    return v;
}

// En-queue.
inline void en ( id_deque & deq_, instance_id const v_ ) { deq_.push_back ( v_ ); }

// Pop stack.
[[nodiscard]] inline instance_id pop ( id_vector & vec_ ) noexcept {
    instance_id v = vec_.back ( );
    vec_.pop_back ( );
    return v;
}

// Push stack.
inline void push ( id_vector & vec_, instance_id const v_ ) { vec_.push_back ( v_ ); }

} // namespace detail

using id_vector = detail::id_vector;
using root_set  = detail::id_set;

// Sibling order of a descendant walk. Both are depth-first and yield the start node first.
enum class traversal_order : char {
    reverse_child_order, // last child first (the historical order of descendants ( )).
    child_order          // first child first, i.e. document order.
};

template<typename Payload>
class basic_forest;

// A payload plus its place in a forest. Only the owning forest changes the structural fields.
template<typename Payload>
class rooted_node {

    template<typename>
    friend class basic_forest;

    instance_id self;
    std::optional<instance_id> up;
    id_vector down; // order is significant.
    Payload data;

    rooted_node ( ) = default;

    template<typename... Args>
    rooted_node ( instance_id id_, std::optional<instance_id> parent_, Args &&... args_ ) :
        self{ id_ }, up{ parent_ }, data ( std::forward<Args> ( args_ )... ) {}

    public:
    using payload_type = Payload;

    rooted_node ( rooted_node && ) = default;
    rooted_node & operator= ( rooted_node && ) = default;

    [[nodiscard]] instance_id id ( ) const noexcept { return self; }
    [[nodiscard]] std::optional<instance_id> parent_id ( ) const noexcept { return up; }
    [[nodiscard]] id_vector const & children_ids ( ) const noexcept { return down; }
    [[nodiscard]] std::size_t fan ( ) const noexcept { return down.size ( ); }
    [[nodiscard]] bool is_root ( ) const noexcept { return not up.has_value ( ); }

    [[nodiscard]] Payload & payload ( ) noexcept { return data; }
    [[nodiscard]] Payload const & payload ( ) const noexcept { return data; }
    [[nodiscard]] Payload & operator* ( ) noexcept { return data; }
    [[nodiscard]] Payload const & operator* ( ) const noexcept { return data; }
    [[nodiscard]] Payload * operator-> ( ) noexcept { return std::addressof ( data ); }
    [[nodiscard]] Payload const * operator-> ( ) const noexcept { return std::addressof ( data ); }

#if ARBOR_USE_IO
    template<typename Stream>
    [[maybe_unused]] friend Stream & operator<< ( Stream & out_, rooted_node const & node_ ) noexcept {
        instance_id const parent = node_.up.value_or ( instance_id{ } );
        if constexpr ( std::is_same<typename Stream::char_type, wchar_t>::value ) {
            out_ << L'<' << node_.self << L' ' << parent << L' ' << node_.down.size ( ) << L'>';
        }
        else {
            out_ << '<' << node_.self << ' ' << parent << ' ' << node_.down.size ( ) << '>';
        }
        return out_;
    }
#endif

#if ARBOR_USE_CEREAL
    private:
    friend class cereal::access;
    template<class Archive>
    inline void serialize ( Archive & ar_ ) {
        ar_ ( cereal::make_nvp ( "Id", self ), cereal::make_nvp ( "Parent", up ), cereal::make_nvp ( "Children", down ),
              cereal::make_nvp ( "Instance", data ) );
    }
#endif
};

// An identity-indexed store of rooted_nodes: any number of trees, each hanging off a root. The forest owns every
// node; a node lives exactly as long as it is in the forest. Not safe for concurrent use.
template<typename Payload>
class basic_forest {

    using node_map = std::unordered_map<instance_id, rooted_node<Payload>, std::hash<instance_id>, std::equal_to<instance_id>,
                                        tbb::tbb_allocator<std::pair<instance_id const, rooted_node<Payload>>>>;

    public:
    using payload_type    = Payload;
    using node_type       = rooted_node<Payload>;
    using size_type       = std::size_t;
    using reference       = node_type &;
    using const_reference = node_type const &;
    using pointer         = node_type *;
    using const_pointer   = node_type const *;

    private:
    // Registers a live traversal with a forest for as long as it exists.
    class borrow final {
        basic_forest const * forest;

        public:
        explicit borrow ( basic_forest const & forest_ ) noexcept : forest{ std::addressof ( forest_ ) } { forest->borrows += 1; }
        borrow ( borrow && rhs_ ) noexcept : forest{ std::exchange ( rhs_.forest, nullptr ) } {}
        ~borrow ( ) noexcept {
            if ( forest )
                forest->borrows -= 1;
        }

        borrow ( borrow const & ) = delete;
        borrow & operator= ( borrow const & ) = delete;
        borrow & operator= ( borrow && ) = delete;

        [[nodiscard]] basic_forest const & get ( ) const noexcept { return *forest; }
    };

    public:
    basic_forest ( ) = default;

    basic_forest ( basic_forest && rhs_ ) {
        rhs_.ensure_unborrowed ( );
        nodes.swap ( rhs_.nodes );
        root_ids.swap ( rhs_.root_ids );
    }

    basic_forest & operator= ( basic_forest && rhs_ ) {
        if ( this != std::addressof ( rhs_ ) ) {
            ensure_unborrowed ( );
            rhs_.ensure_unborrowed ( );
            nodes    = std::move ( rhs_.nodes );
            root_ids = std::move ( rhs_.root_ids );
            rhs_.nodes.clear ( );
            rhs_.root_ids.clear ( );
        }
        return *this;
    }

    // Duplicating a forest duplicates payloads, see clone_subtree ( ).
    basic_forest ( basic_forest const & ) = delete;
    basic_forest & operator= ( basic_forest const & ) = delete;

    ~basic_forest ( ) noexcept {
        if ( HEDLEY_UNLIKELY ( 0 != borrows ) )
            detail::fatal_failure ( "arbor: forest destroyed while a traversal over it is alive" );
    }

    [[nodiscard]] const_pointer lookup ( instance_id id_ ) const noexcept {
        auto it = nodes.find ( id_ );
        return nodes.end ( ) != it ? std::addressof ( it->second ) : nullptr;
    }
    // The payload of the returned node may be edited, its place in the forest only through the forest.
    [[nodiscard]] pointer lookup_mut ( instance_id id_ ) noexcept {
        auto it = nodes.find ( id_ );
        return nodes.end ( ) != it ? std::addressof ( it->second ) : nullptr;
    }

    [[nodiscard]] bool contains ( instance_id id_ ) const noexcept { return nodes.contains ( id_ ); }
    [[nodiscard]] root_set const & roots ( ) const noexcept { return root_ids; }
    [[nodiscard]] size_type size ( ) const noexcept { return nodes.size ( ); }
    [[nodiscard]] bool empty ( ) const noexcept { return nodes.empty ( ); }

    // Not safe while a traversal is alive.
    void clear ( ) {
        ensure_unborrowed ( );
        nodes.clear ( );
        root_ids.clear ( );
    }

    // Adds a node holding payload_ under parent_id_, as its last child, or as a new root if parent_id_ is empty.
    // Throws contract_violation if parent_id_ is not in this forest.
    [[maybe_unused]] instance_id insert_instance ( Payload && payload_, std::optional<instance_id> parent_id_ = std::nullopt ) {
        return emplace_instance ( parent_id_, std::move ( payload_ ) );
    }
    [[maybe_unused]] instance_id insert_instance ( Payload const & payload_, std::optional<instance_id> parent_id_ = std::nullopt ) {
        return emplace_instance ( parent_id_, payload_ );
    }

    // As insert_instance ( ), constructing the payload in place from args_.
    template<typename... Args>
    [[maybe_unused]] instance_id emplace_instance ( std::optional<instance_id> parent_id_, Args &&... args_ ) {
        ensure_unborrowed ( );
        pointer parent = nullptr;
        if ( parent_id_ ) {
            parent = lookup_mut ( *parent_id_ );
            if ( HEDLEY_UNLIKELY ( not parent ) )
                detail::contract_failure ( "arbor: cannot insert an instance under a parent that is not in this forest" );
        }
        instance_id const id = instance_id::new_unique ( );
        auto [ it, inserted ] = nodes.emplace ( id, node_type{ id, parent_id_, std::forward<Args> ( args_ )... } );
        if ( HEDLEY_UNLIKELY ( not inserted ) )
            detail::fatal_failure ( "arbor: a freshly minted instance id is already in this forest" );
        try {
            link ( parent, id, std::nullopt );
        }
        catch ( ... ) {
            nodes.erase ( it );
            throw;
        }
        return id;
    }

    // Detaches the subtree rooted at root_id_ and returns it as a forest of its own, with root_id_ as its sole
    // root. The subtree keeps its internal shape. Returns an empty optional if root_id_ is not in this forest.
    std::optional<basic_forest> remove_instance ( instance_id root_id_ ) {
        ensure_unborrowed ( );
        if ( not contains ( root_id_ ) )
            return std::nullopt;
        basic_forest subtree;
        subtree.transplant ( *this, root_id_, std::nullopt );
        return std::optional<basic_forest>{ std::move ( subtree ) };
    }

    // Moves the subtree rooted at source_id_ out of source_ and hangs it under new_parent_id_ (appended as the last
    // child), or makes it a root of this forest if new_parent_id_ is empty. Only the moved root's parent changes.
    // source_ may be this forest, in which case new_parent_id_ must not lie inside the moved subtree.
    void transplant ( basic_forest & source_, instance_id source_id_, std::optional<instance_id> new_parent_id_ ) {
        transplant_impl ( source_, source_id_, new_parent_id_, std::nullopt );
    }
    // As above, inserting the moved root at position index_ of new_parent_id_'s child list (index_ <= fan). The
    // position is ignored for a new root.
    void transplant ( basic_forest & source_, instance_id source_id_, std::optional<instance_id> new_parent_id_, size_type index_ ) {
        transplant_impl ( source_, source_id_, new_parent_id_, index_ );
    }

    // Position of id_ in its parent's child list, empty for roots and unknown ids.
    [[nodiscard]] std::optional<size_type> child_index ( instance_id id_ ) const noexcept {
        const_pointer node = lookup ( id_ );
        if ( not node or not node->up )
            return std::nullopt;
        id_vector const & siblings = nodes.find ( *node->up )->second.down;
        return static_cast<size_type> ( std::distance ( siblings.begin ( ), std::find ( siblings.begin ( ), siblings.end ( ), id_ ) ) );
    }

    // The (maximum) depth (or height) is the number of levels from id_ down to its farthest leaf, 0 if id_ is not
    // in the forest. It returns (optionally) the largest number of nodes on one level through width_.
    [[nodiscard]] size_type height ( instance_id id_, size_type * width_ = nullptr ) const {
        size_type max_width = 0, depth = 0, count = 0;
        detail::id_deque queue;
        if ( contains ( id_ ) ) {
            detail::en ( queue, id_ );
            max_width = count = 1;
        }
        while ( count ) {
            while ( count-- ) {
                if ( const_pointer parent = lookup ( detail::de ( queue ) ) )
                    for ( instance_id const child : parent->down )
                        detail::en ( queue, child );
            }
            count = queue.size ( );
            if ( count > max_width )
                max_width = count;
            depth += 1;
        }
        if ( width_ )
            *width_ = max_width;
        return depth;
    }

    // Walks id_ and everything below it, depth-first. The forest must not be structurally changed while the
    // returned iterator is alive (contract_violation).
    class const_descendant_iterator {
        friend class basic_forest;

        borrow guard;
        detail::id_vector stack;
        const_pointer node = nullptr;
        traversal_order order;

        const_descendant_iterator ( basic_forest const & forest_, instance_id id_, traversal_order order_ ) :
            guard{ forest_ }, order{ order_ } {
            stack.reserve ( detail::reserve_size );
            detail::push ( stack, id_ );
            this->operator++ ( );
        }

        public:
        // Lets a range-for drive the (non-copyable) iterator.
        class cursor {
            const_descendant_iterator * it;

            public:
            explicit cursor ( const_descendant_iterator & it_ ) noexcept : it{ std::addressof ( it_ ) } {}
            [[maybe_unused]] cursor & operator++ ( ) {
                ++*it;
                return *this;
            }
            [[nodiscard]] const_reference operator* ( ) const noexcept { return **it; }
            [[nodiscard]] bool operator== ( std::default_sentinel_t ) const noexcept { return not it->is_valid ( ); }
        };

        const_descendant_iterator ( const_descendant_iterator && rhs_ ) noexcept :
            guard{ std::move ( rhs_.guard ) }, stack{ std::move ( rhs_.stack ) }, node{ std::exchange ( rhs_.node, nullptr ) },
            order{ rhs_.order } {}

        const_descendant_iterator ( const_descendant_iterator const & ) = delete;
        const_descendant_iterator & operator= ( const_descendant_iterator const & ) = delete;
        const_descendant_iterator & operator= ( const_descendant_iterator && ) = delete;

        [[maybe_unused]] const_descendant_iterator & operator++ ( ) {
            node = nullptr;
            while ( stack.size ( ) ) {
                const_pointer next = guard.get ( ).lookup ( detail::pop ( stack ) );
                if ( not next ) // removed, or a dangling child id.
                    continue;
                if ( traversal_order::reverse_child_order == order )
                    for ( instance_id const child : next->down )
                        detail::push ( stack, child );
                else
                    for ( auto child = next->down.rbegin ( ); child != next->down.rend ( ); ++child )
                        detail::push ( stack, *child );
                node = next;
                break;
            }
            return *this;
        }
        [[nodiscard]] const_reference operator* ( ) const noexcept { return *node; }
        [[nodiscard]] const_pointer operator-> ( ) const noexcept { return node; }
        [[nodiscard]] bool is_valid ( ) const noexcept { return nullptr != node; }
        [[nodiscard]] instance_id id ( ) const noexcept { return node ? node->self : instance_id{ }; }

        [[nodiscard]] cursor begin ( ) noexcept { return cursor{ *this }; }
        [[nodiscard]] std::default_sentinel_t end ( ) const noexcept { return { }; }
    };

    // Walks from id_ up to its root, id_ included.
    class const_up_iterator {
        friend class basic_forest;

        borrow guard;
        const_pointer node;

        const_up_iterator ( basic_forest const & forest_, instance_id id_ ) : guard{ forest_ }, node{ forest_.lookup ( id_ ) } {}

        public:
        const_up_iterator ( const_up_iterator && rhs_ ) noexcept :
            guard{ std::move ( rhs_.guard ) }, node{ std::exchange ( rhs_.node, nullptr ) } {}

        const_up_iterator ( const_up_iterator const & ) = delete;
        const_up_iterator & operator= ( const_up_iterator const & ) = delete;
        const_up_iterator & operator= ( const_up_iterator && ) = delete;

        [[maybe_unused]] const_up_iterator & operator++ ( ) noexcept {
            node = node->up ? guard.get ( ).lookup ( *node->up ) : nullptr;
            return *this;
        }
        [[nodiscard]] const_reference operator* ( ) const noexcept { return *node; }
        [[nodiscard]] const_pointer operator-> ( ) const noexcept { return node; }
        [[nodiscard]] bool is_valid ( ) const noexcept { return nullptr != node; }
        [[nodiscard]] instance_id id ( ) const noexcept { return node ? node->self : instance_id{ }; }
    };

    // id_ itself comes first. With the default order siblings are visited last to first. A walk must not outlive
    // its forest, hence no walks over temporaries.
    [[nodiscard]] const_descendant_iterator descendants ( instance_id id_,
                                                          traversal_order order_ = traversal_order::reverse_child_order ) const & {
        return const_descendant_iterator{ *this, id_, order_ };
    }
    const_descendant_iterator descendants ( instance_id, traversal_order = traversal_order::reverse_child_order ) const && = delete;

    [[nodiscard]] const_up_iterator ancestors ( instance_id id_ ) const & { return const_up_iterator{ *this, id_ }; }
    const_up_iterator ancestors ( instance_id ) const && = delete;

    // Copies the subtree rooted at id_ into a new forest, under fresh ids, keeping its shape and child order.
    template<typename P = Payload>
    [[nodiscard]] std::enable_if_t<std::is_copy_constructible<P>::value, std::optional<basic_forest>>
    clone_subtree ( instance_id id_ ) const {
        if ( not contains ( id_ ) )
            return std::nullopt;
        using visit = std::pair<instance_id, std::optional<instance_id>>; // source, parent in the copy.
        std::vector<visit, tbb::tbb_allocator<visit>> to_visit{ visit{ id_, std::nullopt } };
        basic_forest copy;
        while ( to_visit.size ( ) ) {
            auto [ id, parent ] = to_visit.back ( );
            to_visit.pop_back ( );
            const_pointer node = lookup ( id );
            if ( not node )
                continue;
            instance_id const clone = copy.insert_instance ( node->data, parent );
            for ( auto child = node->down.rbegin ( ); child != node->down.rend ( ); ++child )
                to_visit.emplace_back ( *child, clone );
        }
        return std::optional<basic_forest>{ std::move ( copy ) };
    }

    // Checks the structural invariants: parent and child links agree, the root set is exactly the parentless
    // nodes, child lists hold no duplicates or dangling ids, every node hangs off a root (no cycles).
    [[nodiscard]] bool validate_invariants ( std::string * diagnostic_ = nullptr ) const {
        auto fail = [ diagnostic_ ] ( auto const &... what_ ) {
            if ( diagnostic_ ) {
                std::ostringstream out;
                ( out << ... << what_ );
                *diagnostic_ = out.str ( );
            }
            return false;
        };
        size_type parentless = 0;
        for ( auto const & [ id, node ] : nodes ) {
            if ( id != node.self )
                return fail ( "node stored under ", id.id, " carries id ", node.self.id );
            if ( node.up ) {
                auto parent = nodes.find ( *node.up );
                if ( nodes.end ( ) == parent )
                    return fail ( "parent ", node.up->id, " of ", id.id, " is not in the forest" );
                if ( 1 != std::count ( parent->second.down.begin ( ), parent->second.down.end ( ), id ) )
                    return fail ( id.id, " is not listed exactly once among the children of ", node.up->id );
            }
            else {
                parentless += 1;
                if ( not root_ids.contains ( id ) )
                    return fail ( "parentless ", id.id, " is not a root" );
            }
            detail::id_set seen;
            for ( instance_id const child : node.down ) {
                if ( not seen.insert ( child ).second )
                    return fail ( "child ", child.id, " listed twice under ", id.id );
                auto it = nodes.find ( child );
                if ( nodes.end ( ) == it )
                    return fail ( "child ", child.id, " of ", id.id, " is not in the forest" );
                if ( it->second.up != std::optional<instance_id>{ id } )
                    return fail ( "child ", child.id, " of ", id.id, " does not point back at it" );
            }
        }
        if ( parentless != root_ids.size ( ) )
            return fail ( "root set holds ", root_ids.size ( ), " ids for ", parentless, " parentless nodes" );
        // Every node reachable from exactly one root, once.
        detail::id_set reached;
        detail::id_vector stack ( root_ids.begin ( ), root_ids.end ( ) );
        while ( stack.size ( ) ) {
            instance_id const id = detail::pop ( stack );
            if ( not reached.insert ( id ).second )
                return fail ( id.id, " is reachable twice" );
            for ( instance_id const child : nodes.find ( id )->second.down )
                detail::push ( stack, child );
        }
        if ( reached.size ( ) != nodes.size ( ) )
            return fail ( nodes.size ( ) - reached.size ( ), " nodes are not reachable from a root (cycle)" );
        return true;
    }

#if ARBOR_USE_IO
    // Prints every tree, roots in id order, children in child-list order, one node per line indented by depth.
    template<typename Stream>
    [[maybe_unused]] friend Stream & operator<< ( Stream & out_, basic_forest const & forest_ ) {
        using char_type = typename Stream::char_type;
        std::vector<std::pair<instance_id, size_type>> to_visit;
        std::vector<instance_id> roots ( forest_.root_ids.begin ( ), forest_.root_ids.end ( ) );
        std::sort ( roots.rbegin ( ), roots.rend ( ) );
        for ( instance_id const root : roots )
            to_visit.emplace_back ( root, 0 );
        while ( to_visit.size ( ) ) {
            auto [ id, depth ] = to_visit.back ( );
            to_visit.pop_back ( );
            const_pointer node = forest_.lookup ( id );
            if ( not node )
                continue;
            for ( size_type i = 0; i < depth; ++i )
                out_ << static_cast<char_type> ( ' ' ) << static_cast<char_type> ( ' ' );
            out_ << *node << static_cast<char_type> ( '\n' );
            for ( auto child = node->children_ids ( ).rbegin ( ); child != node->children_ids ( ).rend ( ); ++child )
                to_visit.emplace_back ( *child, depth + 1 );
        }
        return out_;
    }
#endif

    private:
    void ensure_unborrowed ( ) const {
        if ( HEDLEY_UNLIKELY ( 0 != borrows ) )
            detail::contract_failure ( "arbor: structural change to a forest while a traversal over it is alive" );
    }

    void link ( pointer parent_, instance_id id_, std::optional<size_type> index_ ) {
        if ( parent_ ) {
            if ( index_ )
                parent_->down.insert ( parent_->down.begin ( ) + static_cast<std::ptrdiff_t> ( *index_ ), id_ );
            else
                parent_->down.push_back ( id_ );
        }
        else {
            root_ids.insert ( id_ );
        }
    }

    void unlink ( node_type const & node_ ) {
        if ( node_.up ) {
            id_vector & siblings = nodes.find ( *node_.up )->second.down;
            auto it              = std::find ( siblings.begin ( ), siblings.end ( ), node_.self );
            if ( HEDLEY_UNLIKELY ( siblings.end ( ) == it ) )
                detail::contract_failure ( "arbor: instance is missing from its parent's child list" );
            siblings.erase ( it );
        }
        else {
            root_ids.erase ( node_.self );
        }
    }

    // True if ancestor_ is id_ or lies on the path from id_ up to its root.
    [[nodiscard]] bool is_ancestor_or_self ( instance_id ancestor_, instance_id id_ ) const {
        for ( const_up_iterator it = ancestors ( id_ ); it.is_valid ( ); ++it )
            if ( ancestor_ == it.id ( ) )
                return true;
        return false;
    }

    void transplant_impl ( basic_forest & source_, instance_id source_id_, std::optional<instance_id> new_parent_id_,
                           std::optional<size_type> index_ ) {
        // All checks before the first change, a throw leaves both forests as they were.
        ensure_unborrowed ( );
        source_.ensure_unborrowed ( );
        pointer root = source_.lookup_mut ( source_id_ );
        if ( HEDLEY_UNLIKELY ( not root ) )
            detail::contract_failure ( "arbor: transplant source is not in the source forest" );
        pointer new_parent = nullptr;
        if ( new_parent_id_ ) {
            new_parent = lookup_mut ( *new_parent_id_ );
            if ( HEDLEY_UNLIKELY ( not new_parent ) )
                detail::contract_failure ( "arbor: cannot transplant under a parent that is not in this forest" );
        }
        bool const within = this == std::addressof ( source_ );
        if ( not new_parent )
            index_.reset ( );
        if ( index_ ) {
            size_type const fan = new_parent->down.size ( ) - static_cast<size_type> ( within and root->up == new_parent_id_ );
            if ( HEDLEY_UNLIKELY ( *index_ > fan ) )
                detail::contract_failure ( "arbor: transplant position is past the end of the child list" );
        }
        if ( within ) {
            if ( HEDLEY_UNLIKELY ( new_parent_id_ and is_ancestor_or_self ( source_id_, *new_parent_id_ ) ) )
                detail::contract_failure ( "arbor: cannot transplant an instance under itself or one of its descendants" );
            unlink ( *root );
            root->up = new_parent_id_;
            link ( new_parent, source_id_, index_ );
            return;
        }
        for ( const_descendant_iterator it = source_.descendants ( source_id_ ); it.is_valid ( ); ++it )
            if ( HEDLEY_UNLIKELY ( contains ( it.id ( ) ) ) )
                detail::contract_failure ( "arbor: transplant would duplicate an instance id already in this forest" );

        source_.unlink ( *root );
        detail::id_vector to_visit;
        to_visit.reserve ( detail::reserve_size );
        detail::push ( to_visit, source_id_ );
        while ( to_visit.size ( ) ) {
            auto it = source_.nodes.find ( detail::pop ( to_visit ) );
            if ( source_.nodes.end ( ) == it ) // visited twice through a malformed child list.
                continue;
            // The child list travels with the node, read it before the node leaves source_.
            for ( instance_id const child : it->second.down )
                detail::push ( to_visit, child );
            nodes.insert ( source_.nodes.extract ( it ) );
        }
        // Extraction keeps the node in place, root still points at it.
        root->up = new_parent_id_;
        link ( new_parent, source_id_, index_ );
    }

#if ARBOR_USE_CEREAL
    // The nodes, as one sequence in the archive.
    template<typename Forest>
    struct node_sequence {
        Forest * forest;

        template<class Archive>
        void save ( Archive & ar_ ) const {
            ar_ ( cereal::make_size_tag ( static_cast<cereal::size_type> ( forest->nodes.size ( ) ) ) );
            for ( auto const & [ id, node ] : forest->nodes )
                ar_ ( node );
        }
        template<class Archive>
        void load ( Archive & ar_ ) {
            cereal::size_type count;
            ar_ ( cereal::make_size_tag ( count ) );
            for ( ; count; --count ) {
                node_type node;
                ar_ ( node );
                instance_id const id = node.self;
                if ( not forest->nodes.emplace ( id, std::move ( node ) ).second )
                    throw cereal::Exception ( "arbor: instance id occurs twice in the archive" );
                // Loaded ids were minted by another process (or an earlier run).
                instance_id::reserve ( id );
            }
        }
    };

    friend class cereal::access;

    template<class Archive>
    void save ( Archive & ar_ ) const {
        std::vector<instance_id> roots ( root_ids.begin ( ), root_ids.end ( ) );
        std::sort ( roots.begin ( ), roots.end ( ) );
        ar_ ( cereal::make_nvp ( "Roots", roots ), cereal::make_nvp ( "Instances", node_sequence<basic_forest const>{ this } ) );
    }

    template<class Archive>
    void load ( Archive & ar_ ) {
        clear ( );
        std::vector<instance_id> roots;
        try {
            ar_ ( cereal::make_nvp ( "Roots", roots ), cereal::make_nvp ( "Instances", node_sequence<basic_forest>{ this } ) );
            root_ids.insert ( roots.begin ( ), roots.end ( ) );
        }
        catch ( ... ) {
            nodes.clear ( );
            root_ids.clear ( );
            throw;
        }
        if ( std::string diagnostic; not validate_invariants ( std::addressof ( diagnostic ) ) ) {
            nodes.clear ( );
            root_ids.clear ( );
            throw cereal::Exception ( "arbor: archive holds an inconsistent forest: " + diagnostic );
        }
    }
#endif

    node_map nodes;
    root_set root_ids;
    mutable int borrows = 0;
};

} // namespace arbor

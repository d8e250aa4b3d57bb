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

#include <atomic>
#include <functional>
#include <type_traits>

#include "config.hpp"

#if ARBOR_USE_CEREAL
#    include <cereal/cereal.hpp>
#endif

namespace arbor {

// Identifies a node for the lifetime of the process, across all forests.
struct instance_id {

    std::uint64_t id;

    constexpr instance_id ( ) noexcept : id{ invalid_v } {}
    constexpr explicit instance_id ( std::uint64_t const & value_ ) noexcept : id{ value_ } {}

    // Creates a new, never before handed out, id.
    [[nodiscard]] static instance_id new_unique ( ) noexcept {
        return instance_id{ generator ( ).fetch_add ( 1, std::memory_order_relaxed ) };
    }

    // Makes sure new_unique ( ) never hands out used_, for ids that came from elsewhere (an archive).
    static void reserve ( instance_id const used_ ) noexcept {
        std::atomic<std::uint64_t> & next = generator ( );
        std::uint64_t current             = next.load ( std::memory_order_relaxed );
        while ( current <= used_.id and not next.compare_exchange_weak ( current, used_.id + 1, std::memory_order_relaxed ) )
            ;
    }

    [[nodiscard]] bool operator== ( instance_id const rhs_ ) const noexcept { return id == rhs_.id; }
    [[nodiscard]] bool operator!= ( instance_id const rhs_ ) const noexcept { return id != rhs_.id; }
    [[nodiscard]] bool operator< ( instance_id const rhs_ ) const noexcept { return id < rhs_.id; }

    [[nodiscard]] bool is_valid ( ) const noexcept { return invalid_v != id; }
    [[nodiscard]] bool is_invalid ( ) const noexcept { return not is_valid ( ); }

#if ARBOR_USE_IO
    template<typename Stream>
    [[maybe_unused]] friend Stream & operator<< ( Stream & out_, instance_id const id_ ) noexcept {
        if ( id_.is_invalid ( ) ) {
            if constexpr ( std::is_same<typename Stream::char_type, wchar_t>::value ) {
                out_ << L'*';
            }
            else {
                out_ << '*';
            }
        }
        else {
            out_ << id_.id;
        }
        return out_;
    }
#endif

    static constexpr std::uint64_t invalid_v = 0;

    private:
    [[nodiscard]] static std::atomic<std::uint64_t> & generator ( ) noexcept {
        static std::atomic<std::uint64_t> next = 1;
        return next;
    }

#if ARBOR_USE_CEREAL
    friend class cereal::access;
    template<class Archive>
    inline void serialize ( Archive & ar_ ) {
        ar_ ( id );
    }
#endif
};

static_assert ( sizeof ( instance_id ) == 8 );
static_assert ( std::is_trivially_copyable<instance_id>::value );

} // namespace arbor

namespace std {
template<>
struct hash<arbor::instance_id> {
    [[nodiscard]] std::size_t operator( ) ( arbor::instance_id const id_ ) const noexcept {
        return std::hash<std::uint64_t>{ }( id_.id );
    }
};
} // namespace std

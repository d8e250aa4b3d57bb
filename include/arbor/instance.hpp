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

#include <cstdint>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "config.hpp"

#if ARBOR_USE_CEREAL
#    include <cereal/cereal.hpp>
#    include <cereal/types/map.hpp>
#    include <cereal/types/string.hpp>
#    include <cereal/types/variant.hpp>
#endif

namespace arbor {

using property_value = std::variant<bool, std::int32_t, std::int64_t, float, double, std::string>;
using property_map   = std::map<std::string, property_value, std::less<>>;

// The per-node data of a document: what kind of thing it is, what it is called and its properties. A forest
// stores, moves and hands these out, it never looks inside.
struct instance {

    std::string name;
    std::string class_name;
    property_map properties;

    instance ( ) = default;
    instance ( std::string name_, std::string class_name_ ) : name{ std::move ( name_ ) }, class_name{ std::move ( class_name_ ) } {}
    instance ( std::string name_, std::string class_name_, property_map properties_ ) :
        name{ std::move ( name_ ) }, class_name{ std::move ( class_name_ ) }, properties{ std::move ( properties_ ) } {}

    // Returns nullptr if the property is not set.
    [[nodiscard]] property_value const * property ( std::string_view key_ ) const noexcept {
        auto it = properties.find ( key_ );
        return properties.end ( ) != it ? std::addressof ( it->second ) : nullptr;
    }

    template<typename Value>
    [[maybe_unused]] property_value & set_property ( std::string key_, Value && value_ ) {
        return properties.insert_or_assign ( std::move ( key_ ), property_value{ std::forward<Value> ( value_ ) } ).first->second;
    }

    [[nodiscard]] bool is_a ( std::string_view class_name_ ) const noexcept { return class_name == class_name_; }

    [[nodiscard]] bool operator== ( instance const & rhs_ ) const = default;

#if ARBOR_USE_CEREAL
    private:
    friend class cereal::access;
    template<class Archive>
    inline void serialize ( Archive & ar_ ) {
        ar_ ( cereal::make_nvp ( "Name", name ), cereal::make_nvp ( "ClassName", class_name ),
              cereal::make_nvp ( "Properties", properties ) );
    }
#endif
};

} // namespace arbor

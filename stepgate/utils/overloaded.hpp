/*!
 * @file
 * @brief Helpers to simplify working with std::variant.
 */

#pragma once

#include <variant>

namespace stepgate::utils
{

//
// overloaded
//
/*
 * Usage example:
 * @code
 * std::visit( overloaded{
 * 		[]( const route_gate::pass_t & ) { ... },
 * 		[]( const route_gate::redirect_t & r ) { ... }
 * 	},
 * 	gate.check( path, cookie_header ) );
 * @endcode
 *
 * Source: https://en.cppreference.com/w/cpp/utility/variant/visit
 */
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} /* namespace stepgate::utils */


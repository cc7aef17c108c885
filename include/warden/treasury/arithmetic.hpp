#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>

namespace warden::treasury {

/// floor(a * b / denominator) with a 512-bit intermediate. Fails on a zero
/// denominator or when the quotient does not fit in 256 bits.
warden::schema::result_t<warden::schema::amount_t> mul_div(
    const warden::schema::amount_t& a,
    const warden::schema::amount_t& b,
    const warden::schema::amount_t& denominator);

warden::schema::result_t<warden::schema::amount_t> checked_add(
    const warden::schema::amount_t& a,
    const warden::schema::amount_t& b);

warden::schema::result_t<warden::schema::amount_t> checked_sub(
    const warden::schema::amount_t& a,
    const warden::schema::amount_t& b);

}  // namespace warden::treasury

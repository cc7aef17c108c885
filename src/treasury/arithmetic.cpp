#include <warden/treasury/arithmetic.hpp>
#include <limits>

namespace warden::treasury {

warden::schema::result_t<warden::schema::amount_t> mul_div(
    const warden::schema::amount_t& a,
    const warden::schema::amount_t& b,
    const warden::schema::amount_t& denominator) {
  if (denominator == 0) {
    return warden::schema::make_error(
        warden::schema::error_code::division_by_zero, "mulDiv: division by zero");
  }
  auto product = warden::schema::wide_amount_t{a} *
                 warden::schema::wide_amount_t{b};
  auto quotient = warden::schema::wide_amount_t{
      product / warden::schema::wide_amount_t{denominator}};
  if (quotient > warden::schema::wide_amount_t{
                     std::numeric_limits<warden::schema::amount_t>::max()}) {
    return warden::schema::make_error(
        warden::schema::error_code::arithmetic_overflow,
        "mulDiv: result does not fit in 256 bits");
  }
  return quotient.convert_to<warden::schema::amount_t>();
}

warden::schema::result_t<warden::schema::amount_t> checked_add(
    const warden::schema::amount_t& a,
    const warden::schema::amount_t& b) {
  auto sum = a + b;
  if (sum < a) {
    return warden::schema::make_error(
        warden::schema::error_code::arithmetic_overflow,
        "addition overflows 256 bits");
  }
  return sum;
}

warden::schema::result_t<warden::schema::amount_t> checked_sub(
    const warden::schema::amount_t& a,
    const warden::schema::amount_t& b) {
  if (b > a) {
    return warden::schema::make_error(
        warden::schema::error_code::arithmetic_underflow,
        "subtraction underflows zero");
  }
  return warden::schema::amount_t{a - b};
}

}  // namespace warden::treasury

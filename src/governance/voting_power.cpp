#include <ballot/governance/voting_power.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>

namespace ballot::governance {

ballot::schema::amount_t apply_weighting(
    const ballot::schema::vote_weighting_t weighting,
    const ballot::schema::amount_t& power,
    const uint32_t reputation) {
  switch (weighting) {
    case ballot::schema::vote_weighting_t::linear:
      return power;
    case ballot::schema::vote_weighting_t::quadratic:
      return boost::multiprecision::sqrt(power);
    case ballot::schema::vote_weighting_t::reputation: {
      // Widen so power * (100 + reputation) cannot wrap at 256 bits.
      auto scaled = boost::multiprecision::cpp_int{power} *
                    (boost::multiprecision::cpp_int{100} + reputation) / 100;
      if (scaled > boost::multiprecision::cpp_int{
                       std::numeric_limits<ballot::schema::amount_t>::max()}) {
        return std::numeric_limits<ballot::schema::amount_t>::max();
      }
      return static_cast<ballot::schema::amount_t>(scaled);
    }
  }
  return power;
}

}  // namespace ballot::governance

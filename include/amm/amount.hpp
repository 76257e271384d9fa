#pragma once
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// Token quantities in base units. Arbitrary precision so products of two
// uint112 reserves and a fee factor never overflow.
using Amount = boost::multiprecision::cpp_int;

// Parses a non-negative decimal string ("5000000000000000000"); throws std::invalid_argument otherwise.
Amount ParseAmount(const std::string& decimal);

// Base-10 rendering used for logs and persistence.
inline std::string AmountToString(const Amount& a) { return a.str(); }

#include "amm/amount.hpp"
#include <cctype>
#include <stdexcept>

Amount ParseAmount(const std::string& decimal) {
  if (decimal.empty()) throw std::invalid_argument("empty amount");
  Amount out = 0;
  for (char c : decimal) {
    if (c == '_') continue;
    if (!std::isdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("not a decimal amount: " + decimal);
    out = out * 10 + (c - '0');
  }
  return out;
}

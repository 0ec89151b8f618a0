#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "subnetcore/address.hpp"
#include "subnetcore/network.hpp"

namespace Subnetter
{
enum class EInputError
{
    InvalidFormat,
    InvalidAddress,
    InvalidPrefix,
    InvalidHostCount
};

class InputError : public std::runtime_error
{
  public:
    InputError(EInputError kind, const std::string &what)
        : std::runtime_error(what), m_kind(kind)
    {
    }

    EInputError kind() const
    {
        return m_kind;
    }

  private:
    EInputError m_kind;
};

// All parsers throw InputError on malformed text

Address parseAddress(const std::string &text);

uint8_t parsePrefix(const std::string &text);

// "192.168.1.10/24"; surrounding whitespace is ignored
Network parseCidr(const std::string &text);

// Positive integers separated by spaces and/or commas; empty text gives an empty list
std::vector<uint64_t> parseHostCounts(const std::string &text);

} // namespace Subnetter

#include "subnetcore/input.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string.hpp>

#include "logger/logger.hpp"

namespace Subnetter
{

namespace
{
bool isNumber(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                        { return std::isdigit(c); });
}
} // namespace

Address parseAddress(const std::string &text)
{
    const std::string trimmed = boost::algorithm::trim_copy(text);

    // inet_pton would also take forms like "1.2.3"; insist on four octets
    if (std::count(trimmed.begin(), trimmed.end(), '.') != 3)
    {
        SUBNETTER_DBG_LOG("rejecting address '", text, "'");
        throw InputError(EInputError::InvalidAddress, "Invalid IP address: '" + text + "'");
    }

    boost::system::error_code ec;
    Address address = boost::asio::ip::make_address_v4(trimmed, ec);

    if (ec)
    {
        SUBNETTER_DBG_LOG("rejecting address '", text, "': ", ec.message());
        throw InputError(EInputError::InvalidAddress, "Invalid IP address: '" + text + "'");
    }

    return address;
}

uint8_t parsePrefix(const std::string &text)
{
    const std::string trimmed = boost::algorithm::trim_copy(text);

    if (!isNumber(trimmed) || trimmed.size() > 2 || std::stoi(trimmed) > c_max_prefix)
    {
        SUBNETTER_DBG_LOG("rejecting prefix '", text, "'");
        throw InputError(EInputError::InvalidPrefix, "Invalid prefix '" + text + "'! Use a number between 0 and 32.");
    }

    return static_cast<uint8_t>(std::stoi(trimmed));
}

Network parseCidr(const std::string &text)
{
    std::vector<std::string> parts;
    boost::algorithm::split(parts, boost::algorithm::trim_copy(text), boost::algorithm::is_any_of("/"));

    if (parts.size() != 2)
        throw InputError(EInputError::InvalidFormat, "Invalid format! Use IP/CIDR like 192.168.1.10/24");

    return Network{parseAddress(parts[0]), parsePrefix(parts[1])};
}

std::vector<uint64_t> parseHostCounts(const std::string &text)
{
    std::vector<std::string> tokens;
    const std::string trimmed = boost::algorithm::trim_copy(text);

    if (trimmed.empty())
        return {};

    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_any_of(", \t"), boost::algorithm::token_compress_on);

    std::vector<uint64_t> counts;
    counts.reserve(tokens.size());

    for (const std::string &token : tokens)
    {
        if (token.empty())
            continue;

        uint64_t count = 0;

        try
        {
            count = isNumber(token) ? std::stoull(token) : 0;
        }
        catch (const std::out_of_range &)
        {
            count = 0;
        }

        if (count == 0)
        {
            SUBNETTER_DBG_LOG("rejecting host count '", token, "'");
            throw InputError(EInputError::InvalidHostCount, "Invalid host count '" + token + "'! Use positive whole numbers.");
        }

        counts.push_back(count);
    }

    return counts;
}

} // namespace Subnetter

#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "printer.hpp"

namespace Subnetter
{
namespace Cli
{

// Line based prompt loop: IP/prefix, then host counts, until "exit" or end of input
class Shell
{
  public:
    Shell(std::istream &in, std::ostream &out, Palette palette)
        : m_in(in), m_out(out), m_palette(palette)
    {
    }

    void run();

  private:
    bool readLine(std::string &line);
    void handle(const std::string &cidr_line, const std::string &hosts_line);

    std::istream &m_in;
    std::ostream &m_out;
    Palette m_palette;
};

// One-shot variants used by main for --network/--hosts; return false on error
bool reportNetwork(std::ostream &out, const std::string &cidr, const Palette &palette);

bool planNetwork(std::ostream &out, const std::string &cidr, const std::string &host_counts, const Palette &palette);

} // namespace Cli
} // namespace Subnetter

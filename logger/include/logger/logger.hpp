#pragma once

#include <iostream>

namespace Subnetter
{
namespace Logger
{

inline void outputDebug(const char *file, unsigned line)
{
    std::clog << "[DBG] " << file << ":" << line << ": ";
}

template <typename... Args>
inline void outputDebug(const char *file, unsigned line, Args &&...args)
{
    outputDebug(file, line);
    (std::clog << ... << std::forward<Args>(args)) << '\n';
}

inline void doNothing() {}

#if SUBNETTER_ENABLE_DEBUG_LOG
#define SUBNETTER_DBG_LOG(...) Subnetter::Logger::outputDebug(__FILE__, __LINE__, __VA_ARGS__)
#else
#define SUBNETTER_DBG_LOG(...) (Subnetter::Logger::doNothing())
#endif

} // namespace Logger
} // namespace Subnetter

#include "cipherbook/security/MemoryWiper.hpp"

#include <cstring>
#if defined(__GLIBC__) || defined(__OpenBSD__) || defined(__FreeBSD__)
#include <string.h>
#define CPBK_HAVE_EXPLICIT_BZERO 1
#endif

namespace cipherbook::security
{
namespace
{

#if !defined(CPBK_HAVE_EXPLICIT_BZERO)
// Calls memset through a volatile pointer so the store cannot be proven dead.
void* (*const volatile g_memsetFn)(void*, int, std::size_t){ &std::memset };
#endif

} // namespace

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(CPBK_HAVE_EXPLICIT_BZERO)
    ::explicit_bzero(bytes.data(), bytes.size());
#else
    g_memsetFn(bytes.data(), 0, bytes.size());
#endif
}

} // namespace cipherbook::security

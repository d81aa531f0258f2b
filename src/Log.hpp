#ifndef ANDES_LOG_HPP
#define ANDES_LOG_HPP

#include <cstdarg>
#include <cstdio>

namespace andes {

// printf-style logging to stdout, flushed on every call.
void dprintf(const char* format, ...);

// Verbose mode additionally dumps every command record and status word.
void set_verbose(bool verbose);
bool is_verbose();

// Like dprintf, but only when verbose mode is on.
void verbose_printf(const char* format, ...);

}

#endif

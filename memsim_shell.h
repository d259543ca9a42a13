// Line-oriented command interpreter driving a MemorySpace
#ifndef MEMSIM_SHELL_H
#define MEMSIM_SHELL_H

#include <istream>
#include <ostream>
#include <string>

#include "memory_space.h"

// Accepts only a whole decimal integer.
bool parse_int(const std::string& text, int& value);

/*
 * Commands, one per line:
 *   malloc <n>     prints the address (or -1)
 *   free <addr>
 *   defrag
 *   dump           prints the free list, then the allocated list
 *   stats
 *   quit
 * Blank lines and lines starting with '#' are skipped. Returns false on
 * quit. Errors raised by the space propagate to the caller.
 */
bool run_command(MemorySpace& space, const std::string& line, std::ostream& out, std::ostream& err);

// Runs commands until quit or end of input. A failing command is
// reported on err as "error: <message>" and the session goes on.
void run_session(MemorySpace& space, std::istream& in, std::ostream& out, std::ostream& err);

#endif // MEMSIM_SHELL_H

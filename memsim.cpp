// memsim: replays malloc/free/defrag commands against a memory space
#include <iostream>

#include "memsim_shell.h"

int main(int argc, char* argv[]) {
    int max_size = DEFAULT_MAX_SIZE;
    if (argc > 2 || (argc == 2 && (!parse_int(argv[1], max_size) || max_size <= 0))) {
        std::cerr << "usage: " << argv[0] << " [max_size]" << std::endl;
        std::cerr << "commands: malloc <n> | free <addr> | defrag | dump | stats | quit" << std::endl;
        return 1;
    }

    MemorySpace space(max_size);
    run_session(space, std::cin, std::cout, std::cerr);
    return 0;
}

#include "memsim_shell.h"

#include <exception>
#include <sstream>
#include <vector>

namespace {

void print_stats(const MemorySpace& space, std::ostream& out) {
    out << "free blocks:      " << space.num_free_blocks() << std::endl;
    out << "free words:       " << space.num_free_words() << std::endl;
    out << "allocated blocks: " << space.num_allocated_blocks() << std::endl;
    out << "allocated words:  " << space.num_allocated_words() << std::endl;
}

} // namespace

bool parse_int(const std::string& text, int& value) {
    std::istringstream in(text);
    in >> value;
    return !in.fail() && in.eof();
}

bool run_command(MemorySpace& space, const std::string& line, std::ostream& out, std::ostream& err) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty() || cmd[0] == '#') {
        return true;
    }

    std::vector<std::string> args;
    std::string arg;
    while (in >> arg) {
        args.push_back(arg);
    }

    if (cmd == "malloc" || cmd == "free") {
        int value = 0;
        if (args.size() != 1 || !parse_int(args[0], value)) {
            err << "error: " << cmd << " needs one integer argument" << std::endl;
            return true;
        }
        if (cmd == "malloc") {
            out << space.malloc(value) << std::endl;
        } else {
            space.free(value);
        }
        return true;
    }

    if (cmd != "defrag" && cmd != "dump" && cmd != "stats" && cmd != "quit") {
        err << "unknown command: " << cmd << std::endl;
        return true;
    }
    if (!args.empty()) {
        err << "error: " << cmd << " takes no arguments" << std::endl;
        return true;
    }

    if (cmd == "defrag") {
        space.defrag();
    } else if (cmd == "dump") {
        out << space << std::endl;
    } else if (cmd == "stats") {
        print_stats(space, out);
    } else {
        return false;
    }
    return true;
}

void run_session(MemorySpace& space, std::istream& in, std::ostream& out, std::ostream& err) {
    std::string line;
    while (std::getline(in, line)) {
        try {
            if (!run_command(space, line, out, err)) {
                break;
            }
        } catch (const std::exception& e) {
            err << "error: " << e.what() << std::endl;
        }
    }
}

// A block of words in the simulated address space
#ifndef MEMSIM_MEMORY_BLOCK_H
#define MEMSIM_MEMORY_BLOCK_H

#include <ostream>

// Covers the words [base_address, base_address + length).
struct MemoryBlock {
    int base_address = 0;
    int length = 0;

    MemoryBlock(int base, int len) : base_address(base), length(len) {}

    // First word past the end of this block.
    int end_address() const { return base_address + length; }
};

inline bool operator==(const MemoryBlock& a, const MemoryBlock& b) {
    return a.base_address == b.base_address && a.length == b.length;
}

inline bool operator!=(const MemoryBlock& a, const MemoryBlock& b) {
    return !(a == b);
}

inline std::ostream& operator<<(std::ostream& os, const MemoryBlock& block) {
    return os << "(" << block.base_address << " , " << block.length << ")";
}

#endif // MEMSIM_MEMORY_BLOCK_H

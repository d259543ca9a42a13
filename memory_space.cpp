// First-fit malloc, free without merge, and explicit defrag
#include "memory_space.h"

#include <sstream>
#include <utility>

namespace {

int total_words(const BlockList& list) {
    int words = 0;
    for (const MemoryBlock* block : list) {
        words += block->length;
    }
    return words;
}

} // namespace

MemorySpace::MemorySpace(int max_size) : max_words(max_size) {
    if (max_size <= 0) {
        throw std::invalid_argument("memory space size must be positive");
    }
    free_blocks.add_last(create_block(0, max_size));
}

MemoryBlock* MemorySpace::create_block(int base_address, int length) {
    std::unique_ptr<MemoryBlock> block(new MemoryBlock(base_address, length));
    MemoryBlock* raw = block.get();
    blocks.emplace(raw, std::move(block));
    return raw;
}

void MemorySpace::release_block(const MemoryBlock* block) {
    blocks.erase(block);
}

int MemorySpace::malloc(int length) {
    if (length <= 0) {
        throw std::invalid_argument("allocation length must be positive");
    }

    Node* node = free_blocks.find_node(
        [length](const MemoryBlock& block) { return block.length >= length; });
    if (node == nullptr) {
        return -1;
    }
    MemoryBlock* found = node->get_block();

    MemoryBlock* allocated = create_block(found->base_address, length);
    try {
        allocated_blocks.add_last(allocated);
    } catch (...) {
        release_block(allocated);
        throw;
    }

    found->base_address += length;
    found->length -= length;
    if (found->length == 0) {
        free_blocks.remove(node);
        release_block(found);
    }
    return allocated->base_address;
}

void MemorySpace::free(int address) {
    if (allocated_blocks.empty()) {
        throw EmptyAllocatedError();
    }

    Node* node = allocated_blocks.find_node(
        [address](const MemoryBlock& candidate) { return candidate.base_address == address; });
    if (node == nullptr) {
        return;
    }
    // Link into the free list first so a failed insert loses nothing
    free_blocks.add_last(node->get_block());
    allocated_blocks.remove(node);
}

void MemorySpace::defrag() {
    // Every merge invalidates the walk, so start over until a full pass
    // finds nothing adjacent.
    bool merged = true;
    while (merged) {
        merged = false;
        for (MemoryBlock* block : free_blocks) {
            const int next_address = block->end_address();
            Node* neighbour = free_blocks.find_node(
                [next_address](const MemoryBlock& candidate) {
                    return candidate.base_address == next_address;
                });
            if (neighbour != nullptr) {
                const MemoryBlock* absorbed = neighbour->get_block();
                block->length += absorbed->length;
                free_blocks.remove(neighbour);
                release_block(absorbed);
                merged = true;
                break;
            }
        }
    }
}

int MemorySpace::num_free_words() const {
    return total_words(free_blocks);
}

int MemorySpace::num_allocated_words() const {
    return total_words(allocated_blocks);
}

std::string MemorySpace::to_string() const {
    std::ostringstream out;
    out << *this;
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const MemorySpace& space) {
    return os << space.free_list() << "\n" << space.allocated_list();
}

// First-fit allocator over a simulated address space of words
#ifndef MEMSIM_MEMORY_SPACE_H
#define MEMSIM_MEMORY_SPACE_H

#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "block_list.h"

const int DEFAULT_MAX_SIZE = 1000;

// Thrown by MemorySpace::free when nothing is allocated.
class EmptyAllocatedError : public std::logic_error {
public:
    EmptyAllocatedError() : std::logic_error("free called with no allocated blocks") {}
};

/*
 * Keeps a free list and an allocated list covering [0, max_size).
 * Every block referenced by either list is owned by the space, and only
 * the space changes them: the lists are handed out read-only.
 *
 * malloc is first-fit in free-list order and splits the front of the
 * block it finds. free appends to the free list without merging;
 * adjacent free blocks are only coalesced by an explicit defrag().
 */
class MemorySpace {
public:
    // Throws std::invalid_argument if max_size <= 0.
    explicit MemorySpace(int max_size);

    MemorySpace(const MemorySpace&) = delete;
    MemorySpace& operator=(const MemorySpace&) = delete;

    // Base address of the new block, or -1 if no free block is large
    // enough. Throws std::invalid_argument if length <= 0.
    int malloc(int length);

    // Throws EmptyAllocatedError if nothing is allocated. An address that
    // is not the base of an allocated block is ignored.
    void free(int address);

    void defrag();

    int max_size() const { return max_words; }
    int num_free_blocks() const { return free_blocks.get_size(); }
    int num_free_words() const;
    int num_allocated_blocks() const { return allocated_blocks.get_size(); }
    int num_allocated_words() const;

    const BlockList& free_list() const { return free_blocks; }
    const BlockList& allocated_list() const { return allocated_blocks; }

    std::string to_string() const;

private:
    MemoryBlock* create_block(int base_address, int length);
    void release_block(const MemoryBlock* block);

    int max_words;
    std::unordered_map<const MemoryBlock*, std::unique_ptr<MemoryBlock>> blocks;
    BlockList free_blocks;
    BlockList allocated_blocks;
};

std::ostream& operator<<(std::ostream& os, const MemorySpace& space);

#endif // MEMSIM_MEMORY_SPACE_H

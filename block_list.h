// Singly linked list of memory block references
#ifndef MEMSIM_BLOCK_LIST_H
#define MEMSIM_BLOCK_LIST_H

#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "memory_block.h"

// Nodes belong to their list; the blocks they point to do not.
class Node {
public:
    explicit Node(MemoryBlock* b) : block(b) {}

    MemoryBlock* get_block() { return block; }
    const MemoryBlock* get_block() const { return block; }

    Node* get_next() { return next.get(); }
    const Node* get_next() const { return next.get(); }

private:
    friend class BlockList;

    MemoryBlock* block;
    std::unique_ptr<Node> next;
};

typedef std::function<bool(const MemoryBlock&)> BlockPredicate;

// NodeT is Node or const Node; blocks come out with the same constness.
template <typename NodeT, typename BlockT>
class BasicBlockIterator {
public:
    explicit BasicBlockIterator(NodeT* node) : current(node) {}

    BlockT* operator*() const { return current->get_block(); }

    BasicBlockIterator& operator++() {
        current = current->get_next();
        return *this;
    }

    bool operator==(const BasicBlockIterator& other) const { return current == other.current; }
    bool operator!=(const BasicBlockIterator& other) const { return current != other.current; }

private:
    NodeT* current;
};

typedef BasicBlockIterator<Node, MemoryBlock> BlockIterator;
typedef BasicBlockIterator<const Node, const MemoryBlock> ConstBlockIterator;

class BlockList {
public:
    BlockList() = default;
    ~BlockList();

    BlockList(const BlockList&) = delete;
    BlockList& operator=(const BlockList&) = delete;

    BlockList(BlockList&& other) noexcept;
    BlockList& operator=(BlockList&& other) noexcept;

    Node* get_first() { return first.get(); }
    const Node* get_first() const { return first.get(); }
    Node* get_last() { return last; }
    const Node* get_last() const { return last; }
    int get_size() const { return size; }
    bool empty() const { return size == 0; }

    // Throws std::out_of_range unless 0 <= index < size.
    Node* get_node(int index) { return node_at(index); }
    const Node* get_node(int index) const { return node_at(index); }
    MemoryBlock* get_block(int index) { return node_at(index)->get_block(); }
    const MemoryBlock* get_block(int index) const { return node_at(index)->get_block(); }

    // Inserts before position index, 0 <= index <= size.
    // O(1) at either end, O(index) in between.
    void add(int index, MemoryBlock* block);
    void add_last(MemoryBlock* block);
    void add_first(MemoryBlock* block);

    // -1 when nothing matches.
    int index_of(const MemoryBlock& block) const;
    int index_of(const BlockPredicate& pred) const;

    // First node whose block matches, or nullptr.
    Node* find_node(const BlockPredicate& pred) { return node_which(pred); }
    const Node* find_node(const BlockPredicate& pred) const { return node_which(pred); }

    /*
     * Three removal flavours with deliberately different failure modes:
     *  - by node: nullptr throws std::invalid_argument, a node that is
     *    not in this list is ignored.
     *  - by index: throws std::out_of_range on a bad index.
     *  - by value: removes the first block equal to the given one and
     *    throws std::out_of_range if there is none.
     */
    void remove(const Node* node);
    void remove(int index);
    void remove(const MemoryBlock& block);

    // New list sharing the matching blocks, in the same order.
    BlockList filter(const BlockPredicate& pred);

    MemoryBlock* first_which(const BlockPredicate& pred);
    const MemoryBlock* first_which(const BlockPredicate& pred) const;

    BlockIterator begin() { return BlockIterator(first.get()); }
    BlockIterator end() { return BlockIterator(nullptr); }
    ConstBlockIterator begin() const { return ConstBlockIterator(first.get()); }
    ConstBlockIterator end() const { return ConstBlockIterator(nullptr); }

    std::string to_string() const;

private:
    Node* node_at(int index) const;
    Node* node_which(const BlockPredicate& pred) const;
    void clear();

    std::unique_ptr<Node> first;
    Node* last = nullptr;
    int size = 0;
};

std::ostream& operator<<(std::ostream& os, const BlockList& list);

#endif // MEMSIM_BLOCK_LIST_H

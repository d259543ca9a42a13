// Block list: positional insert/remove plus predicate search
#include "block_list.h"

#include <sstream>
#include <stdexcept>
#include <utility>

BlockList::~BlockList() {
    clear();
}

BlockList::BlockList(BlockList&& other) noexcept
    : first(std::move(other.first)), last(other.last), size(other.size) {
    other.last = nullptr;
    other.size = 0;
}

BlockList& BlockList::operator=(BlockList&& other) noexcept {
    if (this != &other) {
        clear();
        first = std::move(other.first);
        last = other.last;
        size = other.size;
        other.last = nullptr;
        other.size = 0;
    }
    return *this;
}

// Unlinks one node at a time so long lists don't destroy recursively.
void BlockList::clear() {
    while (first) {
        first = std::move(first->next);
    }
    last = nullptr;
    size = 0;
}

Node* BlockList::node_at(int index) const {
    if (index < 0 || index >= size) {
        throw std::out_of_range("index must be between 0 and size - 1");
    }
    Node* current = first.get();
    for (int i = 0; i < index; i++) {
        current = current->next.get();
    }
    return current;
}

Node* BlockList::node_which(const BlockPredicate& pred) const {
    for (Node* current = first.get(); current != nullptr; current = current->next.get()) {
        if (pred(*current->block)) {
            return current;
        }
    }
    return nullptr;
}

void BlockList::add(int index, MemoryBlock* block) {
    if (index < 0 || index > size) {
        throw std::out_of_range("index must be between 0 and size");
    }
    if (block == nullptr) {
        throw std::invalid_argument("cannot insert a null block");
    }
    if (block->length <= 0) {
        throw std::invalid_argument("cannot insert an empty block");
    }

    std::unique_ptr<Node> node(new Node(block));

    if (index == 0) {
        node->next = std::move(first);
        first = std::move(node);
        if (last == nullptr) {
            last = first.get();
        }
    } else if (index == size) {
        last->next = std::move(node);
        last = last->next.get();
    } else {
        // Link after the node at index - 1
        Node* prev_elem = node_at(index - 1);
        node->next = std::move(prev_elem->next);
        prev_elem->next = std::move(node);
    }
    size++;
}

void BlockList::add_last(MemoryBlock* block) {
    add(size, block);
}

void BlockList::add_first(MemoryBlock* block) {
    add(0, block);
}

int BlockList::index_of(const MemoryBlock& block) const {
    return index_of([&block](const MemoryBlock& candidate) { return candidate == block; });
}

int BlockList::index_of(const BlockPredicate& pred) const {
    int index = 0;
    for (const MemoryBlock* block : *this) {
        if (pred(*block)) {
            return index;
        }
        index++;
    }
    return -1;
}

void BlockList::remove(const Node* node) {
    if (node == nullptr) {
        throw std::invalid_argument("cannot remove a null node");
    }

    Node* prev_elem = nullptr;
    std::unique_ptr<Node>* link = &first;
    while (*link && link->get() != node) {
        prev_elem = link->get();
        link = &(*link)->next;
    }
    if (!*link) {
        return; // not ours
    }

    std::unique_ptr<Node> doomed = std::move(*link);
    *link = std::move(doomed->next);
    if (doomed.get() == last) {
        last = prev_elem;
    }
    size--;
}

void BlockList::remove(int index) {
    remove(get_node(index));
}

void BlockList::remove(const MemoryBlock& block) {
    // index_of gives -1 for a missing block, which get_node rejects
    remove(index_of(block));
}

BlockList BlockList::filter(const BlockPredicate& pred) {
    BlockList result;
    for (MemoryBlock* block : *this) {
        if (pred(*block)) {
            result.add_last(block);
        }
    }
    return result;
}

MemoryBlock* BlockList::first_which(const BlockPredicate& pred) {
    Node* node = node_which(pred);
    return node == nullptr ? nullptr : node->get_block();
}

const MemoryBlock* BlockList::first_which(const BlockPredicate& pred) const {
    const Node* node = node_which(pred);
    return node == nullptr ? nullptr : node->get_block();
}

std::string BlockList::to_string() const {
    std::ostringstream out;
    out << *this;
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const BlockList& list) {
    for (const MemoryBlock* block : list) {
        os << *block << " ";
    }
    return os;
}

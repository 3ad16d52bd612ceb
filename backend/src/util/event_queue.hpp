#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <thread>
#include <utility>

// Unbounded Multi-Producer / Single-Consumer queue.
// - push() never blocks and never fails (allocates one node per element).
// - exactly one consumer thread calls try_pop / pop_for.
//
// Producers swap themselves in at head_ and then link the previous node
// forward; the consumer walks from a stub node at tail_. A push that has
// swapped head_ but not linked yet is simply not visible until it does.
template <typename T>
class EventQueue {
public:
    EventQueue() {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }
    ~EventQueue() {
        Node* n = tail_;
        while (n) {
            Node* next = n->next.load(std::memory_order_relaxed);
            delete n;
            n = next;
        }
    }

    // Non-copyable
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Producer: any thread
    void push(T v) {
        Node* n = new Node();
        n->value.emplace(std::move(v));
        Node* prev = head_.exchange(n, std::memory_order_acq_rel);
        prev->next.store(n, std::memory_order_release);
        size_.fetch_add(1, std::memory_order_relaxed);
    }

    // Consumer: returns false if empty
    bool try_pop(T& out) {
        Node* next = tail_->next.load(std::memory_order_acquire);
        if (!next) return false;
        out = std::move(*next->value);
        next->value.reset();
        delete tail_;
        tail_ = next; // next becomes the new stub
        size_.fetch_sub(1, std::memory_order_relaxed);
        return true;
    }

    // Consumer: poll until an element arrives or the timeout elapses
    template <class Rep, class Period>
    bool pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!try_pop(out)) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
        return true;
    }

    bool empty() const {
        return tail_->next.load(std::memory_order_acquire) == nullptr;
    }
    // Approximate while producers are active
    std::size_t size() const { return size_.load(std::memory_order_relaxed); }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;
    };

    std::atomic<Node*> head_; // producers write
    Node* tail_;              // consumer only
    std::atomic<std::size_t> size_{0};
};

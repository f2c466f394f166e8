#pragma once
#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

namespace classforge {

// Copy-on-write list. Writers publish a new immutable vector; readers take a
// snapshot that later writes never touch.
template <typename T>
class SnapshotRegistry {
public:
    using Item = std::shared_ptr<T>;
    using List = std::vector<Item>;
    using Snapshot = std::shared_ptr<const List>;

    SnapshotRegistry() : items_(std::make_shared<const List>()) {}

    void add(Item item){
        std::lock_guard<std::mutex> lk(mutex_);
        auto next = std::make_shared<List>(*items_);
        next->push_back(std::move(item));
        items_ = std::move(next);
    }

    bool remove(const Item& item){
        std::lock_guard<std::mutex> lk(mutex_);
        auto next = std::make_shared<List>(*items_);
        auto it = std::find(next->begin(), next->end(), item);
        if(it == next->end()) return false;
        next->erase(it);
        items_ = std::move(next);
        return true;
    }

    void clear(){
        std::lock_guard<std::mutex> lk(mutex_);
        items_ = std::make_shared<const List>();
    }

    Snapshot snapshot() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return items_;
    }

    size_t size() const { return snapshot()->size(); }

private:
    mutable std::mutex mutex_;
    Snapshot items_;
};

} // namespace classforge

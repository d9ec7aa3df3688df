#include "EventType.hpp"
#include <stdexcept>

namespace evhistory {

const std::string& TypeHandle::name() const {
    static const std::string empty;
    return node_ ? node_->name : empty;
}

TypeHandle TypeHandle::parent() const {
    if (!node_ || !node_->parent) {
        return TypeHandle();
    }
    return TypeHandle(node_->parent);
}

std::size_t TypeHandle::depth() const {
    return node_ ? node_->depth : 0;
}

bool TypeHandle::isAssignableFrom(const TypeHandle& other) const {
    if (!node_ || !other.node_) return false;
    if (other.node_->depth < node_->depth) return false;

    const Node* current = other.node_.get();
    while (current->depth > node_->depth) {
        current = current->parent.get();
    }
    return current == node_.get();
}

std::vector<TypeHandle> TypeHandle::lineage() const {
    std::vector<TypeHandle> result;
    for (auto node = node_; node; node = node->parent) {
        result.push_back(TypeHandle(node));
    }
    return result;
}

TypeRegistry::TypeRegistry(const std::string& rootName) {
    if (rootName.empty()) {
        throw std::invalid_argument("root type name must not be empty");
    }
    auto node = std::make_shared<TypeHandle::Node>();
    node->name = rootName;
    root_ = TypeHandle(std::move(node));
    byName_.emplace(rootName, root_);
    ordered_.push_back(root_);
}

TypeHandle TypeRegistry::declare(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return declareLocked(name, root_);
}

TypeHandle TypeRegistry::declare(const std::string& name, const std::string& parentName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byName_.find(parentName);
    if (it == byName_.end()) {
        throw std::invalid_argument("unknown parent type '" + parentName + "' for '" + name + "'");
    }
    return declareLocked(name, it->second);
}

TypeHandle TypeRegistry::declare(const std::string& name, const TypeHandle& parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byName_.find(parent.name());
    if (!parent.valid() || it == byName_.end() || it->second != parent) {
        throw std::invalid_argument("parent of '" + name + "' is not declared in this registry");
    }
    return declareLocked(name, parent);
}

TypeHandle TypeRegistry::declareLocked(const std::string& name, const TypeHandle& parent) {
    if (name.empty()) {
        throw std::invalid_argument("type name must not be empty");
    }

    auto existing = byName_.find(name);
    if (existing != byName_.end()) {
        if (existing->second.parent() != parent) {
            throw std::invalid_argument("type '" + name + "' already declared under '" +
                                        existing->second.parent().name() + "'");
        }
        return existing->second;
    }

    auto node = std::make_shared<TypeHandle::Node>();
    node->name = name;
    node->parent = parent.node_;
    node->depth = parent.depth() + 1;

    TypeHandle handle(std::move(node));
    byName_.emplace(name, handle);
    ordered_.push_back(handle);
    return handle;
}

std::optional<TypeHandle> TypeRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byName_.find(name);
    if (it == byName_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TypeHandle TypeRegistry::resolve(const std::string& name) const {
    auto handle = find(name);
    if (!handle) {
        throw std::out_of_range("unknown event type '" + name + "'");
    }
    return *handle;
}

TypeFilterSet TypeRegistry::resolveAll(const std::vector<std::string>& names) const {
    TypeFilterSet result;
    for (const auto& name : names) {
        result.insert(resolve(name));
    }
    return result;
}

std::vector<TypeHandle> TypeRegistry::types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_;
}

std::size_t TypeRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_.size();
}

} // namespace evhistory

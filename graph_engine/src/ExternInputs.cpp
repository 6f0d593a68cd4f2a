#include "ExternInputs.hpp"

#include <iostream>
#include <iterator>

ExternInputHandle ExternInputs::define(const std::string& name, ValueKind kind) {
    auto it = mByName.find(name);
    if (it != mByName.end()) {
        Queue& q = mQueues[it->second];
        if (q.kind != kind) {
            std::cerr << "[ExternInputs] WARNING: '" << name << "' redefined as "
                      << valueKindName(kind) << " (was " << valueKindName(q.kind)
                      << "), keeping original kind." << std::endl;
        }
        return ExternInputHandle{it->second};
    }

    Queue q;
    q.name = name;
    q.kind = kind;
    mQueues.push_back(std::move(q));
    mByName[name] = mQueues.size() - 1;
    return ExternInputHandle{mQueues.size() - 1};
}

std::optional<ExternInputHandle> ExternInputs::get(const std::string& name) const {
    auto it = mByName.find(name);
    if (it == mByName.end()) return std::nullopt;
    return ExternInputHandle{it->second};
}

const Value* ExternInputs::read(ExternInputHandle handle) const {
    if (!valid(handle)) return nullptr;
    const Queue& q = mQueues[handle.index];
    if (q.values.empty()) return nullptr;
    return &q.values.front();
}

bool ExternInputs::push(ExternInputHandle handle, Value value) {
    if (!valid(handle)) return false;
    mQueues[handle.index].values.push_back(std::move(value));
    return true;
}

bool ExternInputs::extend(ExternInputHandle handle, std::vector<Value> values) {
    if (!valid(handle)) return false;
    auto& q = mQueues[handle.index].values;
    q.insert(q.end(), std::make_move_iterator(values.begin()),
             std::make_move_iterator(values.end()));
    return true;
}

void ExternInputs::step() {
    for (Queue& q : mQueues) {
        if (!q.values.empty()) q.values.pop_front();
    }
}

std::optional<ValueKind> ExternInputs::kind(ExternInputHandle handle) const {
    if (!valid(handle)) return std::nullopt;
    return mQueues[handle.index].kind;
}

size_t ExternInputs::queueLength(ExternInputHandle handle) const {
    return valid(handle) ? mQueues[handle.index].values.size() : 0;
}

std::vector<std::string> ExternInputs::names() const {
    std::vector<std::string> out;
    out.reserve(mQueues.size());
    for (const Queue& q : mQueues) out.push_back(q.name);
    return out;
}

ExternInputs ExternInputs::definitionsOnly() const {
    ExternInputs copy;
    for (const Queue& q : mQueues) copy.define(q.name, q.kind);
    return copy;
}

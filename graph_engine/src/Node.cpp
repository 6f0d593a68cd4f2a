#include "Node.hpp"

Input::Input(std::string name, ValueKind kind)
    : name(std::move(name)), kind(kind) {}

Input Input::stateful(std::string name, std::shared_ptr<InputDefault> defaultValue) {
    Input in;
    in.name = std::move(name);
    in.kind = defaultValue ? defaultValue->valueKind() : ValueKind::Float;
    in.defaultValue = std::move(defaultValue);
    return in;
}

float Node::readFloat() const {
    std::vector<Value> out(outputs().size());
    if (out.empty()) return 0.0f;
    read(out);
    return out[0].asFloat().value_or(0.0f);
}

#include "Value.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

const char* valueKindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::None:         return "None";
        case ValueKind::Disconnected: return "Disconnected";
        case ValueKind::Midi:         return "Midi";
        case ValueKind::Float:        return "Float";
        case ValueKind::FloatArray:   return "FloatArray";
        case ValueKind::Beat:         return "Beat";
    }
    return "Unknown";
}

std::optional<ValueKind> parseValueKind(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "float")                          return ValueKind::Float;
    if (s == "midi")                           return ValueKind::Midi;
    if (s == "beat")                           return ValueKind::Beat;
    if (s == "floatarray" || s == "float_array") return ValueKind::FloatArray;
    if (s == "none")                           return ValueKind::None;
    if (s == "disconnected")                   return ValueKind::Disconnected;
    return std::nullopt;
}

std::optional<float> Value::asFloat() const {
    if (const float* f = std::get_if<float>(&mStorage)) return *f;
    return std::nullopt;
}

std::optional<std::vector<float>> Value::asFloatArray() const {
    if (const float* f = std::get_if<float>(&mStorage)) return std::vector<float>{*f};
    if (const auto* v = std::get_if<std::vector<float>>(&mStorage)) return *v;
    return std::nullopt;
}

std::optional<Value::BeatDuration> Value::asBeat() const {
    if (const Beat* b = std::get_if<Beat>(&mStorage)) return b->period;
    return std::nullopt;
}

std::string Value::describe() const {
    std::ostringstream out;
    switch (kind()) {
        case ValueKind::None:
            out << "None";
            break;
        case ValueKind::Disconnected:
            out << "Disconnected";
            break;
        case ValueKind::Float:
            out << "Float(" << std::get<float>(mStorage) << ")";
            break;
        case ValueKind::FloatArray:
            out << "FloatArray[" << std::get<std::vector<float>>(mStorage).size() << "]";
            break;
        case ValueKind::Midi: {
            const Midi& m = std::get<Midi>(mStorage);
            out << "Midi(ch=" << static_cast<int>(m.channel)
                << " type=" << static_cast<int>(m.message.type)
                << " key=" << static_cast<int>(m.message.key)
                << " value=" << static_cast<int>(m.message.value) << ")";
            break;
        }
        case ValueKind::Beat:
            out << "Beat(" << std::get<Beat>(mStorage).period.count() << "ns)";
            break;
    }
    return out.str();
}

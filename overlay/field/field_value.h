#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Widget catalogue of the reactive layer. Values are stable (shared with JS).
enum class FieldKind : std::uint8_t {
    Unknown = 0,
    Button = 1,
    InputText = 2,
    Select = 3,
    ColorPicker = 4,
    MultiSelect = 5,
    SelectButton = 6,
    Slider = 7,
    Textarea = 8,
    ToggleSwitch = 9,
    Chart = 10,
    Image = 11,
    ImageCompare = 12,
    Galleria = 13,
    FileUpload = 14,
    TreeSelect = 15,
};

using TextList = std::vector<std::string>;

// Alternative order is part of the protocol: index() is the value tag.
using FieldValue = std::variant<std::monostate, bool, double, std::string, TextList>;

enum class FieldValueTag : std::uint8_t {
    Empty = 0,
    Boolean = 1,
    Number = 2,
    Text = 3,
    TextList = 4,
};

using FieldOptions = std::map<std::string, FieldValue>;

inline FieldValueTag valueTag(const FieldValue& value) {
    return static_cast<FieldValueTag>(value.index());
}

inline bool isEmptyValue(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

// Case-insensitive; accepts catalogue names and the scene engine's legacy widget names.
FieldKind parseFieldKind(std::string_view typeTag);
const char* fieldKindName(FieldKind kind);

// Empty values are accepted by every kind.
bool isValueCompatible(FieldKind kind, const FieldValue& value);

// Kinds whose content is a preview (charts, images) rather than an input.
bool isPreviewKind(FieldKind kind);

// FNV-1a over tag + payload; used for dirty fingerprints.
std::uint64_t hashFieldValue(std::uint64_t h, const FieldValue& value);

bool optionFlag(const FieldOptions& options, const std::string& key);

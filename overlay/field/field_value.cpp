#include "overlay/field/field_value.h"
#include "overlay/core/digest.h"

#include <cctype>

using overlay::hashU32;
using overlay::hashF64;
using overlay::hashString;

namespace {
    struct KindAlias {
        const char* name;
        FieldKind kind;
    };

    constexpr KindAlias kKindAliases[] = {
        {"button", FieldKind::Button},
        {"inputtext", FieldKind::InputText},
        {"text", FieldKind::InputText},
        {"string", FieldKind::InputText},
        {"select", FieldKind::Select},
        {"combo", FieldKind::Select},
        {"colorpicker", FieldKind::ColorPicker},
        {"color", FieldKind::ColorPicker},
        {"multiselect", FieldKind::MultiSelect},
        {"selectbutton", FieldKind::SelectButton},
        {"slider", FieldKind::Slider},
        {"number", FieldKind::Slider},
        {"float", FieldKind::Slider},
        {"int", FieldKind::Slider},
        {"textarea", FieldKind::Textarea},
        {"customtext", FieldKind::Textarea},
        {"multiline", FieldKind::Textarea},
        {"toggleswitch", FieldKind::ToggleSwitch},
        {"toggle", FieldKind::ToggleSwitch},
        {"boolean", FieldKind::ToggleSwitch},
        {"chart", FieldKind::Chart},
        {"image", FieldKind::Image},
        {"imagecompare", FieldKind::ImageCompare},
        {"galleria", FieldKind::Galleria},
        {"gallery", FieldKind::Galleria},
        {"fileupload", FieldKind::FileUpload},
        {"upload", FieldKind::FileUpload},
        {"treeselect", FieldKind::TreeSelect},
    };

    bool equalsIgnoreCase(std::string_view a, const char* b) {
        std::size_t i = 0;
        for (; i < a.size(); ++i) {
            if (b[i] == '\0') return false;
            const unsigned char ca = static_cast<unsigned char>(a[i]);
            if (std::tolower(ca) != static_cast<unsigned char>(b[i])) return false;
        }
        return b[i] == '\0';
    }
}

FieldKind parseFieldKind(std::string_view typeTag) {
    for (const KindAlias& alias : kKindAliases) {
        if (equalsIgnoreCase(typeTag, alias.name)) return alias.kind;
    }
    return FieldKind::Unknown;
}

const char* fieldKindName(FieldKind kind) {
    switch (kind) {
        case FieldKind::Button: return "button";
        case FieldKind::InputText: return "inputtext";
        case FieldKind::Select: return "select";
        case FieldKind::ColorPicker: return "colorpicker";
        case FieldKind::MultiSelect: return "multiselect";
        case FieldKind::SelectButton: return "selectbutton";
        case FieldKind::Slider: return "slider";
        case FieldKind::Textarea: return "textarea";
        case FieldKind::ToggleSwitch: return "toggleswitch";
        case FieldKind::Chart: return "chart";
        case FieldKind::Image: return "image";
        case FieldKind::ImageCompare: return "imagecompare";
        case FieldKind::Galleria: return "galleria";
        case FieldKind::FileUpload: return "fileupload";
        case FieldKind::TreeSelect: return "treeselect";
        case FieldKind::Unknown: break;
    }
    return "unknown";
}

bool isValueCompatible(FieldKind kind, const FieldValue& value) {
    const FieldValueTag tag = valueTag(value);
    if (tag == FieldValueTag::Empty) return true;

    switch (kind) {
        case FieldKind::Button:
        case FieldKind::ToggleSwitch:
            return tag == FieldValueTag::Boolean;
        case FieldKind::InputText:
        case FieldKind::Textarea:
        case FieldKind::ColorPicker:
        case FieldKind::FileUpload:
        case FieldKind::Image:
            return tag == FieldValueTag::Text;
        case FieldKind::Select:
        case FieldKind::SelectButton:
        case FieldKind::TreeSelect:
            return tag == FieldValueTag::Text || tag == FieldValueTag::Number;
        case FieldKind::MultiSelect:
        case FieldKind::Galleria:
        case FieldKind::ImageCompare:
            return tag == FieldValueTag::TextList;
        case FieldKind::Slider:
            return tag == FieldValueTag::Number;
        case FieldKind::Chart:
            return tag == FieldValueTag::Text || tag == FieldValueTag::TextList;
        case FieldKind::Unknown:
            break;
    }
    return false;
}

bool isPreviewKind(FieldKind kind) {
    switch (kind) {
        case FieldKind::Chart:
        case FieldKind::Image:
        case FieldKind::ImageCompare:
        case FieldKind::Galleria:
            return true;
        default:
            return false;
    }
}

std::uint64_t hashFieldValue(std::uint64_t h, const FieldValue& value) {
    h = hashU32(h, static_cast<std::uint32_t>(value.index()));
    switch (valueTag(value)) {
        case FieldValueTag::Empty:
            break;
        case FieldValueTag::Boolean:
            h = hashU32(h, std::get<bool>(value) ? 1u : 0u);
            break;
        case FieldValueTag::Number:
            h = hashF64(h, std::get<double>(value));
            break;
        case FieldValueTag::Text:
            h = hashString(h, std::get<std::string>(value));
            break;
        case FieldValueTag::TextList: {
            const TextList& list = std::get<TextList>(value);
            h = hashU32(h, static_cast<std::uint32_t>(list.size()));
            for (const std::string& item : list) {
                h = hashString(h, item);
            }
            break;
        }
    }
    return h;
}

bool optionFlag(const FieldOptions& options, const std::string& key) {
    const auto it = options.find(key);
    if (it == options.end()) return false;
    const bool* flag = std::get_if<bool>(&it->second);
    return flag != nullptr && *flag;
}

#include "overlay/field/widget_props.h"

#include <initializer_list>

namespace {
    // Excluded for every widget kind.
    constexpr std::string_view kCommonExcluded[] = {
        "style", "class", "dt", "pt", "ptOptions", "unstyled",
    };

    bool inList(std::string_view key, std::initializer_list<std::string_view> list) {
        for (const std::string_view item : list) {
            if (item == key) return true;
        }
        return false;
    }

    bool isKindExcluded(FieldKind kind, std::string_view key) {
        switch (kind) {
            case FieldKind::Button:
                return inList(key, {"iconClass", "badgeClass"});
            case FieldKind::Select:
                return inList(key, {"inputClass", "inputStyle", "panelClass", "panelStyle",
                                    "overlayClass", "labelStyle"});
            case FieldKind::ColorPicker:
                return inList(key, {"panelClass", "overlayClass"});
            case FieldKind::MultiSelect:
                return inList(key, {"overlayClass", "overlayStyle", "panelClass", "panelStyle"});
            case FieldKind::ToggleSwitch:
                return inList(key, {"inputClass", "inputStyle"});
            case FieldKind::Image:
                return inList(key, {"imageClass", "imageStyle"});
            case FieldKind::Galleria:
                return inList(key, {"thumbnailsPosition", "verticalThumbnailViewPortHeight",
                                    "indicatorsPosition", "maskClass", "containerStyle",
                                    "containerClass", "galleriaClass"});
            case FieldKind::TreeSelect:
                return inList(key, {"inputClass", "inputStyle", "panelClass"});
            default:
                return false;
        }
    }
}

bool isOptionAllowed(FieldKind kind, std::string_view key) {
    for (const std::string_view excluded : kCommonExcluded) {
        if (excluded == key) return false;
    }
    return !isKindExcluded(kind, key);
}

FieldOptions sanitizeOptions(FieldKind kind, const FieldOptions& options) {
    FieldOptions out;
    for (const auto& kv : options) {
        if (isOptionAllowed(kind, kv.first)) {
            out.emplace_hint(out.end(), kv.first, kv.second);
        }
    }
    return out;
}

// UI -> authority edit entry points of OverlayEngine.

#include "overlay/overlay_engine.h"
#include "overlay/internal/overlay_state.h"

FieldChangeHandler OverlayEngine::fieldChangeHandler(NodeId id, std::size_t fieldIndex) const {
    return state().sync_.handlerFor(id, fieldIndex);
}

SyncResult OverlayEngine::applyFieldEdit(NodeId id, std::size_t fieldIndex, const FieldValue& value) {
    const SyncResult result = state().sync_.onFieldChange(id, fieldIndex, value);
    switch (result) {
        case SyncResult::Ok:
            break;
        case SyncResult::NodeMissing:
            setError(OverlayError::UnknownNode);
            break;
        case SyncResult::FieldMissing:
            setError(OverlayError::UnknownField);
            break;
        case SyncResult::TypeMismatch:
            setError(OverlayError::TypeMismatch);
            break;
        case SyncResult::CallbackFailed:
            setError(OverlayError::CallbackFailed);
            break;
    }
    return result;
}

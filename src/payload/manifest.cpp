#include "payload/manifest.hpp"

namespace ue {

const char* OperationTypeName(OperationType type) {
    switch (type) {
        case OperationType::kReplace:      return "REPLACE";
        case OperationType::kReplaceBz:    return "REPLACE_BZ";
        case OperationType::kMove:         return "MOVE";
        case OperationType::kBsdiff:       return "BSDIFF";
        case OperationType::kSourceCopy:   return "SOURCE_COPY";
        case OperationType::kSourceBsdiff: return "SOURCE_BSDIFF";
        case OperationType::kZero:         return "ZERO";
        case OperationType::kDiscard:      return "DISCARD";
        case OperationType::kReplaceXz:    return "REPLACE_XZ";
    }
    return "UNKNOWN";
}

const std::vector<OperationType>& AllOperationTypes() {
    static const std::vector<OperationType> kAll = {
        OperationType::kReplace,    OperationType::kReplaceBz,    OperationType::kMove,
        OperationType::kBsdiff,     OperationType::kSourceCopy,   OperationType::kSourceBsdiff,
        OperationType::kZero,       OperationType::kDiscard,      OperationType::kReplaceXz,
    };
    return kAll;
}

std::optional<OperationType> OperationTypeFromName(std::string_view name) {
    for (OperationType t : AllOperationTypes()) {
        if (name == OperationTypeName(t)) return t;
    }
    return std::nullopt;
}

bool CarriesData(OperationType type) {
    switch (type) {
        case OperationType::kReplace:
        case OperationType::kReplaceBz:
        case OperationType::kReplaceXz:
        case OperationType::kBsdiff:
        case OperationType::kSourceBsdiff:
            return true;
        case OperationType::kMove:
        case OperationType::kSourceCopy:
        case OperationType::kZero:
        case OperationType::kDiscard:
            return false;
    }
    return false;
}

bool ReadsSourceSlot(OperationType type) {
    return type == OperationType::kSourceCopy || type == OperationType::kSourceBsdiff;
}

} // namespace ue

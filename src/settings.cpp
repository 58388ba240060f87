#include "pageflow/settings.h"
#include "pageflow/errors.h"

namespace pageflow {

int chunkSizeForDensity(Density density) {
    switch (density) {
        case Density::Less:   return 300;
        case Density::Medium: return 500;
        case Density::More:   return 800;
    }
    return 500;
}

const char* densityName(Density density) {
    switch (density) {
        case Density::Less:   return "less";
        case Density::Medium: return "medium";
        case Density::More:   return "more";
    }
    return "medium";
}

Density parseDensity(const std::string& key) {
    if (key == "less") return Density::Less;
    if (key == "medium") return Density::Medium;
    if (key == "more") return Density::More;
    throw PageflowError(ErrorCode::InvalidDensity, "unknown density '" + key + "'");
}

} // namespace pageflow

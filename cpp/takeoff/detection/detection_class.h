#ifndef TAKEOFF_DETECTION_DETECTION_CLASS_H
#define TAKEOFF_DETECTION_DETECTION_CLASS_H

#include <cstdint>
#include <string_view>

namespace takeoff {

enum class DetectionClass : std::uint8_t {
    Unclassified = 0,
    // facade
    Siding,
    Building,
    // openings
    Window,
    Door,
    Garage,
    // area
    Roof,
    Gable,
    Soffit,
    // linear
    Trim,
    Fascia,
    Gutter,
    Eave,
    Rake,
    Ridge,
    Valley,
    BellyBand,
    CornerInside,
    CornerOutside,
    // count
    Vent,
    Flashing,
    Downspout,
    Outlet,
    HoseBib,
    LightFixture,
    Corbel,
    GableVent,
    Shutter,
    Post,
    Column,
    Bracket,
};

constexpr std::uint8_t kDetectionClassCount = static_cast<std::uint8_t>(DetectionClass::Bracket) + 1;

enum class MeasurementKind : std::uint8_t {
    Area = 0,
    Linear = 1,
    Count = 2,
};

// Which derivation rule set a class is measured with.
enum class ClassGroup : std::uint8_t {
    Facade,
    Opening,
    Gable,
    Soffit,
    Roof,
    Corner,
    Linear,
    Count,
    Other,
};

struct ClassPolicy {
    DetectionClass cls;
    const char* key;
    const char* label;
    MeasurementKind kind;
    ClassGroup group;
};

const ClassPolicy& classPolicy(DetectionClass cls) noexcept;

inline const char* classKey(DetectionClass cls) noexcept { return classPolicy(cls).key; }
inline const char* classLabel(DetectionClass cls) noexcept { return classPolicy(cls).label; }
inline MeasurementKind measurementKind(DetectionClass cls) noexcept { return classPolicy(cls).kind; }
inline ClassGroup classGroup(DetectionClass cls) noexcept { return classPolicy(cls).group; }

inline bool isFacadeClass(DetectionClass cls) noexcept { return classGroup(cls) == ClassGroup::Facade; }
inline bool isOpeningClass(DetectionClass cls) noexcept { return classGroup(cls) == ClassGroup::Opening; }

// Exact canonical key ("belly_band", "" for unclassified). Returns false for unknown keys.
bool parseClassKey(std::string_view key, DetectionClass& out) noexcept;

// Case-insensitive match on canonical keys and known aliases ("Garage Door", "inside corner", "gutters").
// Unknown names map to Unclassified.
DetectionClass normalizeClass(std::string_view raw);

} // namespace takeoff

#endif // TAKEOFF_DETECTION_DETECTION_CLASS_H

#include "takeoff/detection/detection_class.h"
#include "takeoff/core/string_utils.h"
#include <string>

namespace takeoff {

namespace {

constexpr ClassPolicy kPolicies[kDetectionClassCount] = {
    {DetectionClass::Unclassified, "", "Unclassified", MeasurementKind::Area, ClassGroup::Other},
    {DetectionClass::Siding, "siding", "Siding", MeasurementKind::Area, ClassGroup::Facade},
    {DetectionClass::Building, "building", "Building", MeasurementKind::Area, ClassGroup::Facade},
    {DetectionClass::Window, "window", "Window", MeasurementKind::Area, ClassGroup::Opening},
    {DetectionClass::Door, "door", "Door", MeasurementKind::Area, ClassGroup::Opening},
    {DetectionClass::Garage, "garage", "Garage", MeasurementKind::Area, ClassGroup::Opening},
    {DetectionClass::Roof, "roof", "Roof", MeasurementKind::Area, ClassGroup::Roof},
    {DetectionClass::Gable, "gable", "Gable", MeasurementKind::Area, ClassGroup::Gable},
    {DetectionClass::Soffit, "soffit", "Soffit", MeasurementKind::Area, ClassGroup::Soffit},
    {DetectionClass::Trim, "trim", "Trim", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::Fascia, "fascia", "Fascia", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::Gutter, "gutter", "Gutter", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::Eave, "eave", "Eave", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::Rake, "rake", "Rake", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::Ridge, "ridge", "Ridge", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::Valley, "valley", "Valley", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::BellyBand, "belly_band", "Belly Band", MeasurementKind::Linear, ClassGroup::Linear},
    {DetectionClass::CornerInside, "corner_inside", "Corner Inside", MeasurementKind::Linear, ClassGroup::Corner},
    {DetectionClass::CornerOutside, "corner_outside", "Corner Outside", MeasurementKind::Linear, ClassGroup::Corner},
    {DetectionClass::Vent, "vent", "Vent", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Flashing, "flashing", "Flashing", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Downspout, "downspout", "Downspout", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Outlet, "outlet", "Outlet", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::HoseBib, "hose_bib", "Hose Bib", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::LightFixture, "light_fixture", "Light Fixture", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Corbel, "corbel", "Corbel", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::GableVent, "gable_vent", "Gable Vent", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Shutter, "shutter", "Shutter", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Post, "post", "Post", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Column, "column", "Column", MeasurementKind::Count, ClassGroup::Count},
    {DetectionClass::Bracket, "bracket", "Bracket", MeasurementKind::Count, ClassGroup::Count},
};

struct ClassAlias {
    const char* name;
    DetectionClass cls;
};

// Spaces and underscores are folded before lookup, so "gable end" also covers "gable_end".
constexpr ClassAlias kAliases[] = {
    {"exterior wall", DetectionClass::Siding},
    {"wall", DetectionClass::Siding},
    {"facade", DetectionClass::Siding},
    {"cladding", DetectionClass::Siding},
    {"gable end", DetectionClass::Gable},
    {"gable wall", DetectionClass::Gable},
    {"windows", DetectionClass::Window},
    {"doors", DetectionClass::Door},
    {"entry door", DetectionClass::Door},
    {"garage door", DetectionClass::Garage},
    {"roofing", DetectionClass::Roof},
    {"roof area", DetectionClass::Roof},
    {"window trim", DetectionClass::Trim},
    {"door trim", DetectionClass::Trim},
    {"fascia board", DetectionClass::Fascia},
    {"gutters", DetectionClass::Gutter},
    {"rain gutter", DetectionClass::Gutter},
    {"eaves", DetectionClass::Eave},
    {"roof eave", DetectionClass::Eave},
    {"rakes", DetectionClass::Rake},
    {"gable rake", DetectionClass::Rake},
    {"roof rake", DetectionClass::Rake},
    {"ridges", DetectionClass::Ridge},
    {"roof ridge", DetectionClass::Ridge},
    {"soffits", DetectionClass::Soffit},
    {"eave soffit", DetectionClass::Soffit},
    {"valleys", DetectionClass::Valley},
    {"roof valley", DetectionClass::Valley},
    {"vents", DetectionClass::Vent},
    {"roof vent", DetectionClass::Vent},
    {"flashings", DetectionClass::Flashing},
    {"step flashing", DetectionClass::Flashing},
    {"downspouts", DetectionClass::Downspout},
    {"down spout", DetectionClass::Downspout},
    {"outlets", DetectionClass::Outlet},
    {"electrical outlet", DetectionClass::Outlet},
    {"hose bib", DetectionClass::HoseBib},
    {"hosebib", DetectionClass::HoseBib},
    {"hose bibb", DetectionClass::HoseBib},
    {"spigot", DetectionClass::HoseBib},
    {"light fixture", DetectionClass::LightFixture},
    {"light", DetectionClass::LightFixture},
    {"exterior light", DetectionClass::LightFixture},
    {"corbels", DetectionClass::Corbel},
    {"gable vent", DetectionClass::GableVent},
    {"gable vents", DetectionClass::GableVent},
    {"belly band", DetectionClass::BellyBand},
    {"bellyband", DetectionClass::BellyBand},
    {"band board", DetectionClass::BellyBand},
    {"corner inside", DetectionClass::CornerInside},
    {"inside corner", DetectionClass::CornerInside},
    {"interior corner", DetectionClass::CornerInside},
    {"corner outside", DetectionClass::CornerOutside},
    {"outside corner", DetectionClass::CornerOutside},
    {"exterior corner", DetectionClass::CornerOutside},
    {"shutters", DetectionClass::Shutter},
    {"window shutter", DetectionClass::Shutter},
    {"posts", DetectionClass::Post},
    {"porch post", DetectionClass::Post},
    {"columns", DetectionClass::Column},
    {"porch column", DetectionClass::Column},
    {"brackets", DetectionClass::Bracket},
    {"decorative bracket", DetectionClass::Bracket},
};

static std::string foldSeparators(std::string s) {
    for (auto& c : s) {
        if (c == '_' || c == '-') c = ' ';
    }
    return s;
}

} // namespace

const ClassPolicy& classPolicy(DetectionClass cls) noexcept {
    const auto index = static_cast<std::uint8_t>(cls);
    if (index >= kDetectionClassCount) return kPolicies[0];
    return kPolicies[index];
}

bool parseClassKey(std::string_view key, DetectionClass& out) noexcept {
    for (const auto& policy : kPolicies) {
        if (key == policy.key) {
            out = policy.cls;
            return true;
        }
    }
    return false;
}

DetectionClass normalizeClass(std::string_view raw) {
    const std::string lowered = toLowerTrimmed(raw);
    if (lowered.empty()) return DetectionClass::Unclassified;

    DetectionClass exact = DetectionClass::Unclassified;
    if (parseClassKey(lowered, exact)) return exact;
    if (lowered == "exterior_wall") return DetectionClass::Siding;

    const std::string folded = foldSeparators(lowered);
    for (const auto& alias : kAliases) {
        if (folded == alias.name) return alias.cls;
    }
    for (const auto& policy : kPolicies) {
        if (policy.key[0] != '\0' && folded == foldSeparators(policy.key)) return policy.cls;
    }
    return DetectionClass::Unclassified;
}

} // namespace takeoff

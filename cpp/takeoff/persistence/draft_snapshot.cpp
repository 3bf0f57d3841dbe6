#include "takeoff/persistence/draft_snapshot.h"
#include "takeoff/core/util.h"
#include "takeoff/persistence/draft_internal.h"
#include <unordered_map>
#include <utility>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};

// Bounds-checked little-endian cursor over one section payload.
class SectionReader {
public:
    explicit SectionReader(const SectionView& view) : data_(view.data), size_(view.size) {}

    bool u8(std::uint8_t& v) {
        if (!takeoff::draft::detail::requireBytes(offset_, 1, size_)) return false;
        v = takeoff::readU8(data_, offset_);
        offset_ += 1;
        return true;
    }
    bool u32(std::uint32_t& v) {
        if (!takeoff::draft::detail::requireBytes(offset_, 4, size_)) return false;
        v = takeoff::readU32(data_, offset_);
        offset_ += 4;
        return true;
    }
    bool f64(double& v) {
        if (!takeoff::draft::detail::requireBytes(offset_, 8, size_)) return false;
        v = takeoff::readF64(data_, offset_);
        offset_ += 8;
        return true;
    }
    bool str(std::string& v) {
        std::uint32_t len = 0;
        if (!u32(len)) return false;
        if (!takeoff::draft::detail::requireBytes(offset_, len, size_)) return false;
        v.assign(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return true;
    }
    bool points(std::vector<takeoff::Point2>& out) {
        std::uint32_t count = 0;
        if (!u32(count)) return false;
        std::size_t bytes = 0;
        if (!takeoff::draft::detail::tryMul(count, 16, bytes)) return false;
        if (!takeoff::draft::detail::requireBytes(offset_, bytes, size_)) return false;
        out.clear();
        out.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            takeoff::Point2 p{};
            p.x = takeoff::readF64(data_, offset_);
            p.y = takeoff::readF64(data_, offset_ + 8);
            offset_ += 16;
            out.push_back(p);
        }
        return true;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
};
} // namespace

namespace takeoff {
using namespace draft::detail;

namespace {

EngineError readGeometry(SectionReader& r, std::uint8_t kindByte, const BoundingBox& bounds, DetectionGeometry& out) {
    std::uint32_t ringCount = 0;
    if (!r.u32(ringCount)) return EngineError::BufferTruncated;
    std::vector<std::vector<Point2>> rings;
    for (std::uint32_t i = 0; i < ringCount; ++i) {
        std::vector<Point2> ring;
        if (!r.points(ring)) return EngineError::BufferTruncated;
        rings.push_back(std::move(ring));
    }

    bool ok = false;
    switch (static_cast<GeometryKind>(kindByte)) {
        case GeometryKind::BoundingBoxOnly:
            ok = DetectionGeometry::fromBoundingBox(bounds, out);
            break;
        case GeometryKind::Polygon:
            ok = rings.size() == 1 && DetectionGeometry::fromPolygon(rings[0], out);
            break;
        case GeometryKind::PolygonWithHoles:
            if (rings.size() >= 2) {
                std::vector<Ring> holes(rings.begin() + 1, rings.end());
                ok = DetectionGeometry::fromPolygonWithHoles(rings[0], std::move(holes), out);
            }
            break;
        case GeometryKind::Polyline:
            ok = rings.size() == 1 && DetectionGeometry::fromPolyline(rings[0], out);
            break;
        case GeometryKind::Point:
            ok = rings.size() == 1 && rings[0].size() == 1 && DetectionGeometry::fromPoint(rings[0][0], out);
            break;
        default:
            return EngineError::InvalidPayloadSize;
    }
    return ok ? EngineError::Ok : EngineError::InvalidGeometry;
}

EngineError readDetection(SectionReader& r, Detection& det) {
    if (!r.str(det.id) || !r.str(det.pageId) || !r.str(det.jobId)) return EngineError::BufferTruncated;
    if (!r.u32(det.detectionIndex)) return EngineError::BufferTruncated;

    std::uint8_t cls = 0;
    std::uint8_t markup = 0;
    std::uint8_t status = 0;
    std::uint8_t kind = 0;
    if (!r.u8(cls) || !r.u8(markup) || !r.u8(status) || !r.u8(kind)) return EngineError::BufferTruncated;
    if (cls >= kDetectionClassCount) return EngineError::InvalidPayloadSize;
    if (markup > static_cast<std::uint8_t>(MarkupType::Point)) return EngineError::InvalidPayloadSize;
    if (status > static_cast<std::uint8_t>(DetectionStatus::Deleted)) return EngineError::InvalidPayloadSize;
    det.detectionClass = static_cast<DetectionClass>(cls);
    det.markupType = static_cast<MarkupType>(markup);
    det.status = static_cast<DetectionStatus>(status);

    if (!r.f64(det.confidence) || !r.f64(det.createdAtMs) || !r.f64(det.editedAtMs)) return EngineError::BufferTruncated;

    BoundingBox bounds{};
    if (!r.f64(bounds.centerX) || !r.f64(bounds.centerY) || !r.f64(bounds.width) || !r.f64(bounds.height)) {
        return EngineError::BufferTruncated;
    }
    const EngineError geomErr = readGeometry(r, kind, bounds, det.geometry);
    if (geomErr != EngineError::Ok) return geomErr;

    std::uint8_t flags = 0;
    if (!r.u8(flags)) return EngineError::BufferTruncated;
    if (!r.f64(det.measurements.areaSf) || !r.f64(det.measurements.perimeterLf)
        || !r.f64(det.measurements.realWidthFt) || !r.f64(det.measurements.realHeightFt)) {
        return EngineError::BufferTruncated;
    }
    det.measurements.measured = (flags & kMeasured) != 0;

    if (flags & kHasOriginalBounds) {
        BoundingBox original{};
        if (!r.f64(original.centerX) || !r.f64(original.centerY) || !r.f64(original.width) || !r.f64(original.height)) {
            return EngineError::BufferTruncated;
        }
        det.originalBounds = original;
    }
    if (flags & kHasMaterialCost) {
        double v = 0.0;
        if (!r.f64(v)) return EngineError::BufferTruncated;
        det.materialCostOverride = v;
    }
    if (flags & kHasLaborCost) {
        double v = 0.0;
        if (!r.f64(v)) return EngineError::BufferTruncated;
        det.laborCostOverride = v;
    }
    if (flags & kHasColorOverride) {
        std::uint32_t v = 0;
        if (!r.u32(v)) return EngineError::BufferTruncated;
        det.colorOverrideRGBA = v;
    }

    if (!r.str(det.materialId) || !r.str(det.notes) || !r.str(det.markerLabel) || !r.str(det.sourceDetectionId)) {
        return EngineError::BufferTruncated;
    }
    return EngineError::Ok;
}

} // namespace

EngineError parseDraft(const std::uint8_t* src, std::size_t byteCount, DraftData& out) {
    if (!src || byteCount < draftHeaderBytes) {
        return EngineError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != draftMagic) return EngineError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != draftVersion) return EngineError::UnsupportedVersion;
    out.version = version;

    const std::uint32_t sectionCount = readU32(src, 8);
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), draftSectionEntryBytes, tableBytes)) {
        return EngineError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(draftHeaderBytes, tableBytes, headerPlusTable)) {
        return EngineError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return EngineError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = draftHeaderBytes + i * draftSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return EngineError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return EngineError::InvalidPayloadSize;
        if (end > byteCount) return EngineError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        const std::uint32_t actualCrc = crc32(payload, size);
        if (actualCrc != expectedCrc) return EngineError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* meta = findSection(TAG_META);
    const SectionView* page = findSection(TAG_PAGE);
    const SectionView* dets = findSection(TAG_DETS);
    if (!meta || !page || !dets) {
        return EngineError::InvalidPayloadSize;
    }

    // META
    {
        SectionReader r(*meta);
        if (!r.str(out.jobId) || !r.f64(out.timestampMs) || !r.u32(out.nextLocalId)) {
            return EngineError::BufferTruncated;
        }
    }

    // PAGE
    {
        SectionReader r(*page);
        std::uint32_t count = 0;
        if (!r.u32(count)) return EngineError::BufferTruncated;
        out.pageScales.clear();
        for (std::uint32_t i = 0; i < count; ++i) {
            PageScaleRecord rec{};
            if (!r.str(rec.pageId) || !r.f64(rec.scaleRatio)) return EngineError::BufferTruncated;
            out.pageScales.push_back(std::move(rec));
        }
    }

    // DETS
    {
        SectionReader r(*dets);
        std::uint32_t count = 0;
        if (!r.u32(count)) return EngineError::BufferTruncated;
        out.detections.clear();
        for (std::uint32_t i = 0; i < count; ++i) {
            Detection det{};
            const EngineError err = readDetection(r, det);
            if (err != EngineError::Ok) return err;
            out.detections.push_back(std::move(det));
        }
    }

    return EngineError::Ok;
}

} // namespace takeoff

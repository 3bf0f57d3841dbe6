#include "takeoff/persistence/draft_snapshot.h"
#include "takeoff/core/util.h"
#include "takeoff/persistence/draft_internal.h"
#include <cstring>
#include <utility>

namespace takeoff {
using namespace draft::detail;

std::vector<std::uint8_t> buildDraftBytes(const DraftData& data) {
    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(3);

    auto appendU8 = [](std::vector<std::uint8_t>& out, std::uint8_t v) {
        out.push_back(v);
    };
    auto appendU32 = [](std::vector<std::uint8_t>& out, std::uint32_t v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeU32LE(out.data(), o, v);
    };
    auto appendF64 = [](std::vector<std::uint8_t>& out, double v) {
        const std::size_t o = out.size();
        out.resize(o + 8);
        writeF64LE(out.data(), o, v);
    };
    auto appendString = [&](std::vector<std::uint8_t>& out, const std::string& s) {
        appendU32(out, static_cast<std::uint32_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    };
    auto appendPoints = [&](std::vector<std::uint8_t>& out, const std::vector<Point2>& points) {
        appendU32(out, static_cast<std::uint32_t>(points.size()));
        for (const auto& p : points) {
            appendF64(out, p.x);
            appendF64(out, p.y);
        }
    };
    auto appendBox = [&](std::vector<std::uint8_t>& out, const BoundingBox& box) {
        appendF64(out, box.centerX);
        appendF64(out, box.centerY);
        appendF64(out, box.width);
        appendF64(out, box.height);
    };

    // META
    {
        SectionBytes sec{TAG_META, {}};
        appendString(sec.bytes, data.jobId);
        appendF64(sec.bytes, data.timestampMs);
        appendU32(sec.bytes, data.nextLocalId);
        sections.push_back(std::move(sec));
    }

    // PAGE
    {
        SectionBytes sec{TAG_PAGE, {}};
        appendU32(sec.bytes, static_cast<std::uint32_t>(data.pageScales.size()));
        for (const auto& rec : data.pageScales) {
            appendString(sec.bytes, rec.pageId);
            appendF64(sec.bytes, rec.scaleRatio);
        }
        sections.push_back(std::move(sec));
    }

    // DETS
    {
        SectionBytes sec{TAG_DETS, {}};
        auto& out = sec.bytes;
        appendU32(out, static_cast<std::uint32_t>(data.detections.size()));
        for (const auto& det : data.detections) {
            appendString(out, det.id);
            appendString(out, det.pageId);
            appendString(out, det.jobId);
            appendU32(out, det.detectionIndex);
            appendU8(out, static_cast<std::uint8_t>(det.detectionClass));
            appendU8(out, static_cast<std::uint8_t>(det.markupType));
            appendU8(out, static_cast<std::uint8_t>(det.status));
            appendU8(out, static_cast<std::uint8_t>(det.geometry.kind()));
            appendF64(out, det.confidence);
            appendF64(out, det.createdAtMs);
            appendF64(out, det.editedAtMs);

            appendBox(out, det.geometry.bounds());
            const std::size_t ringCount = det.geometry.ringCount();
            appendU32(out, static_cast<std::uint32_t>(ringCount));
            for (std::size_t i = 0; i < ringCount; ++i) {
                appendPoints(out, *det.geometry.ring(i));
            }

            std::uint8_t flags = 0;
            if (det.measurements.measured) flags |= kMeasured;
            if (det.originalBounds) flags |= kHasOriginalBounds;
            if (det.materialCostOverride) flags |= kHasMaterialCost;
            if (det.laborCostOverride) flags |= kHasLaborCost;
            if (det.colorOverrideRGBA) flags |= kHasColorOverride;
            appendU8(out, flags);
            appendF64(out, det.measurements.areaSf);
            appendF64(out, det.measurements.perimeterLf);
            appendF64(out, det.measurements.realWidthFt);
            appendF64(out, det.measurements.realHeightFt);
            if (det.originalBounds) appendBox(out, *det.originalBounds);
            if (det.materialCostOverride) appendF64(out, *det.materialCostOverride);
            if (det.laborCostOverride) appendF64(out, *det.laborCostOverride);
            if (det.colorOverrideRGBA) appendU32(out, *det.colorOverrideRGBA);

            appendString(out, det.materialId);
            appendString(out, det.notes);
            appendString(out, det.markerLabel);
            appendString(out, det.sourceDetectionId);
        }
        sections.push_back(std::move(sec));
    }

    const std::size_t headerBytes = draftHeaderBytes;
    const std::size_t tableBytes = sections.size() * draftSectionEntryBytes;
    std::size_t payloadBytes = 0;
    for (const auto& sec : sections) payloadBytes += sec.bytes.size();
    const std::size_t totalBytes = headerBytes + tableBytes + payloadBytes;

    std::vector<std::uint8_t> out;
    out.resize(totalBytes);

    writeU32LE(out.data(), 0, draftMagic);
    writeU32LE(out.data(), 4, draftVersion);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t tableOffset = headerBytes;
    std::size_t dataOffset = headerBytes + tableBytes;
    for (const auto& sec : sections) {
        writeU32LE(out.data(), tableOffset + 0, sec.tag);
        writeU32LE(out.data(), tableOffset + 4, static_cast<std::uint32_t>(dataOffset));
        writeU32LE(out.data(), tableOffset + 8, static_cast<std::uint32_t>(sec.bytes.size()));
        writeU32LE(out.data(), tableOffset + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (!sec.bytes.empty()) {
            std::memcpy(out.data() + dataOffset, sec.bytes.data(), sec.bytes.size());
        }
        tableOffset += draftSectionEntryBytes;
        dataOffset += sec.bytes.size();
    }

    return out;
}

} // namespace takeoff

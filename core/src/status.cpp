// lavamood - Status Telemetry
// Text readout and JSON frame encoding

#include <lavamood/status.h>
#include <cstdio>

namespace lavamood {

using json = nlohmann::json;

std::string formatStatus(const EngineStatus& s) {
    char buf[192];
    std::snprintf(buf, sizeof(buf),
                  "Smoothed VAD: V=%+.2f, A=%+.2f, D=%+.2f   Energy=%.3f   Blobs=%d   Turb=%.2f",
                  s.smoothed.valence, s.smoothed.arousal, s.smoothed.dominance,
                  s.energy, s.blobCount, s.turbulence);
    return buf;
}

static json vadToJson(const Vad& v) {
    return json::array({v.valence, v.arousal, v.dominance});
}

static json colorToJson(const Color& c) {
    return json::array({c.r, c.g, c.b});
}

json statusToJson(const EngineStatus& s) {
    return {
        {"frame", s.frame},
        {"time", s.time},
        {"target", vadToJson(s.target)},
        {"smoothed", vadToJson(s.smoothed)},
        {"energy", s.energy},
        {"blobCount", s.blobCount},
        {"turbulence", s.turbulence}
    };
}

json paramsToJson(const VisualParams& p) {
    return {
        {"hsvPrimary", json::array({p.hsvPrimary.x, p.hsvPrimary.y, p.hsvPrimary.z})},
        {"hsvSecondary", json::array({p.hsvSecondary.x, p.hsvSecondary.y, p.hsvSecondary.z})},
        {"rgbPrimary", colorToJson(p.rgbPrimary)},
        {"rgbSecondary", colorToJson(p.rgbSecondary)},
        {"blobCount", p.blobCount},
        {"blobSizeMean", p.blobSizeMean},
        {"surfaceTension", p.surfaceTension},
        {"viscosity", p.viscosity},
        {"buoyancy", p.buoyancy},
        {"turbulence", p.turbulence},
        {"threshold", p.threshold},
        {"gravityX", p.gravityX}
    };
}

json frameToJson(const EngineStatus& status, const VisualParams& params,
                 const std::vector<Blob>& blobs, bool includeBlobs) {
    json frame = statusToJson(status);
    frame["params"] = paramsToJson(params);

    if (includeBlobs) {
        json list = json::array();
        for (const auto& b : blobs) {
            list.push_back({
                {"x", b.position.x},
                {"y", b.position.y},
                {"r", b.radius},
                {"color", b.color.toHex()}
            });
        }
        frame["blobs"] = std::move(list);
    }
    return frame;
}

} // namespace lavamood
